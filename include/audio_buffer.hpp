#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace sobotta {

// Raw interleaved samples shared between the capture callback (single writer),
// the level meter and the session that finally takes them.
// Copies share the same storage; the rate/channel metadata is per copy.
class AudioBuffer {
public:
    AudioBuffer(int sample_rate = 0, int channels = 0);

    // Same storage, new metadata (used once the device reports its format)
    AudioBuffer with_format(int sample_rate, int channels) const;

    // Called from the device callback. Holds the lock only for the copy.
    void append(const float* data, size_t count);

    // Drop all accumulated samples
    void clear();

    // Swap out the full contents, leaving the buffer empty
    std::vector<float> take();

    // Copy of the most recent `count` samples (fewer if not yet available)
    std::vector<float> tail(size_t count) const;

    size_t size() const;

    int sample_rate() const { return sample_rate_; }
    int channels() const { return channels_; }

    bool shares_storage_with(const AudioBuffer& other) const {
        return storage_ == other.storage_;
    }

private:
    struct Storage {
        mutable std::mutex mutex;
        std::vector<float> samples;
    };

    std::shared_ptr<Storage> storage_;
    int sample_rate_;
    int channels_;
};

} // namespace sobotta
