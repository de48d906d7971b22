#include "audio_buffer.hpp"

#include <algorithm>

namespace sobotta {

AudioBuffer::AudioBuffer(int sample_rate, int channels)
    : storage_(std::make_shared<Storage>())
    , sample_rate_(sample_rate)
    , channels_(channels) {
}

AudioBuffer AudioBuffer::with_format(int sample_rate, int channels) const {
    AudioBuffer copy(*this);
    copy.sample_rate_ = sample_rate;
    copy.channels_ = channels;
    return copy;
}

void AudioBuffer::append(const float* data, size_t count) {
    if (!data || count == 0) return;

    std::lock_guard<std::mutex> lock(storage_->mutex);
    storage_->samples.insert(storage_->samples.end(), data, data + count);
}

void AudioBuffer::clear() {
    std::lock_guard<std::mutex> lock(storage_->mutex);
    storage_->samples.clear();
}

std::vector<float> AudioBuffer::take() {
    std::vector<float> out;
    std::lock_guard<std::mutex> lock(storage_->mutex);
    out.swap(storage_->samples);
    return out;
}

std::vector<float> AudioBuffer::tail(size_t count) const {
    std::lock_guard<std::mutex> lock(storage_->mutex);
    const auto& samples = storage_->samples;
    size_t n = std::min(count, samples.size());
    return std::vector<float>(samples.end() - static_cast<std::ptrdiff_t>(n), samples.end());
}

size_t AudioBuffer::size() const {
    std::lock_guard<std::mutex> lock(storage_->mutex);
    return storage_->samples.size();
}

} // namespace sobotta
