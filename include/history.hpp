#pragma once

#include "error.hpp"

#include <string>
#include <vector>

namespace sobotta {

// Receives the preprocessed audio of each finished recording for later playback
class AudioArtifactSink {
public:
    virtual ~AudioArtifactSink() = default;
    virtual Error save_audio_artifact(const std::string& session_id,
                                      const std::vector<float>& samples,
                                      int sample_rate) = 0;
};

// Writes <audio_dir>/<session_id>.wav
class WavHistorySink : public AudioArtifactSink {
public:
    explicit WavHistorySink(std::string audio_dir);

    Error save_audio_artifact(const std::string& session_id,
                              const std::vector<float>& samples,
                              int sample_rate) override;

    std::string path_for(const std::string& session_id) const;

private:
    std::string audio_dir_;
};

} // namespace sobotta
