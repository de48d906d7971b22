#include "history.hpp"
#include "wav_io.hpp"

#include <utility>

namespace sobotta {

WavHistorySink::WavHistorySink(std::string audio_dir)
    : audio_dir_(std::move(audio_dir)) {
}

std::string WavHistorySink::path_for(const std::string& session_id) const {
    return audio_dir_ + "/" + session_id + ".wav";
}

Error WavHistorySink::save_audio_artifact(const std::string& session_id,
                                          const std::vector<float>& samples,
                                          int sample_rate) {
    return save_wav(path_for(session_id), samples, sample_rate);
}

} // namespace sobotta
