#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sobotta {

using SessionAudio = std::shared_ptr<const std::vector<float>>;

// Preprocessed 16kHz mono audio waiting for transcription, keyed by session id
class SessionStore {
public:
    void insert(const std::string& session_id, std::vector<float> samples);

    // nullptr when absent. Repeated reads return the same samples.
    SessionAudio get(const std::string& session_id) const;

    bool remove(const std::string& session_id);
    bool contains(const std::string& session_id) const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, SessionAudio> sessions_;
};

// Random version 4 UUID string
std::string generate_session_id();

} // namespace sobotta
