#pragma once

#include <string>
#include <vector>

namespace sobotta {

// Read-only source of bias terms for transcription
class VocabularyStore {
public:
    virtual ~VocabularyStore() = default;
    virtual std::vector<std::string> list_terms() const = 0;
};

// One term per line; '#' comments and blank lines are skipped,
// duplicates keep their first position.
class FileVocabularyStore : public VocabularyStore {
public:
    explicit FileVocabularyStore(std::string path);

    std::vector<std::string> list_terms() const override;

    const std::string& path() const { return path_; }

    // Write a commented example file if none exists
    bool create_default_file() const;

private:
    std::string path_;
};

// Terms joined with ", ", cut on a word boundary to fit whisper's prompt budget
std::string build_prompt(const std::vector<std::string>& terms, int max_tokens = 200);

} // namespace sobotta
