#include "vocabulary.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace sobotta {

FileVocabularyStore::FileVocabularyStore(std::string path)
    : path_(std::move(path)) {
}

std::vector<std::string> FileVocabularyStore::list_terms() const {
    std::vector<std::string> terms;
    if (path_.empty()) return terms;

    std::ifstream file(path_);
    if (!file.is_open()) {
        // File doesn't exist - that's OK, user hasn't created one yet
        return terms;
    }

    std::unordered_set<std::string> seen;
    std::string line;
    while (std::getline(file, line)) {
        // Trim whitespace
        size_t start = line.find_first_not_of(" \t");
        if (start == std::string::npos) continue;
        size_t end = line.find_last_not_of(" \t\r\n");
        line = line.substr(start, end - start + 1);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') continue;

        if (seen.insert(line).second) {
            terms.push_back(line);
        }
    }

    return terms;
}

bool FileVocabularyStore::create_default_file() const {
    if (path_.empty()) return false;

    // Don't overwrite existing file
    if (std::filesystem::exists(path_)) {
        return true;
    }

    std::filesystem::path dir = std::filesystem::path(path_).parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            std::cerr << "[vocabulary] Failed to create " << dir << ": " << ec.message() << std::endl;
            return false;
        }
    }

    std::ofstream file(path_);
    if (!file.is_open()) {
        std::cerr << "[vocabulary] Failed to create vocabulary file: " << path_ << std::endl;
        return false;
    }

    file << R"(# Sobotta vocabulary
# One word or phrase per line. Terms are passed to the speech engine as hints
# so names, products and jargon are spelled the way you expect.
#
# Examples:
# Anthropic
# PortAudio
# Kubernetes
)";

    std::cout << "[vocabulary] Created vocabulary file: " << path_ << std::endl;
    return true;
}

std::string build_prompt(const std::vector<std::string>& terms, int max_tokens) {
    if (terms.empty()) return "";

    std::ostringstream prompt;
    for (size_t i = 0; i < terms.size(); ++i) {
        if (i > 0) prompt << ", ";
        prompt << terms[i];
    }
    std::string text = prompt.str();

    // Rough estimate: 4 characters per token on average
    size_t max_chars = static_cast<size_t>(std::max(max_tokens, 1)) * 4;
    if (text.length() <= max_chars) {
        return text;
    }

    // Find last complete word before limit
    std::string truncated = text.substr(0, max_chars);
    size_t last_space = truncated.find_last_of(" ,");
    if (last_space != std::string::npos && last_space > 0) {
        truncated = truncated.substr(0, last_space);
    }

    // Drop a dangling separator
    while (!truncated.empty() && (truncated.back() == ',' || truncated.back() == ' ')) {
        truncated.pop_back();
    }
    return truncated;
}

} // namespace sobotta
