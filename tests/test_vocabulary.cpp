// Tests for the vocabulary file and prompt building

#include "vocabulary.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace sobotta;

std::string temp_path(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / "sobotta_vocab_test";
    std::filesystem::create_directories(dir);
    return (dir / name).string();
}

void test_file_store() {
    std::cout << "Testing vocabulary file..." << std::endl;

    std::string path = temp_path("vocabulary.txt");
    {
        std::ofstream file(path);
        file << "# comment line\n"
             << "\n"
             << "  Kubernetes  \n"
             << "PortAudio\r\n"
             << "   # indented comment\n"
             << "Kubernetes\n"
             << "whisper.cpp\n";
    }

    FileVocabularyStore store(path);
    auto terms = store.list_terms();
    assert(terms.size() == 3);
    assert(terms[0] == "Kubernetes" && "Trimmed, first occurrence kept");
    assert(terms[1] == "PortAudio" && "CR stripped");
    assert(terms[2] == "whisper.cpp");

    FileVocabularyStore missing(temp_path("does-not-exist.txt"));
    assert(missing.list_terms().empty() && "Missing file is an empty vocabulary");

    std::filesystem::remove(path);
    std::cout << "  PASS: Terms parsed" << std::endl;
}

void test_default_file() {
    std::cout << "Testing default vocabulary file..." << std::endl;

    std::string path = temp_path("nested/dir/vocabulary.txt");
    std::filesystem::remove_all(std::filesystem::path(path).parent_path());

    FileVocabularyStore store(path);
    assert(store.create_default_file());
    assert(std::filesystem::exists(path));
    assert(store.list_terms().empty() && "Template holds only comments");

    // Existing files are never overwritten
    {
        std::ofstream file(path);
        file << "Sobotta\n";
    }
    assert(store.create_default_file());
    assert(store.list_terms().size() == 1);

    std::filesystem::remove_all(temp_path(""));
    std::cout << "  PASS: Default file created once" << std::endl;
}

void test_build_prompt() {
    std::cout << "Testing prompt building..." << std::endl;

    assert(build_prompt({}).empty());
    assert(build_prompt({"Alpha", "Beta", "Gamma"}) == "Alpha, Beta, Gamma");

    std::vector<std::string> many;
    for (int i = 0; i < 400; ++i) many.push_back("term" + std::to_string(i));

    std::string prompt = build_prompt(many);
    assert(prompt.size() <= 800 && "About 200 tokens at 4 chars each");
    assert(prompt.rfind("term0, term1", 0) == 0 && "Order preserved");
    assert(prompt.back() != ',' && prompt.back() != ' ' && "No dangling separator");

    // Cut falls on a term boundary
    std::string last = prompt.substr(prompt.find_last_of(' ') + 1);
    bool whole_term = false;
    for (const auto& t : many) if (t == last) whole_term = true;
    assert(whole_term);

    assert(build_prompt({"abcdefgh", "ijkl"}, 2) == "abcdefgh");

    std::cout << "  PASS: Prompt truncated on a word boundary" << std::endl;
}

int main() {
    std::cout << "\n=== Vocabulary Test Suite ===" << std::endl << std::endl;

    test_file_store();
    test_default_file();
    test_build_prompt();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
