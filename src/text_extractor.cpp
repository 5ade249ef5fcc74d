#include "doc_chunker/text_extractor.h"
#include "doc_chunker/text_normalizer.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace doc_chunker {

namespace {

const double kWordsPerSecond = 5.0;

bool is_word_byte(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

int current_year() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    return utc.tm_year + 1900;
}

size_t count_marker_words(const std::string& lowered, std::initializer_list<const char*> words) {
    size_t count = 0;
    for (const char* word : words) {
        if (lowered.find(std::string(" ") + word + " ") != std::string::npos) {
            ++count;
        }
    }
    return count;
}

} // namespace

bool TextExtractor::is_supported(const std::string& path) {
    auto ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext == ".txt" || ext == ".md";
}

std::vector<std::string> TextExtractor::collect(const std::string& path) {
    if (!fs::exists(path)) {
        throw std::runtime_error("Input not found: " + path);
    }

    std::vector<std::string> inputs;
    if (!fs::is_directory(path)) {
        inputs.push_back(path);
        return inputs;
    }

    for (const auto& entry : fs::recursive_directory_iterator(path)) {
        if (entry.is_regular_file() && is_supported(entry.path().string())) {
            inputs.push_back(entry.path().string());
        }
    }
    std::sort(inputs.begin(), inputs.end());
    if (inputs.empty()) {
        throw std::runtime_error("No .txt or .md documents under " + path);
    }
    return inputs;
}

ExtractedDocument TextExtractor::extract(const std::string& path) const {
    if (!fs::exists(path)) {
        throw std::runtime_error("Document not found: " + path);
    }
    if (!is_supported(path)) {
        throw std::runtime_error("Unsupported file type: " + fs::path(path).extension().string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open document: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    ExtractedDocument document;
    document.text = normalize(buffer.str());
    document.metadata = analyze(document.text);
    document.metadata["file_type"] = fs::path(path).extension().string();
    document.metadata["file_size"] = static_cast<uint64_t>(fs::file_size(path));
    return document;
}

nlohmann::json TextExtractor::analyze(const std::string& text) {
    nlohmann::json metadata = nlohmann::json::object();

    // First non-blank line
    for (const auto& line : split_lines(text)) {
        std::string trimmed = trim(line);
        if (!trimmed.empty()) {
            metadata["title"] = trimmed;
            break;
        }
    }

    size_t words = count_words(text);
    metadata["language"] = detect_language(text);
    metadata["word_count"] = words;
    metadata["reading_time_minutes"] =
        static_cast<int>(std::ceil(static_cast<double>(words) / kWordsPerSecond / 60.0));

    int year = extract_year(text);
    if (year > 0) {
        metadata["year"] = year;
    }

    return metadata;
}

std::string TextExtractor::detect_language(const std::string& text) {
    const std::string lowered = to_lower(text);

    size_t french = count_marker_words(lowered, {"et", "ou", "le", "la", "les", "un", "une",
                                                 "des", "est", "sont"});
    size_t english = count_marker_words(lowered, {"and", "or", "the", "a", "an", "is", "are",
                                                  "to", "of", "for"});

    return french > english ? "Fran\xC3\xA7" "ais" : "English";
}

size_t TextExtractor::count_words(const std::string& text) {
    size_t count = 0;
    bool in_word = false;
    for (unsigned char c : text) {
        bool word = is_word_byte(c);
        if (word && !in_word) {
            ++count;
        }
        in_word = word;
    }
    return count;
}

int TextExtractor::extract_year(const std::string& text) {
    static const std::regex year_pattern("\\b(19\\d{2}|20[0-2]\\d)\\b");

    const int limit = current_year();
    int latest = 0;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), year_pattern);
         it != std::sregex_iterator(); ++it) {
        int year = std::stoi((*it)[1].str());
        if (year <= limit) {
            latest = std::max(latest, year);
        }
    }
    return latest;
}

std::vector<std::string> output_names(const std::vector<std::string>& inputs,
                                      const std::string& root) {
    const bool from_directory = !root.empty() && fs::is_directory(root);

    std::vector<std::string> names;
    std::set<std::string> used;
    for (const auto& input : inputs) {
        fs::path path(input);
        fs::path base = path.stem();
        if (from_directory) {
            fs::path relative = path.lexically_relative(root);
            if (!relative.empty() && *relative.begin() != "..") {
                base = relative.parent_path() / path.stem();
            }
        }

        std::string name = base.generic_string();
        if (used.count(name) > 0) {
            std::string extension = path.extension().string();
            if (!extension.empty() && extension[0] == '.') {
                extension.erase(0, 1);
            }
            name += "_" + extension;
        }
        std::string unique = name;
        for (int suffix = 2; used.count(unique) > 0; ++suffix) {
            unique = name + "_" + std::to_string(suffix);
        }

        used.insert(unique);
        names.push_back(unique);
    }
    return names;
}

} // namespace doc_chunker
