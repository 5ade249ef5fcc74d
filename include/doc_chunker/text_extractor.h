#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace doc_chunker {

struct ExtractedDocument {
    std::string text;
    nlohmann::json metadata;
};

// Reads plain-text documents (.txt, .md) and derives lightweight metadata.
// Binary formats are handled by an upstream extractor and are rejected here.
class TextExtractor {
public:
    // Throws std::runtime_error when the file is missing, unreadable or of an
    // unsupported type.
    ExtractedDocument extract(const std::string& path) const;

    static bool is_supported(const std::string& path);

    // The path itself for a file, or every supported file below a directory
    // in sorted order. Throws std::runtime_error when nothing is found.
    static std::vector<std::string> collect(const std::string& path);

    // title, language, word_count, reading_time_minutes and (when found) year
    static nlohmann::json analyze(const std::string& text);

    static std::string detect_language(const std::string& text);
    static size_t count_words(const std::string& text);
    // Most recent year 1900-2029 not after the current year, 0 when none
    static int extract_year(const std::string& text);
};

// Output base names for `inputs`, relative to `root` when it is a directory.
// Directories are kept ("a/x" for root/a/x.txt) and every name is unique:
// a clash such as x.txt next to x.md gets the extension appended ("x_md").
std::vector<std::string> output_names(const std::vector<std::string>& inputs,
                                      const std::string& root);

} // namespace doc_chunker
