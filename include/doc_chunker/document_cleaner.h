#pragma once

#include <string>
#include <vector>

namespace doc_chunker {

// Which cleaning steps to run. All enabled by default.
struct CleaningOptions {
    bool remove_headers = true;
    bool remove_footers = true;
    bool remove_page_numbers = true;
    bool remove_extra_whitespace = true;
    bool normalize_quotes = true;
    bool fix_hyphenation = true;
};

// Names reported in CleaningStats::removed_elements
namespace removed {
constexpr const char* kHeaders = "headers";
constexpr const char* kFooters = "footers";
constexpr const char* kPageNumbers = "page_numbers";
constexpr const char* kHyphenation = "hyphenation";
constexpr const char* kQuotes = "non_standard_quotes";
constexpr const char* kWhitespace = "extra_whitespace";
} // namespace removed

struct CleaningStats {
    size_t original_length = 0;   // code points
    size_t cleaned_length = 0;    // code points
    double reduction_percentage = 0.0;
    std::vector<std::string> removed_elements;  // deduplicated, first-seen order

    bool has_removed(const std::string& element) const;
};

struct CleaningResult {
    std::string text;
    CleaningStats stats;
};

// Splits raw text into pages: form feeds, bare page-number lines surrounded by
// blank lines, or "-N-" markers. Falls back to runs of 3+ blank lines when the
// first pass finds no boundary.
std::vector<std::string> split_pages(const std::string& text);

// Removes headers, footers and page numbers, repairs hyphenation, normalizes
// quotes and collapses whitespace. Total over any input.
CleaningResult clean_document(const std::string& text,
                              const CleaningOptions& options = CleaningOptions{});

} // namespace doc_chunker
