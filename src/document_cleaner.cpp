#include "doc_chunker/document_cleaner.h"
#include "doc_chunker/text_normalizer.h"
#include <algorithm>
#include <cmath>
#include <regex>
#include <utility>

namespace doc_chunker {

namespace {

const size_t kMaxHeaderLines = 2;
const size_t kMaxFooterLines = 3;
const size_t kMinPageLines = 3;
const size_t kShortLineLength = 60;

void add_removed(CleaningStats& stats, const char* element) {
    if (!stats.has_removed(element)) {
        stats.removed_elements.emplace_back(element);
    }
}

bool all_short(std::vector<std::string>::const_iterator first,
               std::vector<std::string>::const_iterator last) {
    return std::all_of(first, last, [](const std::string& line) {
        return utf8_length(line) < kShortLineLength;
    });
}

bool strip_header(std::vector<std::string>& lines, size_t count) {
    // Every alternative has a bounded length, so each attempt is constant work
    static const std::regex markers("(page|chapitre|\\d/\\d|confidential|draft)",
                                    std::regex::icase);

    if (count == 0 || lines.size() < count) {
        return false;
    }

    std::vector<std::string> candidate(lines.begin(), lines.begin() + count);
    if (std::regex_search(join(candidate, "\n"), markers) ||
        all_short(candidate.begin(), candidate.end())) {
        lines.erase(lines.begin(), lines.begin() + count);
        return true;
    }
    return false;
}

bool strip_footer(std::vector<std::string>& lines, size_t count) {
    static const std::regex markers(
        "(page|\xC2\xA9|copyright|tous droits|www|http|@|\\d$|\\d/\\d)",
        std::regex::icase);

    if (count == 0 || lines.size() < count) {
        return false;
    }

    std::vector<std::string> candidate(lines.end() - count, lines.end());
    if (std::regex_search(join(candidate, "\n"), markers) ||
        all_short(candidate.begin(), candidate.end())) {
        lines.erase(lines.end() - count, lines.end());
        return true;
    }
    return false;
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

// Whitespace, digits, whitespace and nothing else
bool is_number_line(const std::string& line) {
    const std::string trimmed = trim(line);
    return !trimmed.empty() && std::all_of(trimmed.begin(), trimmed.end(), is_digit);
}

// Drops a trailing run of digits together with the whitespace around it
void strip_trailing_number(std::string& line) {
    size_t end = line.size();
    while (end > 0 && is_space(line[end - 1])) {
        --end;
    }
    size_t digits = end;
    while (digits > 0 && is_digit(line[digits - 1])) {
        --digits;
    }
    if (digits == end || digits == 0 || !is_space(line[digits - 1])) {
        return;
    }
    size_t start = digits;
    while (start > 0 && is_space(line[start - 1])) {
        --start;
    }
    line.erase(start);
}

void strip_page_numbers(std::vector<std::string>& lines) {
    lines.erase(std::remove_if(lines.begin(), lines.end(), is_number_line), lines.end());

    for (auto& line : lines) {
        strip_trailing_number(line);
    }
}

// A line ending in '-' followed by a line starting lowercase is a split word:
// the hyphen is dropped, the continuation stays on its own line.
bool fix_hyphenation(std::vector<std::string>& lines) {
    bool changed = false;
    for (size_t i = 0; i + 1 < lines.size(); ++i) {
        if (!lines[i].empty() && lines[i].back() == '-' && starts_lowercase(lines[i + 1])) {
            lines[i].pop_back();
            changed = true;
        }
    }
    return changed;
}

bool replace_all(std::string& text, const std::string& from, const std::string& to) {
    bool changed = false;
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
        changed = true;
    }
    return changed;
}

bool normalize_quotes(std::vector<std::string>& lines) {
    static const std::pair<const char*, const char*> replacements[] = {
        {"\xE2\x80\x9C", "\""},  // left double quotation mark
        {"\xE2\x80\x9D", "\""},  // right double quotation mark
        {"\xE2\x80\x9E", "\""},  // double low-9 quotation mark
        {"\xE2\x80\x9F", "\""},  // double high-reversed-9 quotation mark
        {"\xC2\xAB", "\""},      // left guillemet
        {"\xC2\xBB", "\""},      // right guillemet
        {"\xE2\x80\x98", "'"},   // left single quotation mark
        {"\xE2\x80\x99", "'"},   // right single quotation mark
        {"\xE2\x80\x9A", "'"},   // single low-9 quotation mark
        {"\xE2\x80\x9B", "'"},   // single high-reversed-9 quotation mark
    };

    bool changed = false;
    for (auto& line : lines) {
        for (const auto& [from, to] : replacements) {
            changed = replace_all(line, from, to) || changed;
        }
    }
    return changed;
}

std::string collapse_whitespace(const std::string& text) {
    // Runs holding three or more line feeds become a single blank line
    std::string collapsed = join(split_on(text, [](const std::string& t, size_t from) {
        return find_blank_run(t, from, 3);
    }), "\n\n");

    std::string squeezed;
    squeezed.reserve(collapsed.size());
    for (char c : collapsed) {
        if (c == ' ' && !squeezed.empty() && squeezed.back() == ' ') {
            continue;
        }
        squeezed += c;
    }

    std::vector<std::string> lines = split_lines(squeezed);
    for (auto& line : lines) {
        size_t first = line.find_first_not_of(' ');
        if (first == std::string::npos) {
            line.clear();
            continue;
        }
        size_t last = line.find_last_not_of(' ');
        line = line.substr(first, last - first + 1);
    }
    return join(lines, "\n");
}

size_t skip_spaces(const std::string& text, size_t pos) {
    while (pos < text.size() && is_space(text[pos])) {
        ++pos;
    }
    return pos;
}

size_t skip_digits(const std::string& text, size_t pos) {
    while (pos < text.size() && is_digit(text[pos])) {
        ++pos;
    }
    return pos;
}

// Just past the last line feed of the whitespace run [begin, end), npos when
// the run has none
size_t past_last_newline(const std::string& text, size_t begin, size_t end) {
    for (size_t i = end; i > begin; --i) {
        if (text[i - 1] == '\n') {
            return i;
        }
    }
    return std::string::npos;
}

bool contains(const std::string& text, size_t begin, size_t end, char c) {
    return std::find(text.begin() + begin, text.begin() + end, c) != text.begin() + end;
}

// A form feed, a number alone between blank lines, or a "- N -" marker line.
// Each whitespace run is scanned once, so the search is linear.
TextSpan find_page_break(const std::string& text, size_t from) {
    const TextSpan none{std::string::npos, std::string::npos};

    size_t pos = from;
    while (pos < text.size()) {
        if (text[pos] == '\f') {
            return {pos, pos + 1};
        }
        if (text[pos] != '\n') {
            ++pos;
            continue;
        }

        const size_t run_end = skip_spaces(text, pos);
        const bool blank_line = contains(text, pos + 1, run_end, '\n');

        // "\n\s*\n\s*\d+\s*\n"
        if (blank_line && run_end < text.size() && is_digit(text[run_end])) {
            size_t digits_end = skip_digits(text, run_end);
            size_t after = skip_spaces(text, digits_end);
            size_t end = past_last_newline(text, digits_end, after);
            if (end != std::string::npos) {
                return {pos, end};
            }
        }

        // "\n\s*-\s*\d+\s*-\s*\n"
        if (run_end < text.size() && text[run_end] == '-') {
            size_t digits = skip_spaces(text, run_end + 1);
            size_t digits_end = skip_digits(text, digits);
            if (digits_end > digits) {
                size_t dash = skip_spaces(text, digits_end);
                if (dash < text.size() && text[dash] == '-') {
                    size_t after = skip_spaces(text, dash + 1);
                    size_t end = past_last_newline(text, dash + 1, after);
                    if (end != std::string::npos) {
                        return {pos, end};
                    }
                }
            }
        }

        // A later line feed of the same run fails for the same reasons; only a
        // form feed inside it can still match
        auto form_feed = std::find(text.begin() + pos + 1, text.begin() + run_end, '\f');
        if (form_feed != text.begin() + run_end) {
            size_t at = static_cast<size_t>(form_feed - text.begin());
            return {at, at + 1};
        }
        pos = run_end;
    }
    return none;
}

double reduction_percentage(size_t original, size_t cleaned) {
    if (original == 0) {
        return 0.0;
    }
    double ratio = (static_cast<double>(original) - static_cast<double>(cleaned)) /
                   static_cast<double>(original) * 100.0;
    ratio = std::clamp(ratio, 0.0, 100.0);
    return std::round(ratio * 100.0) / 100.0;
}

} // namespace

bool CleaningStats::has_removed(const std::string& element) const {
    return std::find(removed_elements.begin(), removed_elements.end(), element) !=
           removed_elements.end();
}

std::vector<std::string> split_pages(const std::string& text) {
    auto pages = split_on(text, find_page_break);
    if (pages.size() <= 1) {
        pages = split_on(text, [](const std::string& t, size_t from) {
            return find_blank_run(t, from, 4);
        });
    }
    return pages;
}

CleaningResult clean_document(const std::string& text, const CleaningOptions& options) {
    CleaningResult result;
    result.stats.original_length = utf8_length(text);

    std::vector<std::string> cleaned_pages;

    for (const auto& page : split_pages(normalize(text))) {
        std::vector<std::string> lines = split_lines(page);
        const size_t page_lines = lines.size();

        // Too short to be a real page
        if (page_lines < kMinPageLines) {
            continue;
        }

        const size_t header_lines = std::min(kMaxHeaderLines, page_lines / 10);
        const size_t footer_lines = std::min(kMaxFooterLines, page_lines / 10);

        if (options.remove_headers && strip_header(lines, header_lines)) {
            add_removed(result.stats, removed::kHeaders);
        }

        if (options.remove_footers && strip_footer(lines, footer_lines)) {
            add_removed(result.stats, removed::kFooters);
        }

        // Reported whenever the step runs, matched or not
        if (options.remove_page_numbers) {
            strip_page_numbers(lines);
            add_removed(result.stats, removed::kPageNumbers);
        }

        if (options.fix_hyphenation && fix_hyphenation(lines)) {
            add_removed(result.stats, removed::kHyphenation);
        }

        if (options.normalize_quotes && normalize_quotes(lines)) {
            add_removed(result.stats, removed::kQuotes);
        }

        cleaned_pages.push_back(join(lines, "\n"));
    }

    result.text = join(cleaned_pages, "\n\n");

    if (options.remove_extra_whitespace) {
        std::string collapsed = collapse_whitespace(result.text);
        if (collapsed != result.text) {
            add_removed(result.stats, removed::kWhitespace);
        }
        result.text = std::move(collapsed);
    }

    result.stats.cleaned_length = utf8_length(result.text);
    result.stats.reduction_percentage =
        reduction_percentage(result.stats.original_length, result.stats.cleaned_length);

    return result;
}

} // namespace doc_chunker
