#pragma once

#include <functional>
#include <string>
#include <vector>

namespace doc_chunker {

// Converts every CRLF pair to LF. Idempotent.
std::string normalize(const std::string& text);

// Byte range [begin, end) of a separator; begin is npos when nothing was found
struct TextSpan {
    size_t begin;
    size_t end;
};

// Returns the first non-empty separator starting at or after `from`
using SeparatorFinder = std::function<TextSpan(const std::string& text, size_t from)>;

// The pieces between separators, including leading/trailing empty pieces
std::vector<std::string> split_on(const std::string& text, const SeparatorFinder& find);

// First whitespace run at or after `from` holding at least `newlines` line
// feeds. The span covers the first to the last line feed of the run. Scans in
// linear time, whatever the run length.
TextSpan find_blank_run(const std::string& text, size_t from, size_t newlines);

bool is_space(char c);

// Splits on '\n', keeping empty lines.
std::vector<std::string> split_lines(const std::string& text);

std::string join(const std::vector<std::string>& parts, const std::string& separator);

// Trims ASCII whitespace (space, \t, \n, \r, \f, \v) from both ends.
std::string trim(const std::string& text);

// Lower-cases ASCII letters and the Latin-1 accented capitals (U+00C0-U+00DE).
std::string to_lower(const std::string& text);

// Number of code points in a UTF-8 string.
size_t utf8_length(const std::string& text);

// Byte offset of code point number `index`, text.size() when past the end.
size_t utf8_offset(const std::string& text, size_t index);

// Last `count` code points of `text`
std::string utf8_tail(const std::string& text, size_t count);

// Maps byte offsets of one text to code point offsets and back. Built once per
// text; lookups are O(log n) and O(1).
class CharIndex {
public:
    explicit CharIndex(const std::string& text);

    // Code points in text[0, byte); a byte inside a code point counts it
    size_t chars_before(size_t byte) const;
    // Byte offset of code point `chars`, clamped to the text size
    size_t byte_at(size_t chars) const;
    // Number of code points
    size_t size() const { return starts_.size() - 1; }

private:
    std::vector<size_t> starts_;  // byte offset of each code point, then text.size()
};

// True when `pos` is at the end of `text` or not on a continuation byte.
bool is_char_boundary(const std::string& text, size_t pos);

// Moves `pos` back to the nearest code point boundary (never below 0).
size_t floor_char_boundary(const std::string& text, size_t pos);

// True when the first character is a lowercase letter (ASCII or Latin-1).
bool starts_lowercase(const std::string& text);

} // namespace doc_chunker
