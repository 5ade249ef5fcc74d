#include "doc_chunker/text_normalizer.h"
#include <algorithm>

namespace doc_chunker {

namespace {

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string normalize(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
            continue;
        }
        result += text[i];
    }

    return result;
}

std::vector<std::string> split_on(const std::string& text, const SeparatorFinder& find) {
    std::vector<std::string> pieces;
    size_t last = 0;

    while (last <= text.size()) {
        TextSpan match = find(text, last);
        if (match.begin == std::string::npos || match.end <= match.begin) {
            break;
        }
        pieces.push_back(text.substr(last, match.begin - last));
        last = match.end;
    }
    pieces.push_back(text.substr(last));

    return pieces;
}

TextSpan find_blank_run(const std::string& text, size_t from, size_t newlines) {
    size_t pos = from;
    while ((pos = text.find('\n', pos)) != std::string::npos) {
        size_t count = 0;
        size_t last = pos;
        size_t run_end = pos;
        while (run_end < text.size() && is_space(text[run_end])) {
            if (text[run_end] == '\n') {
                ++count;
                last = run_end;
            }
            ++run_end;
        }
        if (count >= newlines) {
            return {pos, last + 1};
        }
        pos = run_end;
    }
    return {std::string::npos, std::string::npos};
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;

    while (true) {
        size_t pos = text.find('\n', start);
        if (pos == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }

    return lines;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

std::string trim(const std::string& text) {
    size_t first = 0;
    while (first < text.size() && is_space(text[first])) {
        ++first;
    }
    size_t last = text.size();
    while (last > first && is_space(text[last - 1])) {
        --last;
    }
    return text.substr(first, last - first);
}

std::string to_lower(const std::string& text) {
    std::string result = text;

    for (size_t i = 0; i < result.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(result[i]);
        if (c >= 'A' && c <= 'Z') {
            result[i] = static_cast<char>(c + ('a' - 'A'));
        } else if (c == 0xC3 && i + 1 < result.size()) {
            // U+00C0..U+00DE (except U+00D7) are encoded as C3 80..C3 9E
            unsigned char next = static_cast<unsigned char>(result[i + 1]);
            if (next >= 0x80 && next <= 0x9E && next != 0x97) {
                result[i + 1] = static_cast<char>(next + 0x20);
            }
            ++i;
        }
    }

    return result;
}

size_t utf8_length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if (!is_continuation(c)) {
            ++count;
        }
    }
    return count;
}

size_t utf8_offset(const std::string& text, size_t index) {
    size_t seen = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (!is_continuation(static_cast<unsigned char>(text[i]))) {
            if (seen == index) {
                return i;
            }
            ++seen;
        }
    }
    return text.size();
}

std::string utf8_tail(const std::string& text, size_t count) {
    if (count == 0) {
        return std::string();
    }
    size_t pos = text.size();
    size_t taken = 0;
    while (pos > 0 && taken < count) {
        --pos;
        if (!is_continuation(static_cast<unsigned char>(text[pos]))) {
            ++taken;
        }
    }
    return text.substr(pos);
}

CharIndex::CharIndex(const std::string& text) {
    starts_.reserve(text.size() + 1);
    for (size_t i = 0; i < text.size(); ++i) {
        if (!is_continuation(static_cast<unsigned char>(text[i]))) {
            starts_.push_back(i);
        }
    }
    starts_.push_back(text.size());
}

size_t CharIndex::chars_before(size_t byte) const {
    return static_cast<size_t>(
        std::lower_bound(starts_.begin(), starts_.end() - 1, byte) - starts_.begin());
}

size_t CharIndex::byte_at(size_t chars) const {
    return starts_[std::min(chars, size())];
}

bool is_char_boundary(const std::string& text, size_t pos) {
    if (pos >= text.size()) {
        return true;
    }
    return !is_continuation(static_cast<unsigned char>(text[pos]));
}

size_t floor_char_boundary(const std::string& text, size_t pos) {
    if (pos >= text.size()) {
        return text.size();
    }
    while (pos > 0 && !is_char_boundary(text, pos)) {
        --pos;
    }
    return pos;
}

bool starts_lowercase(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    unsigned char c = static_cast<unsigned char>(text[0]);
    if (c >= 'a' && c <= 'z') {
        return true;
    }
    // U+00DF..U+00FF (except U+00F7) are encoded as C3 9F..C3 BF
    if (c == 0xC3 && text.size() > 1) {
        unsigned char next = static_cast<unsigned char>(text[1]);
        return next >= 0x9F && next <= 0xBF && next != 0xB7;
    }
    return false;
}

} // namespace doc_chunker
