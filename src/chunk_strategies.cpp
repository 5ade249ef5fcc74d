#include "doc_chunker/chunk_strategies.h"
#include "doc_chunker/text_normalizer.h"
#include <algorithm>
#include <stdexcept>

namespace doc_chunker {

namespace {

const char* const kParagraphSeparator = "\n\n";
const size_t kParagraphSeparatorLength = 2;

std::shared_ptr<const Tagger> or_default(std::shared_ptr<const Tagger> tagger,
                                         bool positional) {
    if (tagger) {
        return tagger;
    }
    if (positional) {
        static const std::shared_ptr<const Tagger> shared = std::make_shared<PositionalTagger>();
        return shared;
    }
    static const std::shared_ptr<const Tagger> shared = std::make_shared<KeywordTagger>();
    return shared;
}

size_t to_size(int value) {
    return value > 0 ? static_cast<size_t>(value) : 0;
}

Chunk make_chunk(std::string text, size_t start_char, size_t end_char) {
    Chunk chunk;
    chunk.text = std::move(text);
    chunk.page_range = page_range(start_char, end_char);
    chunk.start_char = start_char;
    chunk.end_char = end_char;
    return chunk;
}

// Rightmost sentence end or blank line lying entirely inside the byte range
// [start, end)
size_t find_boundary(const std::string& text, size_t start, size_t end) {
    static const char* const markers[] = {". ", "? ", "! ", "\n\n"};

    if (end < start + 2) {
        return std::string::npos;
    }
    for (size_t pos = end - 1; pos-- > start;) {
        for (const char* marker : markers) {
            if (text.compare(pos, 2, marker) == 0) {
                return pos;
            }
        }
    }
    return std::string::npos;
}

void tag_positional(std::vector<Chunk>& chunks, const Tagger& tagger) {
    for (size_t i = 0; i < chunks.size(); ++i) {
        chunks[i].section = tagger.tag_section({}, i);
        chunks[i].key_concepts = tagger.tag_concepts(chunks[i].text);
    }
}

} // namespace

std::vector<Paragraph> split_paragraphs(const std::string& text) {
    std::vector<Paragraph> paragraphs;

    auto emit = [&](size_t begin, size_t end) {
        std::string piece = text.substr(begin, end - begin);
        std::string stripped = trim(piece);
        if (stripped.empty()) {
            return;
        }
        size_t offset = begin + piece.find(stripped);
        paragraphs.push_back({stripped, offset, offset + stripped.size()});
    };

    size_t piece_start = 0;
    TextSpan separator = find_blank_run(text, 0, 2);
    while (separator.begin != std::string::npos) {
        emit(piece_start, separator.begin);
        piece_start = separator.end;
        separator = find_blank_run(text, piece_start, 2);
    }
    emit(piece_start, text.size());

    return paragraphs;
}

FixedSizeStrategy::FixedSizeStrategy(std::shared_ptr<const Tagger> tagger)
    : ChunkStrategy(or_default(std::move(tagger), true)) {}

std::vector<Chunk> FixedSizeStrategy::split(const std::string& input,
                                            const ChunkingConfig& config) const {
    const std::string text = normalize(input);
    const CharIndex index(text);
    const size_t length = index.size();
    const size_t chunk_size = std::max<size_t>(to_size(config.chunk_size), 1);
    const size_t overlap = to_size(config.chunk_overlap);
    const size_t min_size = to_size(config.min_chunk_size);

    std::vector<Chunk> chunks;
    size_t start = 0;

    while (start < length) {
        size_t end = std::min(start + chunk_size, length);

        if (end < length) {
            size_t boundary = find_boundary(text, index.byte_at(start), index.byte_at(end));
            if (boundary != std::string::npos) {
                size_t boundary_char = index.chars_before(boundary);
                if (boundary_char >= start + min_size) {
                    end = boundary_char + 1;  // keep the punctuation
                }
            }
        }

        const size_t first_byte = index.byte_at(start);
        std::string piece = trim(text.substr(first_byte, index.byte_at(end) - first_byte));
        if (!piece.empty() && utf8_length(piece) >= min_size) {
            chunks.push_back(make_chunk(std::move(piece), start, end));
        }

        if (end >= length) {
            break;
        }

        // Overlap is dropped when it would not move the window forward
        size_t next = end > overlap ? end - overlap : 0;
        size_t guard = end - std::min({overlap, min_size / 2, end});
        if (next >= guard || next <= start) {
            next = end;
        }
        start = next;
    }

    tag_positional(chunks, *tagger_);
    return chunks;
}

ParagraphStrategy::ParagraphStrategy(std::shared_ptr<const Tagger> tagger)
    : ChunkStrategy(or_default(std::move(tagger), true)) {}

std::vector<Chunk> ParagraphStrategy::split(const std::string& input,
                                            const ChunkingConfig& config) const {
    const std::string text = normalize(input);
    const CharIndex index(text);
    const size_t chunk_size = to_size(config.chunk_size);
    const size_t overlap = to_size(config.chunk_overlap);
    const size_t min_size = to_size(config.min_chunk_size);

    std::vector<Chunk> chunks;
    std::string buffer;
    size_t buffer_chars = 0;
    size_t buffer_start = 0;
    size_t buffer_end = 0;

    for (const auto& paragraph : split_paragraphs(text)) {
        const size_t paragraph_chars = utf8_length(paragraph.text);
        const size_t paragraph_start = index.chars_before(paragraph.begin);

        if (buffer_chars + paragraph_chars > chunk_size && buffer_chars >= min_size) {
            chunks.push_back(make_chunk(buffer, buffer_start, paragraph_start));

            std::string carried = utf8_tail(buffer, overlap);
            const size_t carried_chars = std::min(overlap, buffer_chars);
            buffer_start = std::max(buffer_start,
                                    buffer_end > carried_chars ? buffer_end - carried_chars : 0);
            buffer = std::move(carried);
            buffer_chars = carried_chars;
        }

        if (buffer.empty()) {
            buffer = paragraph.text;
            buffer_chars = paragraph_chars;
            buffer_start = paragraph_start;
        } else {
            buffer += kParagraphSeparator;
            buffer += paragraph.text;
            buffer_chars += kParagraphSeparatorLength + paragraph_chars;
        }
        buffer_end = index.chars_before(paragraph.end);
    }

    if (!buffer.empty() && buffer_chars >= min_size) {
        chunks.push_back(make_chunk(buffer, buffer_start, index.size()));
    }

    tag_positional(chunks, *tagger_);
    return chunks;
}

SemanticStrategy::SemanticStrategy(std::shared_ptr<const Tagger> tagger)
    : ChunkStrategy(or_default(std::move(tagger), false)) {}

bool SemanticStrategy::is_heading(const std::string& paragraph) {
    if (paragraph.empty() || utf8_length(paragraph) >= kMaxHeadingLength) {
        return false;
    }
    char last = paragraph.back();
    return last != '.' && last != '!' && last != '?';
}

std::vector<Chunk> SemanticStrategy::split(const std::string& input,
                                           const ChunkingConfig& config) const {
    const std::string text = normalize(input);
    const CharIndex index(text);
    const size_t chunk_size = to_size(config.chunk_size);
    const size_t overlap = to_size(config.chunk_overlap);
    const size_t min_size = to_size(config.min_chunk_size);

    std::vector<Chunk> chunks;
    std::string buffer;
    std::vector<std::string> contributors;  // paragraphs since the last flush
    size_t buffer_chars = 0;
    size_t buffer_start = 0;
    size_t buffer_end = 0;

    auto flush = [&](size_t end_char) {
        Chunk chunk = make_chunk(buffer, buffer_start, end_char);
        chunk.section = tagger_->tag_section(contributors, chunks.size());
        chunk.key_concepts = tagger_->tag_concepts(buffer);
        chunks.push_back(std::move(chunk));
    };

    for (const auto& paragraph : split_paragraphs(text)) {
        const size_t paragraph_chars = utf8_length(paragraph.text);
        const size_t paragraph_start = index.chars_before(paragraph.begin);
        const bool heading = config.respect_boundaries && is_heading(paragraph.text);
        const bool oversized =
            buffer_chars + paragraph_chars > chunk_size && buffer_chars >= min_size;

        if (oversized || (heading && !buffer.empty())) {
            flush(paragraph_start);

            if (heading) {
                // A heading opens a fresh chunk with no carried text
                buffer = paragraph.text;
                buffer_chars = paragraph_chars;
                contributors = {paragraph.text};
                buffer_start = paragraph_start;
                buffer_end = index.chars_before(paragraph.end);
                continue;
            }

            // Prefer carrying whole sentences: start after the first ". " in
            // the overlap window, else take the raw tail.
            const size_t window_start =
                utf8_offset(buffer, buffer_chars > overlap ? buffer_chars - overlap : 0);
            const size_t sentence = buffer.find(". ", window_start);
            std::string carried = sentence != std::string::npos
                                      ? buffer.substr(sentence + 2)
                                      : utf8_tail(buffer, overlap);
            const size_t carried_chars = utf8_length(carried);

            contributors.erase(std::remove_if(contributors.begin(), contributors.end(),
                                              [&carried](const std::string& p) {
                                                  return carried.find(p) == std::string::npos;
                                              }),
                               contributors.end());
            buffer_start = std::max(buffer_start,
                                    buffer_end > carried_chars ? buffer_end - carried_chars : 0);
            buffer = std::move(carried);
            buffer_chars = carried_chars;
        }

        if (buffer.empty()) {
            buffer = paragraph.text;
            buffer_chars = paragraph_chars;
            buffer_start = paragraph_start;
        } else {
            buffer += kParagraphSeparator;
            buffer += paragraph.text;
            buffer_chars += kParagraphSeparatorLength + paragraph_chars;
        }
        contributors.push_back(paragraph.text);
        buffer_end = index.chars_before(paragraph.end);
    }

    if (!buffer.empty() && buffer_chars >= min_size) {
        flush(index.size());
    }

    return chunks;
}

std::unique_ptr<ChunkStrategy> make_strategy(ChunkingStrategy strategy,
                                             std::shared_ptr<const Tagger> tagger) {
    switch (strategy) {
        case ChunkingStrategy::Fixed:
            return std::make_unique<FixedSizeStrategy>(std::move(tagger));
        case ChunkingStrategy::Paragraph:
            return std::make_unique<ParagraphStrategy>(std::move(tagger));
        case ChunkingStrategy::Semantic:
            return std::make_unique<SemanticStrategy>(std::move(tagger));
    }
    throw std::invalid_argument("Unknown chunking strategy");
}

} // namespace doc_chunker
