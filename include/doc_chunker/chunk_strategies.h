#pragma once

#include "doc_chunker/chunker.h"
#include "doc_chunker/tagger.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace doc_chunker {

// A paragraph of the source text, stripped, with its byte offsets
struct Paragraph {
    std::string text;
    size_t begin;
    size_t end;
};

// Blank-line delimited paragraphs, empty ones dropped. Linear in the text
// size, however long the blank runs are.
std::vector<Paragraph> split_paragraphs(const std::string& text);

class ChunkStrategy {
public:
    explicit ChunkStrategy(std::shared_ptr<const Tagger> tagger) : tagger_(std::move(tagger)) {}
    virtual ~ChunkStrategy() = default;

    virtual std::vector<Chunk> split(const std::string& text,
                                     const ChunkingConfig& config) const = 0;

protected:
    std::shared_ptr<const Tagger> tagger_;
};

// Fixed windows snapped back to the last sentence end or blank line
class FixedSizeStrategy : public ChunkStrategy {
public:
    explicit FixedSizeStrategy(std::shared_ptr<const Tagger> tagger = nullptr);

    std::vector<Chunk> split(const std::string& text,
                             const ChunkingConfig& config) const override;
};

// Whole paragraphs accumulated up to chunk_size, raw character overlap
class ParagraphStrategy : public ChunkStrategy {
public:
    explicit ParagraphStrategy(std::shared_ptr<const Tagger> tagger = nullptr);

    std::vector<Chunk> split(const std::string& text,
                             const ChunkingConfig& config) const override;
};

// Paragraph accumulation that breaks on headings and carries overlap from a
// sentence boundary
class SemanticStrategy : public ChunkStrategy {
public:
    static constexpr size_t kMaxHeadingLength = 100;

    explicit SemanticStrategy(std::shared_ptr<const Tagger> tagger = nullptr);

    std::vector<Chunk> split(const std::string& text,
                             const ChunkingConfig& config) const override;

    // Short paragraph without terminal punctuation
    static bool is_heading(const std::string& paragraph);
};

// A null tagger selects the default for the strategy: positional labels for
// fixed/paragraph, keyword tables for semantic.
std::unique_ptr<ChunkStrategy> make_strategy(ChunkingStrategy strategy,
                                             std::shared_ptr<const Tagger> tagger = nullptr);

} // namespace doc_chunker
