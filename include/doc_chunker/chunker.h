#pragma once

#include <string>
#include <vector>
#include <memory>

namespace doc_chunker {

enum class ChunkingStrategy {
    Fixed,
    Paragraph,
    Semantic
};

// "fixed", "paragraph" or "semantic"; throws std::invalid_argument otherwise
ChunkingStrategy parse_strategy(const std::string& name);
std::string to_string(ChunkingStrategy strategy);

// Configuration for text chunking. Sizes and overlap count code points of the
// UTF-8 text, as do the chunk offsets.
struct ChunkingConfig {
    ChunkingStrategy strategy = ChunkingStrategy::Semantic;
    int chunk_size = 800;
    int chunk_overlap = 100;
    int min_chunk_size = 200;
    bool respect_boundaries = true;  // semantic only: headings start new chunks
};

// Throws std::invalid_argument for non-positive sizes, negative overlap or
// overlap >= chunk_size.
void validate(const ChunkingConfig& config);

// Page numbers are approximated from offsets, not real pagination
constexpr size_t kCharsPerPage = 2000;

// "start-end", 1-indexed
std::string page_range(size_t start_char, size_t end_char);

struct Chunk {
    std::string text;
    std::string page_range;
    size_t start_char = 0;
    size_t end_char = 0;
    std::string section;
    std::vector<std::string> key_concepts;
};

// Splits cleaned text into overlapping chunks with the configured strategy.
// chunk() is a pure function of (text, config) and safe to call concurrently.
class DocumentChunker {
public:
    explicit DocumentChunker(const ChunkingConfig& config = ChunkingConfig{});
    ~DocumentChunker();

    DocumentChunker(DocumentChunker&&) noexcept;
    DocumentChunker& operator=(DocumentChunker&&) noexcept;

    std::vector<Chunk> chunk(const std::string& text) const;

    ChunkingConfig get_config() const;
    void set_config(const ChunkingConfig& config);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Shorthand for DocumentChunker(config).chunk(text)
std::vector<Chunk> chunk_document(const std::string& text,
                                  const ChunkingConfig& config = ChunkingConfig{});

} // namespace doc_chunker
