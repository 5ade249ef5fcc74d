#include "doc_chunker/chunker.h"
#include "doc_chunker/chunk_strategies.h"
#include <stdexcept>

namespace doc_chunker {

ChunkingStrategy parse_strategy(const std::string& name) {
    if (name == "fixed") return ChunkingStrategy::Fixed;
    if (name == "paragraph") return ChunkingStrategy::Paragraph;
    if (name == "semantic") return ChunkingStrategy::Semantic;
    throw std::invalid_argument("Unknown chunking strategy: " + name);
}

std::string to_string(ChunkingStrategy strategy) {
    switch (strategy) {
        case ChunkingStrategy::Fixed: return "fixed";
        case ChunkingStrategy::Paragraph: return "paragraph";
        case ChunkingStrategy::Semantic: return "semantic";
    }
    return "semantic";
}

void validate(const ChunkingConfig& config) {
    if (config.chunk_size <= 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    if (config.min_chunk_size <= 0) {
        throw std::invalid_argument("min chunk size must be positive");
    }
    if (config.chunk_overlap < 0) {
        throw std::invalid_argument("chunk overlap cannot be negative");
    }
    if (config.chunk_overlap >= config.chunk_size) {
        throw std::invalid_argument("chunk overlap must be less than chunk size");
    }
}

std::string page_range(size_t start_char, size_t end_char) {
    return std::to_string(start_char / kCharsPerPage + 1) + "-" +
           std::to_string(end_char / kCharsPerPage + 1);
}

class DocumentChunker::Impl {
public:
    explicit Impl(const ChunkingConfig& config)
        : config_(config), strategy_(make_strategy(config.strategy)) {}

    ChunkingConfig config_;
    std::unique_ptr<ChunkStrategy> strategy_;
};

DocumentChunker::DocumentChunker(const ChunkingConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {}

DocumentChunker::~DocumentChunker() = default;

DocumentChunker::DocumentChunker(DocumentChunker&&) noexcept = default;
DocumentChunker& DocumentChunker::operator=(DocumentChunker&&) noexcept = default;

std::vector<Chunk> DocumentChunker::chunk(const std::string& text) const {
    return pImpl->strategy_->split(text, pImpl->config_);
}

ChunkingConfig DocumentChunker::get_config() const {
    return pImpl->config_;
}

void DocumentChunker::set_config(const ChunkingConfig& config) {
    pImpl = std::make_unique<Impl>(config);
}

std::vector<Chunk> chunk_document(const std::string& text, const ChunkingConfig& config) {
    return DocumentChunker(config).chunk(text);
}

} // namespace doc_chunker
