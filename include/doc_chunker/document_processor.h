#pragma once

#include "doc_chunker/config.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace doc_chunker {

using ProgressCallback = std::function<void(size_t current, size_t total)>;

// Runs extraction, cleaning, structure identification and chunking for whole
// documents and produces the document record consumed by the indexing side.
class DocumentProcessor {
public:
    // Throws std::invalid_argument when config.chunking is invalid
    explicit DocumentProcessor(const ProcessorConfig& config = ProcessorConfig{});
    ~DocumentProcessor();

    // {id, filename, fileType, fileSize, status, chunks, metadata}
    // Throws std::runtime_error for missing or unsupported files.
    nlohmann::json process(const std::string& path);

    // Same record for text already in memory. `metadata` is merged into the
    // record's metadata ahead of cleaning_stats and document_structure.
    nlohmann::json process_text(const std::string& text, const std::string& name,
                                const nlohmann::json& metadata = nlohmann::json::object());

    // One result per path, in input order. A failing document yields
    // {"error", "file"} instead of aborting the batch. Anything else thrown
    // from a task, such as by `progress`, is rethrown after every task ends.
    std::vector<nlohmann::json> process_batch(const std::vector<std::string>& paths,
                                              ProgressCallback progress = nullptr);

    // documents_processed, chunks_created, characters_processed,
    // total_processing_time_ms and averages once a document was processed
    nlohmann::json get_stats() const;

    const ProcessorConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace doc_chunker
