#pragma once

#include "doc_chunker/chunker.h"
#include "doc_chunker/document_cleaner.h"
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

namespace doc_chunker {

struct ProcessorConfig {
    CleaningOptions cleaning;
    ChunkingConfig chunking;
    size_t thread_count = std::thread::hardware_concurrency();
    bool verbose = false;
};

// Reads the request-body layout used by the surrounding API:
//   {"chunking": {"strategy", "chunkSize", "overlapSize", "minChunkSize", "respectBoundaries"},
//    "cleaning": {"removeHeaders", "removeFooters", "removePageNumbers",
//                 "removeExtraWhitespace", "normalizeQuotes", "fixHyphenation"}}
// Missing keys keep the values already in `base`. Throws std::invalid_argument
// on wrong types or invalid chunking values.
ProcessorConfig config_from_json(const nlohmann::json& json,
                                 const ProcessorConfig& base = ProcessorConfig{});

nlohmann::json config_to_json(const ProcessorConfig& config);

// Throws std::runtime_error when the file is missing or not valid JSON
ProcessorConfig load_config(const std::string& path,
                            const ProcessorConfig& base = ProcessorConfig{});

} // namespace doc_chunker
