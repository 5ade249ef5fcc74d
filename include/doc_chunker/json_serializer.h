#pragma once

#include "doc_chunker/chunker.h"
#include "doc_chunker/document_cleaner.h"
#include "doc_chunker/structure_identifier.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace doc_chunker {

// Concepts reported for chunks whose tagger extracted none
extern const std::vector<std::string> kDefaultKeyConcepts;

class JsonSerializer {
public:
    // {original_length, cleaned_length, reduction_percentage, removed_elements}
    static nlohmann::json to_json(const CleaningStats& stats);

    // {has_toc, <non-empty categories>: [{title, position}]}
    static nlohmann::json to_json(const DocumentStructure& structure);

    // Record handed to the indexing collaborator:
    // {id, content, position, metadata{page_range, section, key_concepts, start_char, end_char}}
    static nlohmann::json format_chunk(const Chunk& chunk, size_t index);
    static nlohmann::json format_chunks(const std::vector<Chunk>& chunks);

    // Serialize chunks to a JSON array (RapidJSON writer)
    static std::string serialize_chunks(const std::vector<Chunk>& chunks, bool pretty = true);

private:
    static std::string chunk_id(size_t index);
    static std::string chunk_position(size_t index);
};

} // namespace doc_chunker
