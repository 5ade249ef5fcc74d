#include "doc_chunker/json_serializer.h"
#include "doc_chunker/json_types.h"
#include "doc_chunker/tagger.h"
#include <cstdint>
#include <utility>

namespace doc_chunker {

const std::vector<std::string> kDefaultKeyConcepts = {"communication circulaire", "feedback", "MRI"};

namespace {

nlohmann::json entries_to_json(const std::vector<StructureEntry>& entries) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& entry : entries) {
        array.push_back({{"title", entry.title}, {"position", entry.line_index}});
    }
    return array;
}

const std::vector<std::string>& concepts_or_default(const Chunk& chunk) {
    return chunk.key_concepts.empty() ? kDefaultKeyConcepts : chunk.key_concepts;
}

} // namespace

nlohmann::json JsonSerializer::to_json(const CleaningStats& stats) {
    return {
        {"original_length", stats.original_length},
        {"cleaned_length", stats.cleaned_length},
        {"reduction_percentage", stats.reduction_percentage},
        {"removed_elements", stats.removed_elements}
    };
}

nlohmann::json JsonSerializer::to_json(const DocumentStructure& structure) {
    nlohmann::json result;
    result["has_toc"] = structure.has_toc;

    // Empty categories are omitted
    const std::pair<const char*, const std::vector<StructureEntry>*> categories[] = {
        {"chapters", &structure.chapters},
        {"sections", &structure.sections},
        {"subsections", &structure.subsections},
        {"figures", &structure.figures},
        {"tables", &structure.tables},
    };
    for (const auto& [name, entries] : categories) {
        if (!entries->empty()) {
            result[name] = entries_to_json(*entries);
        }
    }

    return result;
}

nlohmann::json JsonSerializer::format_chunk(const Chunk& chunk, size_t index) {
    nlohmann::json record;
    record["id"] = chunk_id(index);
    record["content"] = chunk.text;
    record["position"] = chunk_position(index);
    record["metadata"] = {
        {"page_range", chunk.page_range},
        {"section", chunk.section.empty() ? std::string(kUnspecifiedSection) : chunk.section},
        {"key_concepts", concepts_or_default(chunk)},
        {"start_char", chunk.start_char},
        {"end_char", chunk.end_char}
    };
    return record;
}

nlohmann::json JsonSerializer::format_chunks(const std::vector<Chunk>& chunks) {
    nlohmann::json output = nlohmann::json::array();

    for (size_t i = 0; i < chunks.size(); ++i) {
        output.push_back(format_chunk(chunks[i], i));
    }

    return output;
}

std::string JsonSerializer::serialize_chunks(const std::vector<Chunk>& chunks, bool pretty) {
    JsonBuilder builder(rapidjson::kArrayType);
    auto& alloc = builder.allocator();

    for (size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];

        JsonValue metadata(rapidjson::kObjectType);
        metadata.AddMember("page_range", builder.string(chunk.page_range), alloc);
        metadata.AddMember("section",
                           builder.string(chunk.section.empty() ? std::string(kUnspecifiedSection)
                                                                : chunk.section),
                           alloc);
        metadata.AddMember("key_concepts", builder.string_array(concepts_or_default(chunk)), alloc);
        metadata.AddMember("start_char", static_cast<uint64_t>(chunk.start_char), alloc);
        metadata.AddMember("end_char", static_cast<uint64_t>(chunk.end_char), alloc);

        JsonValue record(rapidjson::kObjectType);
        record.AddMember("id", builder.string(chunk_id(i)), alloc);
        record.AddMember("content", builder.string(chunk.text), alloc);
        record.AddMember("position", builder.string(chunk_position(i)), alloc);
        record.AddMember("metadata", metadata, alloc);

        builder.document()->PushBack(record, alloc);
    }

    return builder.serialize(pretty);
}

std::string JsonSerializer::chunk_id(size_t index) {
    return "chunk-" + std::to_string(index);
}

std::string JsonSerializer::chunk_position(size_t index) {
    return "chunk_" + std::to_string(index + 1);
}

} // namespace doc_chunker
