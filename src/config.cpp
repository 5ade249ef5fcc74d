#include "doc_chunker/config.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace doc_chunker {

namespace {

template <typename T>
void read_field(const nlohmann::json& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = section.at(key).get<T>();
    }
}

} // namespace

ProcessorConfig config_from_json(const nlohmann::json& json, const ProcessorConfig& base) {
    ProcessorConfig config = base;

    if (!json.is_object()) {
        throw std::invalid_argument("configuration must be a JSON object");
    }

    try {
        if (json.contains("chunking")) {
            const auto& chunking = json.at("chunking");
            if (chunking.contains("strategy")) {
                config.chunking.strategy = parse_strategy(chunking.at("strategy").get<std::string>());
            }
            read_field(chunking, "chunkSize", config.chunking.chunk_size);
            read_field(chunking, "overlapSize", config.chunking.chunk_overlap);
            read_field(chunking, "minChunkSize", config.chunking.min_chunk_size);
            read_field(chunking, "respectBoundaries", config.chunking.respect_boundaries);
        }

        if (json.contains("cleaning")) {
            const auto& cleaning = json.at("cleaning");
            read_field(cleaning, "removeHeaders", config.cleaning.remove_headers);
            read_field(cleaning, "removeFooters", config.cleaning.remove_footers);
            read_field(cleaning, "removePageNumbers", config.cleaning.remove_page_numbers);
            read_field(cleaning, "removeExtraWhitespace", config.cleaning.remove_extra_whitespace);
            read_field(cleaning, "normalizeQuotes", config.cleaning.normalize_quotes);
            read_field(cleaning, "fixHyphenation", config.cleaning.fix_hyphenation);
        }

        if (json.contains("threads")) {
            config.thread_count = json.at("threads").get<size_t>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("invalid configuration: ") + e.what());
    }

    validate(config.chunking);
    return config;
}

nlohmann::json config_to_json(const ProcessorConfig& config) {
    return {
        {"chunking", {
            {"strategy", to_string(config.chunking.strategy)},
            {"chunkSize", config.chunking.chunk_size},
            {"overlapSize", config.chunking.chunk_overlap},
            {"minChunkSize", config.chunking.min_chunk_size},
            {"respectBoundaries", config.chunking.respect_boundaries}
        }},
        {"cleaning", {
            {"removeHeaders", config.cleaning.remove_headers},
            {"removeFooters", config.cleaning.remove_footers},
            {"removePageNumbers", config.cleaning.remove_page_numbers},
            {"removeExtraWhitespace", config.cleaning.remove_extra_whitespace},
            {"normalizeQuotes", config.cleaning.normalize_quotes},
            {"fixHyphenation", config.cleaning.fix_hyphenation}
        }},
        {"threads", config.thread_count}
    };
}

ProcessorConfig load_config(const std::string& path, const ProcessorConfig& base) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Config file not found: " + path);
    }

    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }

    return config_from_json(json, base);
}

} // namespace doc_chunker
