#include "doc_chunker/document_processor.h"
#include "doc_chunker/json_serializer.h"
#include "doc_chunker/pipeline.h"
#include "doc_chunker/text_extractor.h"
#include "doc_chunker/thread_pool.h"
#include <atomic>
#include <chrono>
#include <exception>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <future>
#include <iostream>
#include <mutex>
#include <thread>

namespace doc_chunker {

namespace {

size_t resolve_thread_count(size_t requested) {
    if (requested > 0) {
        return requested;
    }
    size_t hardware = std::thread::hardware_concurrency();
    return hardware > 0 ? hardware : 1;
}

std::string document_id(const std::string& name, const std::string& text) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%016zx", std::hash<std::string>{}(name + '\0' + text));
    return std::string("doc-") + buffer;
}

} // namespace

class DocumentProcessor::Impl {
public:
    explicit Impl(const ProcessorConfig& config)
        : config_(config),
          chunker_(config.chunking),
          thread_pool_(resolve_thread_count(config.thread_count)) {
        stats_["documents_processed"] = 0;
        stats_["chunks_created"] = 0;
        stats_["characters_processed"] = 0;
        stats_["total_processing_time_ms"] = 0;
    }

    nlohmann::json process(const std::string& path) {
        if (config_.verbose) {
            std::cerr << "[DocumentProcessor::process] Extracting " << path << std::endl;
        }

        TextExtractor extractor;
        ExtractedDocument extracted = extractor.extract(path);

        auto filename = std::filesystem::path(path).filename().string();
        return process_text(extracted.text, filename, extracted.metadata);
    }

    nlohmann::json process_text(const std::string& text, const std::string& name,
                                const nlohmann::json& metadata) {
        auto start_time = std::chrono::high_resolution_clock::now();

        CleanedDocument cleaned = clean_and_structure(text, config_.cleaning);
        if (config_.verbose) {
            std::cerr << "[DocumentProcessor::process_text] " << name << ": cleaned "
                      << cleaned.stats.original_length << " -> " << cleaned.stats.cleaned_length
                      << " chars (" << cleaned.stats.reduction_percentage << "% removed)" << std::endl;
        }

        std::vector<Chunk> chunks = chunker_.chunk(cleaned.text);
        if (config_.verbose) {
            std::cerr << "[DocumentProcessor::process_text] " << name << ": "
                      << chunks.size() << " chunks (" << to_string(config_.chunking.strategy)
                      << ")" << std::endl;
        }

        nlohmann::json document_metadata = metadata.is_object() ? metadata : nlohmann::json::object();

        nlohmann::json record;
        record["id"] = document_id(name, text);
        record["filename"] = name;
        record["fileType"] =
            document_metadata.value("file_type", std::filesystem::path(name).extension().string());
        record["fileSize"] = document_metadata.value("file_size", static_cast<uint64_t>(text.size()));
        record["status"] = "completed";
        record["chunks"] = JsonSerializer::format_chunks(chunks);

        document_metadata["cleaning_stats"] = JsonSerializer::to_json(cleaned.stats);
        document_metadata["document_structure"] = JsonSerializer::to_json(cleaned.structure);
        record["metadata"] = std::move(document_metadata);

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_["documents_processed"] = stats_["documents_processed"].get<uint64_t>() + 1;
            stats_["chunks_created"] = stats_["chunks_created"].get<uint64_t>() + chunks.size();
            stats_["characters_processed"] =
                stats_["characters_processed"].get<uint64_t>() + cleaned.stats.original_length;
            stats_["total_processing_time_ms"] =
                stats_["total_processing_time_ms"].get<int64_t>() + duration.count();
        }

        return record;
    }

    std::vector<nlohmann::json> process_batch(const std::vector<std::string>& paths,
                                              ProgressCallback progress) {
        std::vector<nlohmann::json> results(paths.size());
        std::atomic<size_t> completed{0};
        std::mutex progress_mutex;

        std::vector<std::future<void>> futures;
        futures.reserve(paths.size());

        for (size_t i = 0; i < paths.size(); ++i) {
            futures.push_back(thread_pool_.submit([this, i, &paths, &results, &completed,
                                                   &progress_mutex, &progress]() {
                const std::string& path = paths[i];
                try {
                    results[i] = process(path);
                } catch (const std::exception& e) {
                    if (config_.verbose) {
                        std::cerr << "[DocumentProcessor::process_batch] " << path
                                  << " failed: " << e.what() << std::endl;
                    }
                    results[i] = {{"error", e.what()}, {"file", path}};
                }

                size_t done = ++completed;
                if (progress) {
                    std::lock_guard<std::mutex> lock(progress_mutex);
                    progress(done, paths.size());
                }
            }));
        }

        // Every task references this frame, so all of them must finish before
        // a failure is rethrown
        std::exception_ptr failure;
        for (auto& future : futures) {
            try {
                future.get();
            } catch (...) {
                if (!failure) {
                    failure = std::current_exception();
                }
            }
        }
        if (failure) {
            std::rethrow_exception(failure);
        }

        return results;
    }

    nlohmann::json get_stats() const {
        nlohmann::json stats;
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats = stats_;
        }

        auto documents = stats["documents_processed"].get<uint64_t>();
        if (documents > 0) {
            auto total_ms = stats["total_processing_time_ms"].get<int64_t>();
            stats["average_processing_time_ms"] =
                static_cast<double>(total_ms) / static_cast<double>(documents);
            stats["average_chunks_per_document"] =
                static_cast<double>(stats["chunks_created"].get<uint64_t>()) /
                static_cast<double>(documents);
        }

        return stats;
    }

    const ProcessorConfig& config() const { return config_; }

private:
    ProcessorConfig config_;
    DocumentChunker chunker_;
    ThreadPool thread_pool_;
    mutable std::mutex stats_mutex_;
    nlohmann::json stats_;
};

DocumentProcessor::DocumentProcessor(const ProcessorConfig& config) {
    validate(config.chunking);
    pImpl = std::make_unique<Impl>(config);
}

DocumentProcessor::~DocumentProcessor() = default;

nlohmann::json DocumentProcessor::process(const std::string& path) {
    return pImpl->process(path);
}

nlohmann::json DocumentProcessor::process_text(const std::string& text, const std::string& name,
                                               const nlohmann::json& metadata) {
    return pImpl->process_text(text, name, metadata);
}

std::vector<nlohmann::json> DocumentProcessor::process_batch(const std::vector<std::string>& paths,
                                                             ProgressCallback progress) {
    return pImpl->process_batch(paths, progress);
}

nlohmann::json DocumentProcessor::get_stats() const {
    return pImpl->get_stats();
}

const ProcessorConfig& DocumentProcessor::config() const {
    return pImpl->config();
}

} // namespace doc_chunker
