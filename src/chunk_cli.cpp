#include <doc_chunker/config.h>
#include <doc_chunker/document_processor.h>
#include <doc_chunker/text_extractor.h>
#include <doc_chunker/text_normalizer.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <getopt.h>
#include <iomanip>
#include <iostream>
#include <cstdint>
#include <numeric>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using namespace doc_chunker;

namespace {

// Flags given on the command line; unset values fall back to the config file
struct CLIOptions {
    std::string input_path;
    std::string output_dir;
    std::string config_file;
    std::optional<std::string> strategy;
    std::optional<int> chunk_size;
    std::optional<int> overlap;
    std::optional<int> min_chunk_size;
    std::optional<int> thread_count;
    bool no_boundaries = false;
    CleaningOptions disabled_steps{false, false, false, false, false, false};
    bool verbose = false;
    bool quiet = false;
    bool analyze = true;
    bool help = false;
    bool version = false;
};

enum LongOption {
    kStrategy = 1001,
    kChunkSize,
    kOverlap,
    kMinChunkSize,
    kThreads,
    kConfig,
    kNoBoundaries,
    kNoAnalyze,
    kVersion,
    kNoCleanHeaders,
    kNoCleanFooters,
    kNoCleanPageNumbers,
    kNoCleanWhitespace,
    kNoCleanQuotes,
    kNoCleanHyphenation
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n";
    std::cout << "\nRequired:\n";
    std::cout << "  -i, --input PATH           Input .txt/.md file or directory\n";
    std::cout << "\nOptional:\n";
    std::cout << "  -o, --output DIR           Output directory (default: next to input)\n";
    std::cout << "  --config FILE              JSON configuration file\n";
    std::cout << "  --strategy NAME            fixed, paragraph or semantic (default: semantic)\n";
    std::cout << "  --chunk-size N             Target characters per chunk (default: 800)\n";
    std::cout << "  --overlap N                Characters carried between chunks (default: 100)\n";
    std::cout << "  --min-chunk-size N         Minimum characters per chunk (default: 200)\n";
    std::cout << "  --no-boundaries            Do not start new chunks at headings\n";
    std::cout << "  --no-clean-headers         Keep page headers\n";
    std::cout << "  --no-clean-footers         Keep page footers\n";
    std::cout << "  --no-clean-page-numbers    Keep page numbers\n";
    std::cout << "  --no-clean-whitespace      Keep extra whitespace\n";
    std::cout << "  --no-clean-quotes          Keep typographic quotes\n";
    std::cout << "  --no-clean-hyphenation     Keep hyphenated line breaks\n";
    std::cout << "  --threads N                Number of threads (default: auto-detect)\n";
    std::cout << "  -v, --verbose              Verbose output\n";
    std::cout << "  -q, --quiet                Quiet mode (minimal output)\n";
    std::cout << "  --no-analyze               Skip chunk distribution analysis\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  --version                  Show version information\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " -i article.txt\n";
    std::cout << "  " << program_name << " -i notes/ -o out/ --strategy paragraph --chunk-size 1200\n";
    std::cout << "  " << program_name << " --input thesis.md --config chunking.json --verbose\n";
}

void print_version() {
    std::cout << "doc-chunker doc_chunker_cli version 1.0.0\n";
    std::cout << "Built with C++17, nlohmann/json and RapidJSON\n";
}

int parse_int(const char* flag, const char* value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != std::string(value).size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string(flag) + " expects an integer, got '" + value + "'");
    }
}

CLIOptions parse_arguments(int argc, char* argv[]) {
    CLIOptions options;

    const char* short_opts = "i:o:vqh";
    const struct option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"output", required_argument, nullptr, 'o'},
        {"config", required_argument, nullptr, kConfig},
        {"strategy", required_argument, nullptr, kStrategy},
        {"chunk-size", required_argument, nullptr, kChunkSize},
        {"overlap", required_argument, nullptr, kOverlap},
        {"min-chunk-size", required_argument, nullptr, kMinChunkSize},
        {"threads", required_argument, nullptr, kThreads},
        {"no-boundaries", no_argument, nullptr, kNoBoundaries},
        {"no-clean-headers", no_argument, nullptr, kNoCleanHeaders},
        {"no-clean-footers", no_argument, nullptr, kNoCleanFooters},
        {"no-clean-page-numbers", no_argument, nullptr, kNoCleanPageNumbers},
        {"no-clean-whitespace", no_argument, nullptr, kNoCleanWhitespace},
        {"no-clean-quotes", no_argument, nullptr, kNoCleanQuotes},
        {"no-clean-hyphenation", no_argument, nullptr, kNoCleanHyphenation},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"no-analyze", no_argument, nullptr, kNoAnalyze},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, kVersion},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, &option_index)) != -1) {
        switch (opt) {
            case 'i':
                options.input_path = optarg;
                break;
            case 'o':
                options.output_dir = optarg;
                break;
            case kConfig:
                options.config_file = optarg;
                break;
            case kStrategy:
                parse_strategy(optarg);  // reject unknown names early
                options.strategy = optarg;
                break;
            case kChunkSize:
                options.chunk_size = parse_int("--chunk-size", optarg);
                break;
            case kOverlap:
                options.overlap = parse_int("--overlap", optarg);
                break;
            case kMinChunkSize:
                options.min_chunk_size = parse_int("--min-chunk-size", optarg);
                break;
            case kThreads:
                options.thread_count = parse_int("--threads", optarg);
                if (*options.thread_count < 0) {
                    throw std::invalid_argument("thread count cannot be negative");
                }
                break;
            case kNoBoundaries:
                options.no_boundaries = true;
                break;
            case kNoCleanHeaders:
                options.disabled_steps.remove_headers = true;
                break;
            case kNoCleanFooters:
                options.disabled_steps.remove_footers = true;
                break;
            case kNoCleanPageNumbers:
                options.disabled_steps.remove_page_numbers = true;
                break;
            case kNoCleanWhitespace:
                options.disabled_steps.remove_extra_whitespace = true;
                break;
            case kNoCleanQuotes:
                options.disabled_steps.normalize_quotes = true;
                break;
            case kNoCleanHyphenation:
                options.disabled_steps.fix_hyphenation = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case kNoAnalyze:
                options.analyze = false;
                break;
            case 'h':
                options.help = true;
                return options;
            case kVersion:
                options.version = true;
                return options;
            default:
                throw std::invalid_argument("Unknown option");
        }
    }

    if (options.input_path.empty()) {
        throw std::invalid_argument("Input path is required");
    }

    if (options.verbose && options.quiet) {
        throw std::invalid_argument("Cannot use both --verbose and --quiet");
    }

    if (options.output_dir.empty()) {
        fs::path input(options.input_path);
        fs::path parent = fs::is_directory(input) ? input : input.parent_path();
        options.output_dir = parent.empty() ? "." : parent.string();
    }

    return options;
}

// Config file first, then command-line overrides, then validation
ProcessorConfig build_config(const CLIOptions& options) {
    ProcessorConfig config;
    config.thread_count = 0;
    if (!options.config_file.empty()) {
        config = load_config(options.config_file, config);
    }

    if (options.strategy) config.chunking.strategy = parse_strategy(*options.strategy);
    if (options.chunk_size) config.chunking.chunk_size = *options.chunk_size;
    if (options.overlap) config.chunking.chunk_overlap = *options.overlap;
    if (options.min_chunk_size) config.chunking.min_chunk_size = *options.min_chunk_size;
    if (options.thread_count) config.thread_count = static_cast<size_t>(*options.thread_count);
    if (options.no_boundaries) config.chunking.respect_boundaries = false;

    const CleaningOptions& off = options.disabled_steps;
    if (off.remove_headers) config.cleaning.remove_headers = false;
    if (off.remove_footers) config.cleaning.remove_footers = false;
    if (off.remove_page_numbers) config.cleaning.remove_page_numbers = false;
    if (off.remove_extra_whitespace) config.cleaning.remove_extra_whitespace = false;
    if (off.normalize_quotes) config.cleaning.normalize_quotes = false;
    if (off.fix_hyphenation) config.cleaning.fix_hyphenation = false;

    config.verbose = options.verbose;

    if (config.chunking.min_chunk_size > config.chunking.chunk_size) {
        throw std::invalid_argument("min-chunk-size cannot be greater than chunk-size");
    }
    validate(config.chunking);
    return config;
}

void write_json(const fs::path& path, const nlohmann::json& value) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot write " + path.string());
    }
    out << value.dump(2) << "\n";
}

void analyze_chunk_distribution(const std::vector<nlohmann::json>& records) {
    std::vector<size_t> sizes;
    for (const auto& record : records) {
        if (!record.contains("chunks")) {
            continue;
        }
        for (const auto& chunk : record["chunks"]) {
            sizes.push_back(utf8_length(chunk["content"].get<std::string>()));
        }
    }

    if (sizes.empty()) {
        std::cout << "\nNo chunks created\n";
        return;
    }

    std::sort(sizes.begin(), sizes.end());
    double average = std::accumulate(sizes.begin(), sizes.end(), 0.0) / sizes.size();

    std::cout << "\n=== Chunk Distribution Analysis ===\n";
    std::cout << "Total chunks: " << sizes.size() << "\n";
    std::cout << "Min characters: " << sizes.front() << "\n";
    std::cout << "Max characters: " << sizes.back() << "\n";
    std::cout << "Average characters: " << static_cast<size_t>(average) << "\n";

    std::cout << "\nQuintiles:\n";
    for (int p = 20; p <= 80; p += 20) {
        size_t idx = (sizes.size() - 1) * p / 100;
        std::cout << "  " << p << "th percentile: " << sizes[idx] << " characters\n";
    }

    const std::vector<std::pair<size_t, const char*>> buckets = {
        {200, "1-200"}, {400, "201-400"}, {600, "401-600"},
        {800, "601-800"}, {1000, "801-1000"}, {SIZE_MAX, "1001+"}
    };
    std::vector<int> counts(buckets.size(), 0);
    for (size_t size : sizes) {
        for (size_t b = 0; b < buckets.size(); ++b) {
            if (size <= buckets[b].first) {
                counts[b]++;
                break;
            }
        }
    }

    std::cout << "\nSize Range Distribution:\n";
    for (size_t b = 0; b < buckets.size(); ++b) {
        if (counts[b] == 0) {
            continue;
        }
        double percentage = (counts[b] * 100.0) / sizes.size();
        std::cout << "  " << std::setw(10) << buckets[b].second << " chars: "
                  << std::setw(5) << counts[b] << " chunks ("
                  << std::fixed << std::setprecision(1) << percentage << "%)\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        CLIOptions options = parse_arguments(argc, argv);

        if (options.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (options.version) {
            print_version();
            return 0;
        }

        ProcessorConfig config = build_config(options);
        std::vector<std::string> inputs = TextExtractor::collect(options.input_path);
        std::vector<std::string> names = output_names(inputs, options.input_path);

        fs::path output_dir(options.output_dir);
        if (!fs::exists(output_dir)) {
            if (options.verbose) {
                std::cerr << "[main] Creating output directory: " << output_dir << "\n";
            }
            fs::create_directories(output_dir);
        }

        if (!options.quiet) {
            std::cout << "Processing: " << options.input_path << " (" << inputs.size()
                      << (inputs.size() == 1 ? " document" : " documents") << ")\n";
            std::cout << "Output: " << output_dir.string() << "\n";
            std::cout << "Configuration:\n";
            std::cout << "  Strategy: " << to_string(config.chunking.strategy) << "\n";
            std::cout << "  Chunk size: " << config.chunking.chunk_size << " characters\n";
            std::cout << "  Min chunk size: " << config.chunking.min_chunk_size << " characters\n";
            std::cout << "  Overlap: " << config.chunking.chunk_overlap << " characters\n";
            std::cout << "  Respect boundaries: " << (config.chunking.respect_boundaries ? "yes" : "no") << "\n";
            std::cout << "  Threads: " << (config.thread_count > 0 ?
                std::to_string(config.thread_count) : "auto (" +
                std::to_string(std::thread::hardware_concurrency()) + ")") << "\n";
            std::cout << "\n";
        }

        auto start = std::chrono::high_resolution_clock::now();

        DocumentProcessor processor(config);
        auto records = processor.process_batch(inputs, [&options](size_t done, size_t total) {
            if (options.verbose) {
                std::cerr << "[main] " << done << "/" << total << " documents processed\n";
            }
        });

        size_t failures = 0;
        size_t total_chunks = 0;
        for (size_t i = 0; i < records.size(); ++i) {
            const auto& record = records[i];
            if (record.contains("error")) {
                ++failures;
                std::cerr << "Error: " << record["file"].get<std::string>() << ": "
                          << record["error"].get<std::string>() << "\n";
                continue;
            }

            write_json(output_dir / (names[i] + "_chunks.json"), record["chunks"]);
            write_json(output_dir / (names[i] + "_document.json"), record);
            total_chunks += record["chunks"].size();
        }

        auto end = std::chrono::high_resolution_clock::now();
        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        if (options.analyze && !options.quiet) {
            analyze_chunk_distribution(records);
        }

        if (!options.quiet) {
            nlohmann::json stats = processor.get_stats();
            std::cout << "\n=== Processing Complete ===\n";
            std::cout << "Documents processed: " << stats["documents_processed"] << "\n";
            if (failures > 0) {
                std::cout << "Documents failed: " << failures << "\n";
            }
            std::cout << "Chunks created: " << total_chunks << "\n";
            std::cout << "Characters processed: " << stats["characters_processed"] << "\n";
            std::cout << "Total time: " << total_duration.count() << "ms\n";
            std::cout << "Output saved to: " << output_dir.string() << "\n";
        } else if (failures == 0) {
            std::cout << "SUCCESS|" << options.input_path << "|"
                      << total_chunks << "|"
                      << total_duration.count() << "\n";
        }

        return failures == 0 ? 0 : 1;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: Invalid argument - " << e.what() << "\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
