#include <benchmark/benchmark.h>
#include <doc_chunker/chunker.h>
#include <doc_chunker/document_cleaner.h>
#include <doc_chunker/document_processor.h>
#include <doc_chunker/json_serializer.h>
#include <doc_chunker/structure_identifier.h>
#include <string>

namespace {

// Synthetic paginated document: a running header, numbered headings,
// prose paragraphs with hyphenated line breaks and a page number per page.
std::string make_document(int pages) {
    std::string text;
    for (int page = 1; page <= pages; ++page) {
        text += "Rapport confidentiel - page " + std::to_string(page) + "\n";
        text += std::to_string(page) + ". Chapitre sur la communication\n\n";
        for (int paragraph = 0; paragraph < 4; ++paragraph) {
            text += "Le feedback circulaire entre les membres de la famille est observ\xC3\xA9 "
                    "dans chaque s\xC3\xA9" "ance. Les th\xC3\xA9rapeutes du Mental Research "
                    "Institute d\xC3\xA9" "crivent une inter-\naction syst\xC3\xA9mique. "
                    "La m\xC3\xA9thode repose sur l'analyse des \xC2\xAB boucles \xC2\xBB "
                    "de r\xC3\xA9troaction.\n\n";
        }
        text += "Figure " + std::to_string(page) + " Sch\xC3\xA9ma du syst\xC3\xA8me\n";
        text += "\n\n" + std::to_string(page) + "\n\f";
    }
    return text;
}

} // namespace

static void BM_CleanDocument(benchmark::State& state) {
    const std::string text = make_document(static_cast<int>(state.range(0)));

    for (auto _ : state) {
        auto result = doc_chunker::clean_document(text);
        benchmark::DoNotOptimize(result);
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * text.size());
}
BENCHMARK(BM_CleanDocument)->Range(1, 256);

static void BM_IdentifyStructure(benchmark::State& state) {
    const std::string text = doc_chunker::clean_document(
        make_document(static_cast<int>(state.range(0)))).text;
    doc_chunker::StructureIdentifier identifier;

    for (auto _ : state) {
        auto structure = identifier.identify(text);
        benchmark::DoNotOptimize(structure);
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * text.size());
}
BENCHMARK(BM_IdentifyStructure)->Range(1, 256);

static void BM_ChunkStrategy(benchmark::State& state) {
    const std::string text = doc_chunker::clean_document(make_document(64)).text;

    doc_chunker::ChunkingConfig config;
    config.strategy = static_cast<doc_chunker::ChunkingStrategy>(state.range(0));
    config.chunk_size = static_cast<int>(state.range(1));
    config.chunk_overlap = config.chunk_size / 8;
    config.min_chunk_size = config.chunk_size / 4;
    doc_chunker::DocumentChunker chunker(config);

    size_t chunk_count = 0;
    for (auto _ : state) {
        auto chunks = chunker.chunk(text);
        chunk_count = chunks.size();
        benchmark::DoNotOptimize(chunks);
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * text.size());
    state.counters["chunks"] = static_cast<double>(chunk_count);
}
BENCHMARK(BM_ChunkStrategy)->ArgsProduct({{0, 1, 2}, {400, 800, 1600}});

static void BM_SerializeChunks(benchmark::State& state) {
    const std::string text = doc_chunker::clean_document(make_document(64)).text;
    auto chunks = doc_chunker::chunk_document(text);

    for (auto _ : state) {
        auto json = doc_chunker::JsonSerializer::serialize_chunks(chunks, state.range(0) != 0);
        benchmark::DoNotOptimize(json);
    }

    state.counters["chunks"] = static_cast<double>(chunks.size());
}
BENCHMARK(BM_SerializeChunks)->Arg(0)->Arg(1);

static void BM_ProcessText(benchmark::State& state) {
    const std::string text = make_document(static_cast<int>(state.range(0)));
    doc_chunker::ProcessorConfig config;
    config.thread_count = 1;
    doc_chunker::DocumentProcessor processor(config);

    for (auto _ : state) {
        auto record = processor.process_text(text, "synthetic.txt");
        benchmark::DoNotOptimize(record);
    }

    auto stats = processor.get_stats();
    state.counters["chunks_per_document"] = stats["average_chunks_per_document"].get<double>();
}
BENCHMARK(BM_ProcessText)->Range(1, 64);

BENCHMARK_MAIN();
