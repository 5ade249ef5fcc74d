#include <gtest/gtest.h>
#include <doc_chunker/document_processor.h>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>

namespace fs = std::filesystem;
using namespace doc_chunker;

class DocumentProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "doc_chunker_processor_test";
        fs::create_directories(test_dir_);

        config_.chunking.chunk_size = 200;
        config_.chunking.chunk_overlap = 20;
        config_.chunking.min_chunk_size = 50;
        config_.thread_count = 2;
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    // One page: running header, body with two headings, footer
    std::string CreateText() {
        std::string text = "Rapport confidentiel\nDraft\nIntroduction\n\n";
        for (int i = 0; i < 8; ++i) {
            text += "Le feedback circulaire entre les membres de la famille maintient "
                    "l'\xC3\xA9quilibre du syst\xC3\xA8me. Chaque r\xC3\xA9" "action nourrit la suivante.\n\n";
        }
        text += "Conclusion\n\nLa synth\xC3\xA8se montre le r\xC3\xB4le du MRI de Palo Alto.\n";
        text += "www.mri.org\n\xC2\xA9 2024 MRI";
        return text;
    }

    std::string WriteFile(const std::string& name, const std::string& content) {
        auto path = test_dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path.string();
    }

    fs::path test_dir_;
    ProcessorConfig config_;
};

TEST_F(DocumentProcessorTest, RejectsInvalidConfig) {
    ProcessorConfig config;
    config.chunking.chunk_overlap = config.chunking.chunk_size;
    EXPECT_THROW(DocumentProcessor processor(config), std::invalid_argument);
}

TEST_F(DocumentProcessorTest, ProcessTextBuildsRecord) {
    DocumentProcessor processor(config_);
    const std::string text = CreateText();

    auto record = processor.process_text(text, "therapie.txt");

    EXPECT_EQ(record["id"].get<std::string>().rfind("doc-", 0), 0u);
    EXPECT_EQ(record["filename"], "therapie.txt");
    EXPECT_EQ(record["fileType"], ".txt");
    EXPECT_EQ(record["fileSize"], text.size());
    EXPECT_EQ(record["status"], "completed");

    ASSERT_TRUE(record["chunks"].is_array());
    ASSERT_GT(record["chunks"].size(), 1u);
    EXPECT_EQ(record["chunks"][0]["id"], "chunk-0");
    EXPECT_EQ(record["chunks"][0]["metadata"]["section"], "Introduction");

    const auto& metadata = record["metadata"];
    ASSERT_TRUE(metadata.contains("cleaning_stats"));
    ASSERT_TRUE(metadata.contains("document_structure"));
    EXPECT_GT(metadata["cleaning_stats"]["original_length"].get<size_t>(), 0u);
    EXPECT_TRUE(metadata["document_structure"].contains("sections"));

    auto removed_elements = metadata["cleaning_stats"]["removed_elements"];
    EXPECT_NE(std::find(removed_elements.begin(), removed_elements.end(), "headers"),
              removed_elements.end());
    EXPECT_NE(std::find(removed_elements.begin(), removed_elements.end(), "footers"),
              removed_elements.end());
    EXPECT_EQ(record["chunks"][0]["content"].get<std::string>().find("confidentiel"),
              std::string::npos);
}

TEST_F(DocumentProcessorTest, ProcessTextMergesMetadata) {
    DocumentProcessor processor(config_);

    auto record = processor.process_text(CreateText(), "upload.bin",
                                         {{"title", "Upload"}, {"file_type", ".md"}});

    EXPECT_EQ(record["fileType"], ".md");
    EXPECT_EQ(record["metadata"]["title"], "Upload");
    EXPECT_TRUE(record["metadata"].contains("cleaning_stats"));
}

TEST_F(DocumentProcessorTest, DocumentIdIsStable) {
    DocumentProcessor processor(config_);

    auto first = processor.process_text(CreateText(), "a.txt");
    auto second = processor.process_text(CreateText(), "a.txt");
    auto other = processor.process_text(CreateText() + " Fin.", "a.txt");

    EXPECT_EQ(first["id"], second["id"]);
    EXPECT_NE(first["id"], other["id"]);
}

TEST_F(DocumentProcessorTest, ProcessFile) {
    auto path = WriteFile("notes.md", CreateText());
    DocumentProcessor processor(config_);

    auto record = processor.process(path);

    EXPECT_EQ(record["filename"], "notes.md");
    EXPECT_EQ(record["fileType"], ".md");
    EXPECT_EQ(record["metadata"]["title"], "Rapport confidentiel");
    EXPECT_EQ(record["metadata"]["language"], "Fran\xC3\xA7" "ais");
    EXPECT_TRUE(record["metadata"].contains("word_count"));
}

TEST_F(DocumentProcessorTest, ProcessMissingFile) {
    DocumentProcessor processor(config_);
    EXPECT_THROW(processor.process((test_dir_ / "absent.txt").string()), std::runtime_error);
}

TEST_F(DocumentProcessorTest, BatchPreservesOrderAndReportsErrors) {
    auto first = WriteFile("first.txt", CreateText());
    auto missing = (test_dir_ / "missing.txt").string();
    auto last = WriteFile("last.md", CreateText());

    DocumentProcessor processor(config_);
    std::mutex calls_mutex;
    std::vector<std::pair<size_t, size_t>> calls;

    auto results = processor.process_batch({first, missing, last},
                                           [&](size_t current, size_t total) {
                                               std::lock_guard<std::mutex> lock(calls_mutex);
                                               calls.emplace_back(current, total);
                                           });

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0]["filename"], "first.txt");
    EXPECT_EQ(results[1]["file"], missing);
    EXPECT_TRUE(results[1].contains("error"));
    EXPECT_EQ(results[2]["filename"], "last.md");

    ASSERT_EQ(calls.size(), 3u);
    for (const auto& call : calls) {
        EXPECT_EQ(call.second, 3u);
    }
    EXPECT_EQ(calls.back().first, 3u);
}

TEST_F(DocumentProcessorTest, BatchFinishesEveryTaskBeforeRethrowing) {
    std::vector<std::string> paths;
    for (int i = 0; i < 6; ++i) {
        paths.push_back(WriteFile("doc" + std::to_string(i) + ".txt", CreateText()));
    }

    DocumentProcessor processor(config_);
    std::atomic<size_t> calls{0};

    EXPECT_THROW(processor.process_batch(paths,
                                         [&calls](size_t, size_t) {
                                             ++calls;
                                             throw 42;
                                         }),
                 int);

    EXPECT_EQ(calls.load(), paths.size());
    EXPECT_EQ(processor.get_stats()["documents_processed"], paths.size());

    // The pool is still usable afterwards
    auto results = processor.process_batch(paths);
    ASSERT_EQ(results.size(), paths.size());
    EXPECT_EQ(results[5]["filename"], "doc5.txt");
}

TEST_F(DocumentProcessorTest, Stats) {
    DocumentProcessor processor(config_);

    auto empty_stats = processor.get_stats();
    EXPECT_EQ(empty_stats["documents_processed"], 0);
    EXPECT_FALSE(empty_stats.contains("average_processing_time_ms"));

    auto a = processor.process_text(CreateText(), "a.txt");
    auto b = processor.process_text(CreateText(), "b.txt");

    auto stats = processor.get_stats();
    EXPECT_EQ(stats["documents_processed"], 2);
    EXPECT_EQ(stats["chunks_created"], a["chunks"].size() + b["chunks"].size());
    EXPECT_GT(stats["characters_processed"].get<size_t>(), 0u);
    EXPECT_TRUE(stats.contains("average_processing_time_ms"));
    EXPECT_DOUBLE_EQ(stats["average_chunks_per_document"].get<double>(),
                     static_cast<double>(a["chunks"].size() + b["chunks"].size()) / 2.0);
}
