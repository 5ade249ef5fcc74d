#include <gtest/gtest.h>
#include <doc_chunker/document_cleaner.h>
#include <cmath>

using namespace doc_chunker;

class DocumentCleanerTest : public ::testing::Test {
protected:
    // 20-line page: two header lines, 16 body lines, two footer lines
    std::string CreatePage() {
        std::string page = "CONFIDENTIAL quarterly report\nDraft for review\n";
        for (int i = 0; i < 16; ++i) {
            page += "The family system adapts its rules through circular exchanges\n";
        }
        page += "\xC2\xA9 Institute of Family Therapy\nwww.example.org";
        return page;
    }

    CleaningOptions AllDisabled() {
        CleaningOptions options;
        options.remove_headers = false;
        options.remove_footers = false;
        options.remove_page_numbers = false;
        options.remove_extra_whitespace = false;
        options.normalize_quotes = false;
        options.fix_hyphenation = false;
        return options;
    }
};

TEST_F(DocumentCleanerTest, PageNumberScenario) {
    auto result = clean_document("Page 1\n\nBody text here.\n\n\n\n1");

    EXPECT_EQ(result.text, "Page\n\nBody text here.");
    EXPECT_EQ(result.text.find("\n\n\n"), std::string::npos);
    EXPECT_EQ(result.stats.removed_elements, (std::vector<std::string>{removed::kPageNumbers}));
}

TEST_F(DocumentCleanerTest, EmptyInput) {
    auto result = clean_document("");

    EXPECT_EQ(result.text, "");
    EXPECT_EQ(result.stats.original_length, 0u);
    EXPECT_EQ(result.stats.cleaned_length, 0u);
    EXPECT_DOUBLE_EQ(result.stats.reduction_percentage, 0.0);
    EXPECT_TRUE(result.stats.removed_elements.empty());
}

TEST_F(DocumentCleanerTest, ShortPagesAreDropped) {
    auto result = clean_document("only one line");
    EXPECT_EQ(result.text, "");
    EXPECT_DOUBLE_EQ(result.stats.reduction_percentage, 100.0);
}

TEST_F(DocumentCleanerTest, SplitPagesOnFormFeed) {
    auto pages = split_pages("a\nb\nc\fd\ne\nf");
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(pages[0], "a\nb\nc");
    EXPECT_EQ(pages[1], "d\ne\nf");
}

TEST_F(DocumentCleanerTest, SplitPagesOnDashedPageMarker) {
    auto pages = split_pages("first page\n- 3 -\nsecond page");
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(pages[0], "first page");
    EXPECT_EQ(pages[1], "second page");
}

TEST_F(DocumentCleanerTest, SplitPagesFallsBackToBlankRuns) {
    auto pages = split_pages("first\n\n\n\nsecond");
    ASSERT_EQ(pages.size(), 2u);

    auto single = split_pages("no\nbreaks\nat all");
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(single[0], "no\nbreaks\nat all");
}

TEST_F(DocumentCleanerTest, RemovesHeadersAndFooters) {
    auto result = clean_document(CreatePage());

    EXPECT_EQ(result.text.find("CONFIDENTIAL"), std::string::npos);
    EXPECT_EQ(result.text.find("Draft"), std::string::npos);
    EXPECT_EQ(result.text.find("www.example.org"), std::string::npos);
    EXPECT_EQ(result.text.find("Institute of Family Therapy"), std::string::npos);
    EXPECT_NE(result.text.find("circular exchanges"), std::string::npos);
    EXPECT_TRUE(result.stats.has_removed(removed::kHeaders));
    EXPECT_TRUE(result.stats.has_removed(removed::kFooters));
}

TEST_F(DocumentCleanerTest, HeaderRemovalCanBeDisabled) {
    CleaningOptions options;
    options.remove_headers = false;

    auto result = clean_document(CreatePage(), options);

    EXPECT_NE(result.text.find("CONFIDENTIAL"), std::string::npos);
    EXPECT_FALSE(result.stats.has_removed(removed::kHeaders));
    EXPECT_TRUE(result.stats.has_removed(removed::kFooters));
}

TEST_F(DocumentCleanerTest, FixesHyphenation) {
    auto result = clean_document("inter-\naction continues\nend of page");

    EXPECT_EQ(result.text, "inter\naction continues\nend of page");
    EXPECT_TRUE(result.stats.has_removed(removed::kHyphenation));
}

TEST_F(DocumentCleanerTest, HyphenBeforeUppercaseIsKept) {
    auto result = clean_document("Jean-\nPierre arrives\nend of page");

    EXPECT_EQ(result.text, "Jean-\nPierre arrives\nend of page");
    EXPECT_FALSE(result.stats.has_removed(removed::kHyphenation));
}

TEST_F(DocumentCleanerTest, NormalizesQuotes) {
    auto result = clean_document("\xE2\x80\x9C" "Bonjour" "\xE2\x80\x9D" " dit-il\n"
                                 "\xE2\x80\x98" "oui" "\xE2\x80\x99" "\n"
                                 "\xC2\xAB" " fin " "\xC2\xBB");

    EXPECT_EQ(result.text, "\"Bonjour\" dit-il\n'oui'\n\" fin \"");
    EXPECT_TRUE(result.stats.has_removed(removed::kQuotes));
}

TEST_F(DocumentCleanerTest, CollapsesWhitespace) {
    auto result = clean_document("first   line\nsecond\n\n\nthird");

    EXPECT_EQ(result.text, "first line\nsecond\n\nthird");
    EXPECT_TRUE(result.stats.has_removed(removed::kWhitespace));
}

TEST_F(DocumentCleanerTest, UntouchedStepsAreNotReported) {
    auto result = clean_document("alpha\nbeta\ngamma");

    EXPECT_EQ(result.text, "alpha\nbeta\ngamma");
    EXPECT_EQ(result.stats.removed_elements, (std::vector<std::string>{removed::kPageNumbers}));
}

TEST_F(DocumentCleanerTest, AllStepsDisabled) {
    auto result = clean_document("  spaced   \n\xC2\xAB" "quoted" "\xC2\xBB\nhy-\nphen 12", AllDisabled());

    EXPECT_EQ(result.text, "  spaced   \n\xC2\xAB" "quoted" "\xC2\xBB\nhy-\nphen 12");
    EXPECT_TRUE(result.stats.removed_elements.empty());
    EXPECT_DOUBLE_EQ(result.stats.reduction_percentage, 0.0);
}

TEST_F(DocumentCleanerTest, LengthsCountCodePoints) {
    auto result = clean_document("été\nhiver\nautomne", AllDisabled());

    EXPECT_EQ(result.stats.original_length, 17u);
    EXPECT_EQ(result.stats.cleaned_length, 17u);
}

TEST_F(DocumentCleanerTest, ReductionPercentageIsBounded) {
    const std::vector<std::string> inputs = {
        "x",
        "Page 1\n\nBody text here.\n\n\n\n1",
        "a\nb\nc\fd\ne\nf",
        CreatePage(),
        "\n\n\n\n\n\n",
        "word   word   word\n\n\n\n\nword\nword\nword 42",
    };

    for (const auto& input : inputs) {
        auto stats = clean_document(input).stats;
        EXPECT_GE(stats.reduction_percentage, 0.0) << input;
        EXPECT_LE(stats.reduction_percentage, 100.0) << input;
        // rounded to two decimals
        EXPECT_DOUBLE_EQ(stats.reduction_percentage,
                         std::round(stats.reduction_percentage * 100.0) / 100.0);
    }
}

TEST_F(DocumentCleanerTest, RemovedElementsAreUnique) {
    std::string text = CreatePage() + "\f" + CreatePage() + "\f" + CreatePage();
    auto stats = clean_document(text).stats;

    for (size_t i = 0; i < stats.removed_elements.size(); ++i) {
        for (size_t j = i + 1; j < stats.removed_elements.size(); ++j) {
            EXPECT_NE(stats.removed_elements[i], stats.removed_elements[j]);
        }
    }
}

TEST_F(DocumentCleanerTest, HugeBlankGapBetweenParagraphs) {
    const std::string text = "First paragraph here.\nline two\nline three\n" +
                             std::string(1 << 20, ' ') + "\nSecond paragraph.\nmore\nmore";

    auto result = clean_document(text);

    EXPECT_EQ(result.text,
              "First paragraph here.\nline two\nline three\n\nSecond paragraph.\nmore\nmore");
    EXPECT_TRUE(result.stats.has_removed(removed::kWhitespace));
}

TEST_F(DocumentCleanerTest, HugeBlankRunSplitsPages) {
    const std::string text = "page one a\npage one b\npage one c\n\n" +
                             std::string(1 << 20, ' ') + "\n\npage two a\npage two b\npage two c";

    EXPECT_EQ(split_pages(text).size(), 2u);

    auto result = clean_document(text);
    EXPECT_EQ(result.text, "page one a\npage one b\npage one c\n\npage two a\npage two b\npage two c");
}

TEST_F(DocumentCleanerTest, VeryLongLinesAreCleaned) {
    std::string text = "Total " + std::string(300000, '7') + "\n";
    for (int i = 0; i < 19; ++i) {
        text += "The family system adapts its rules through circular exchanges\n";
    }
    text += std::string(300000, '9');

    auto result = clean_document(text);

    EXPECT_EQ(result.text.substr(0, 6), "Total\n");
    EXPECT_EQ(result.text.find('7'), std::string::npos);
    EXPECT_EQ(result.text.find('9'), std::string::npos);
    EXPECT_TRUE(result.stats.has_removed(removed::kFooters));
    EXPECT_FALSE(result.stats.has_removed(removed::kHeaders));
}

TEST_F(DocumentCleanerTest, TrailingNumbersNeedLeadingSpace) {
    auto result = clean_document("chapter 12\nversion2\n  42  \nend of text 7");

    EXPECT_EQ(result.text, "chapter\nversion2\nend of text");
}
