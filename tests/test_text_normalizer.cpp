#include <gtest/gtest.h>
#include <doc_chunker/text_normalizer.h>

using namespace doc_chunker;

TEST(TextNormalizerTest, NormalizeConvertsCrlf) {
    EXPECT_EQ(normalize("a\r\nb\r\n"), "a\nb\n");
    EXPECT_EQ(normalize("no carriage returns"), "no carriage returns");
}

TEST(TextNormalizerTest, NormalizeKeepsLoneCarriageReturn) {
    EXPECT_EQ(normalize("a\rb"), "a\rb");
}

TEST(TextNormalizerTest, NormalizeIsIdempotent) {
    const std::string once = normalize("x\r\n\r\ny\r\r\n");
    EXPECT_EQ(normalize(once), once);
}

TEST(TextNormalizerTest, SplitOnKeepsEmptyPieces) {
    const SeparatorFinder comma = [](const std::string& text, size_t from) {
        size_t pos = text.find(',', from);
        return pos == std::string::npos ? TextSpan{pos, pos} : TextSpan{pos, pos + 1};
    };
    EXPECT_EQ(split_on("a,,b", comma), (std::vector<std::string>{"a", "", "b"}));
    EXPECT_EQ(split_on(",a,", comma), (std::vector<std::string>{"", "a", ""}));
    EXPECT_EQ(split_on("abc", comma), (std::vector<std::string>{"abc"}));
}

TEST(TextNormalizerTest, FindBlankRunSpansFirstToLastLineFeed) {
    const std::string text = "one  \n \t\n  two";
    TextSpan span = find_blank_run(text, 0, 2);
    EXPECT_EQ(span.begin, 5u);
    EXPECT_EQ(span.end, 9u);

    EXPECT_EQ(find_blank_run(text, 0, 3).begin, std::string::npos);
    EXPECT_EQ(find_blank_run("a\nb\nc", 0, 2).begin, std::string::npos);
}

TEST(TextNormalizerTest, FindBlankRunSkipsShortRuns) {
    const std::string text = "a\nb\n\n\nc";
    TextSpan span = find_blank_run(text, 0, 3);
    EXPECT_EQ(span.begin, 3u);
    EXPECT_EQ(span.end, 6u);
}

TEST(TextNormalizerTest, FindBlankRunHandlesHugeRuns) {
    const std::string text = "start\n" + std::string(1 << 20, ' ') + "\nend";
    TextSpan span = find_blank_run(text, 0, 2);
    EXPECT_EQ(span.begin, 5u);
    EXPECT_EQ(span.end, text.size() - 3);
}

TEST(TextNormalizerTest, SplitLines) {
    EXPECT_EQ(split_lines("a\n\nb"), (std::vector<std::string>{"a", "", "b"}));
    EXPECT_EQ(split_lines(""), (std::vector<std::string>{""}));
    EXPECT_EQ(split_lines("end\n"), (std::vector<std::string>{"end", ""}));
}

TEST(TextNormalizerTest, JoinIsInverseOfSplitLines) {
    const std::string text = "one\n\ntwo\nthree";
    EXPECT_EQ(join(split_lines(text), "\n"), text);
}

TEST(TextNormalizerTest, Trim) {
    EXPECT_EQ(trim("  \t hello world \n\f"), "hello world");
    EXPECT_EQ(trim(" \n "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(TextNormalizerTest, ToLowerHandlesLatin1Capitals) {
    EXPECT_EQ(to_lower("MRI Palo Alto"), "mri palo alto");
    EXPECT_EQ(to_lower("MÉTHODE ÀÇÈ"), "méthode àçè");
    // multiplication sign has no lowercase form
    EXPECT_EQ(to_lower("A×B"), "a×b");
}

TEST(TextNormalizerTest, Utf8Length) {
    EXPECT_EQ(utf8_length(""), 0u);
    EXPECT_EQ(utf8_length("abc"), 3u);
    EXPECT_EQ(utf8_length("héllo"), 5u);
    EXPECT_EQ(utf8_length("«»"), 2u);
}

TEST(TextNormalizerTest, Utf8OffsetAndTail) {
    const std::string text = "aéb";  // 61 C3 A9 62

    EXPECT_EQ(utf8_offset(text, 0), 0u);
    EXPECT_EQ(utf8_offset(text, 1), 1u);
    EXPECT_EQ(utf8_offset(text, 2), 3u);
    EXPECT_EQ(utf8_offset(text, 9), 4u);

    EXPECT_EQ(utf8_tail(text, 0), "");
    EXPECT_EQ(utf8_tail(text, 2), "éb");
    EXPECT_EQ(utf8_tail(text, 10), text);
}

TEST(TextNormalizerTest, CharIndexMapsBytesToCodePoints) {
    const std::string text = "éé a";  // C3 A9 C3 A9 20 61
    CharIndex index(text);

    EXPECT_EQ(index.size(), 4u);
    EXPECT_EQ(index.chars_before(0), 0u);
    EXPECT_EQ(index.chars_before(2), 1u);
    EXPECT_EQ(index.chars_before(1), 1u);
    EXPECT_EQ(index.chars_before(text.size()), 4u);
    EXPECT_EQ(index.byte_at(2), 4u);
    EXPECT_EQ(index.byte_at(4), text.size());
    EXPECT_EQ(index.byte_at(99), text.size());

    EXPECT_EQ(CharIndex("").size(), 0u);
}

TEST(TextNormalizerTest, CharBoundaries) {
    const std::string text = "aé";  // 61 C3 A9

    EXPECT_TRUE(is_char_boundary(text, 0));
    EXPECT_TRUE(is_char_boundary(text, 1));
    EXPECT_FALSE(is_char_boundary(text, 2));
    EXPECT_TRUE(is_char_boundary(text, 3));

    EXPECT_EQ(floor_char_boundary(text, 2), 1u);
    EXPECT_EQ(floor_char_boundary(text, 10), 3u);
}

TEST(TextNormalizerTest, StartsLowercase) {
    EXPECT_TRUE(starts_lowercase("action"));
    EXPECT_TRUE(starts_lowercase("été"));
    EXPECT_FALSE(starts_lowercase("Été"));
    EXPECT_FALSE(starts_lowercase("Action"));
    EXPECT_FALSE(starts_lowercase("1 item"));
    EXPECT_FALSE(starts_lowercase(""));
}
