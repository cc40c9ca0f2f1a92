#include <gtest/gtest.h>
#include <writer.hpp>
#include <string>

// Test suite for ShaperWriter and its output normalization

static std::string normalized(const std::string& text) {
    StringWriteOutput out;
    ShaperWriter writer(out);
    writer.normalize = true;
    writer.write(text);
    writer.finish();
    return out.content;
}


TEST(WriterTest, PassesThroughWhenNotNormalizing) {
    StringWriteOutput out;
    ShaperWriter writer(out);
    writer.write("  a\n\n\n\nb  ");
    writer.finish();
    EXPECT_EQ(out.content, "  a\n\n\n\nb  ");
}

TEST(WriterTest, CollapsesNewlineRuns) {
    EXPECT_EQ(normalized("a\n\n\nb"), "a\n\nb");
    EXPECT_EQ(normalized("a\n\n\n\n\n\n\nb"), "a\n\nb");
    EXPECT_EQ(normalized("a\n\nb"), "a\n\nb");
    EXPECT_EQ(normalized("a\nb"), "a\nb");
}

TEST(WriterTest, OnlyConsecutiveNewlinesCount) {
    EXPECT_EQ(normalized("a\n \n\n\nb"), "a\n \n\nb");
    EXPECT_EQ(normalized("a\n\r\n\r\nb"), "a\n\r\n\r\nb");
}

TEST(WriterTest, TrimsBothEnds) {
    EXPECT_EQ(normalized(" \t\n\n hello world \n\n\n"), "hello world");
    EXPECT_EQ(normalized("   "), "");
    EXPECT_EQ(normalized(""), "");
}

TEST(WriterTest, NormalizesAcrossWrites) {
    StringWriteOutput out;
    ShaperWriter writer(out);
    writer.normalize = true;
    writer.write("\n  first\n");
    writer.write("\n");
    writer.write("\nsecond");
    writer.write("   ");
    writer.finish();
    EXPECT_EQ(out.content, "first\n\nsecond");
}

TEST(WriterTest, StringOutputAppends) {
    StringWriteOutput out;
    out.write("abc", 2);
    out.write("def", 3);
    EXPECT_EQ(out.content, "abdef");
}
