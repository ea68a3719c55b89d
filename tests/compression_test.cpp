#include <gtest/gtest.h>

#include <string>

#include "compression.h"

TEST(CompressionTest, GzipRestoresOriginalBytes)
{
    std::string input;
    for (int i = 0; i < 2000; ++i)
        input += "line " + std::to_string(i % 7) + "\n";

    std::string compressed;
    ASSERT_EQ(Compression::gzip(input, compressed), 0);
    EXPECT_TRUE(Compression::looksGzipped(compressed));
    EXPECT_LT(compressed.size(), input.size());

    std::string restored;
    ASSERT_EQ(Compression::gunzip(compressed, restored), 0);
    EXPECT_EQ(restored, input);
}

TEST(CompressionTest, EmptyInput)
{
    std::string compressed;
    ASSERT_EQ(Compression::gzip("", compressed), 0);

    std::string restored = "stale";
    ASSERT_EQ(Compression::gunzip(compressed, restored), 0);
    EXPECT_TRUE(restored.empty());
}

TEST(CompressionTest, RejectsTruncatedStream)
{
    std::string compressed;
    ASSERT_EQ(Compression::gzip(std::string(4096, 'x'), compressed), 0);
    compressed.resize(compressed.size() / 2);

    std::string restored;
    EXPECT_LT(Compression::gunzip(compressed, restored), 0);
}

TEST(CompressionTest, PlainTextIsNotGzip)
{
    EXPECT_FALSE(Compression::looksGzipped("hello world"));
    EXPECT_FALSE(Compression::looksGzipped(""));

    std::string restored;
    EXPECT_LT(Compression::gunzip("hello world", restored), 0);
}
