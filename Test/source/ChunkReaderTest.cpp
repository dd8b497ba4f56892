#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "ChunkReader.hpp"
#include "TempFile.hpp"

namespace {
    std::vector<std::string> ReadAll(ChunkReader& reader)
    {
        std::vector<std::string> chunks;
        while (true) {
            auto [ok, chunk, err] = reader.Next();
            EXPECT_TRUE(ok) << err.message;
            if (!ok || chunk.empty())
                break;

            chunks.emplace_back(chunk);
        }

        return chunks;
    }
}

TEST(ChunkReaderTest, YieldsFixedSizeChunksWithShortTail)
{
    TempFile file("0123456789");
    ChunkReader reader(file.GetPath(), 4);
    ASSERT_FALSE(reader.Open());

    EXPECT_EQ(ReadAll(reader), (std::vector<std::string>{ "0123", "4567", "89" }));
    EXPECT_EQ(reader.GetOffset(), 10u);
    EXPECT_FALSE(reader.Close());
}

TEST(ChunkReaderTest, ExactMultipleEndsWithoutEmptyChunk)
{
    TempFile file("abcdefgh");
    ChunkReader reader(file.GetPath(), 4);
    ASSERT_FALSE(reader.Open());

    EXPECT_EQ(ReadAll(reader), (std::vector<std::string>{ "abcd", "efgh" }));
    EXPECT_EQ(reader.GetOffset(), 8u);

    auto [ok, chunk, err] = reader.Next();
    EXPECT_TRUE(ok);
    EXPECT_TRUE(chunk.empty());
}

TEST(ChunkReaderTest, ChunkCountIsCeilingOfSizeOverChunk)
{
    const std::string content = PatternContent(1000);
    TempFile file(content);

    ChunkReader reader(file.GetPath(), 64);
    ASSERT_FALSE(reader.Open());

    const auto chunks = ReadAll(reader);
    ASSERT_EQ(chunks.size(), 16u);
    EXPECT_EQ(chunks.back().size(), 1000u % 64);

    std::string joined;
    for (const auto& chunk : chunks)
        joined += chunk;
    EXPECT_EQ(joined, content);
}

TEST(ChunkReaderTest, StartsAtExplicitOffset)
{
    TempFile file("0123456789");
    ChunkReader reader(file.GetPath(), 3, 6);
    ASSERT_FALSE(reader.Open());

    EXPECT_EQ(reader.GetOffset(), 6u);
    EXPECT_EQ(ReadAll(reader), (std::vector<std::string>{ "678", "9" }));
    EXPECT_EQ(reader.GetOffset(), 10u);
}

TEST(ChunkReaderTest, ZeroChunkSizeIsRejected)
{
    TempFile file("data");
    ChunkReader reader(file.GetPath(), 0);

    EXPECT_TRUE(reader.Open());
}

TEST(ChunkReaderTest, MissingFileFailsToOpen)
{
    TempFile file("data");
    ChunkReader reader(file.GetDirectory() / "missing.bin", 4);

    EXPECT_TRUE(reader.Open());
}
