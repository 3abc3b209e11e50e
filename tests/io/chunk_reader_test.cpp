// =============================================================================
// mtc - Chunk Reader Tests
// =============================================================================

#include "mtc/io/chunk_reader.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "mtc/io/buffer_pool.h"
#include "mtc/io/media_source.h"

namespace mtc::io::test {

namespace {

class ChunkReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
                (std::string("mtc_chunk_reader_") +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".bin");
        content_.resize(10000);
        for (std::size_t i = 0; i < content_.size(); ++i) {
            content_[i] = static_cast<std::uint8_t>((i * 31 + 7) & 0xFF);
        }
        std::ofstream out(path_, std::ios::binary);
        out.write(reinterpret_cast<const char*>(content_.data()),
                  static_cast<std::streamsize>(content_.size()));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::filesystem::path path_;
    std::vector<std::uint8_t> content_;
    BufferPool pool_;
    FileChunkReader reader_;
};

}  // namespace

TEST_F(ChunkReaderTest, ReadsExactRange) {
    MediaSource source(path_);
    auto chunk = reader_.readRange(source, 3, ChunkRange{4096, 1000, false}, pool_);
    ASSERT_TRUE(chunk.has_value()) << chunk.error().message();

    EXPECT_EQ(chunk->id, 3u);
    EXPECT_EQ(chunk->range.offset, 4096u);
    EXPECT_FALSE(chunk->processed);
    ASSERT_EQ(chunk->bytes().size(), 1000u);
    EXPECT_TRUE(std::equal(chunk->bytes().begin(), chunk->bytes().end(),
                           content_.begin() + 4096));
}

TEST_F(ChunkReaderTest, ReadsLastRange) {
    MediaSource source(path_);
    auto chunk = reader_.readRange(source, 9, ChunkRange{9000, 1000, true}, pool_);
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(chunk->bytes().size(), 1000u);
    EXPECT_EQ(chunk->bytes().back(), content_.back());
}

TEST_F(ChunkReaderTest, ShortReadFailsWithContext) {
    MediaSource source(path_);
    auto chunk = reader_.readRange(source, 5, ChunkRange{9500, 1000, false}, pool_);
    ASSERT_FALSE(chunk.has_value());
    EXPECT_EQ(chunk.error().code(), ErrorCode::kReadFailure);
    EXPECT_NE(chunk.error().message().find("chunk: 5"), std::string::npos);
    EXPECT_NE(chunk.error().message().find("offset: 9500"), std::string::npos);
}

TEST_F(ChunkReaderTest, TruncatedLastRangeIsAccepted) {
    MediaSource source(path_);
    auto chunk = reader_.readRange(source, 9, ChunkRange{9500, 1000, true}, pool_);
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(chunk->bytes().size(), 500u);
}

TEST_F(ChunkReaderTest, SourceRemovedAfterOpen) {
    MediaSource source(path_);
    std::filesystem::remove(path_);
    auto chunk = reader_.readRange(source, 0, ChunkRange{0, 100, false}, pool_);
    ASSERT_FALSE(chunk.has_value());
    EXPECT_EQ(chunk.error().code(), ErrorCode::kReadFailure);
}

TEST_F(ChunkReaderTest, FailedReadReturnsBuffer) {
    MediaSource source(path_);
    {
        auto chunk = reader_.readRange(source, 1, ChunkRange{9999, 50, false}, pool_);
        ASSERT_FALSE(chunk.has_value());
    }
    {
        auto chunk = reader_.readRange(source, 0, ChunkRange{0, 50, false}, pool_);
        ASSERT_TRUE(chunk.has_value());
    }
    EXPECT_EQ(pool_.stats().outstanding, 0u);
}

}  // namespace mtc::io::test
