#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "gif_lzw.h"

using std::vector;

static vector<uint8_t>
pseudoRandomIndices(const size_t size, const uint32_t symbols, uint32_t seed) {
    vector<uint8_t> ret(size);
    for (auto& value : ret) {
        seed  = seed * 1103515245u + 12345u;
        value = static_cast<uint8_t>((seed >> 16) % symbols);
    }
    return ret;
}

TEST(LZW, RoundTripsAcrossCodeSizes) {
    for (uint32_t minCodeSize = 2; minCodeSize <= 8; ++minCodeSize) {
        const uint32_t symbols = 1u << minCodeSize;
        // long enough to fill the dictionary and force clear codes
        const auto input      = pseudoRandomIndices(100000, symbols, minCodeSize);
        const auto compressed = GIFEnc::LZW::compress(input, minCodeSize);
        ASSERT_FALSE(compressed.empty()) << "code size " << minCodeSize;
        EXPECT_EQ(GIFEnc::LZW::decompress(compressed, minCodeSize), input) << "code size " << minCodeSize;
    }
}

TEST(LZW, RepetitiveDataCompresses) {
    const vector<uint8_t> input(64 * 1024, 3);
    const auto compressed = GIFEnc::LZW::compress(input, 2);
    EXPECT_LT(compressed.size(), input.size() / 20);
    EXPECT_EQ(GIFEnc::LZW::decompress(compressed, 2), input);
}

TEST(LZW, EmptyInputStillTerminates) {
    const auto compressed = GIFEnc::LZW::compress({}, 4);
    ASSERT_FALSE(compressed.empty());
    EXPECT_TRUE(GIFEnc::LZW::decompress(compressed, 4).empty());
}

TEST(LZW, RejectsSymbolsOutsideCodeSize) {
    const vector<uint8_t> input{0, 1, 2, 3, 4};
    EXPECT_TRUE(GIFEnc::LZW::compress(input, 2).empty());
}

TEST(LZW, RejectsInvalidCodeSize) {
    const vector<uint8_t> input{0, 1};
    EXPECT_TRUE(GIFEnc::LZW::compress(input, 1).empty());
    EXPECT_TRUE(GIFEnc::LZW::compress(input, 9).empty());
}

TEST(LZW, StreamHonorsChunkSize) {
    const auto input = pseudoRandomIndices(20000, 256, 7);
    bool isFirst     = true;
    vector<size_t> chunkSizes;
    vector<uint8_t> joined;
    const auto total = GIFEnc::LZW::compressStream(
        [&input, &isFirst]() -> std::span<const uint8_t> {
            if (!isFirst) return {};
            isFirst = false;
            return input;
        },
        [&](const std::span<const uint8_t>& chunk) {
            chunkSizes.push_back(chunk.size());
            joined.insert(joined.end(), chunk.begin(), chunk.end());
        },
        nullptr,
        8,
        GIFEnc::LZW::GIF_SUB_BLOCK_SIZE);
    ASSERT_GT(total, 0u);
    EXPECT_EQ(total, joined.size());
    for (const auto size : chunkSizes) {
        EXPECT_GT(size, 0u);
        EXPECT_LE(size, GIFEnc::LZW::GIF_SUB_BLOCK_SIZE);
    }
    EXPECT_EQ(GIFEnc::LZW::decompress(joined, 8), input);
}

TEST(LZW, TruncatedDataIsRejected) {
    const auto input      = pseudoRandomIndices(5000, 16, 3);
    auto compressed       = GIFEnc::LZW::compress(input, 4);
    compressed.resize(compressed.size() / 2);
    EXPECT_TRUE(GIFEnc::LZW::decompress(compressed, 4).empty());
}
