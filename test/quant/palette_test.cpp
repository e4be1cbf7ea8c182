#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "def.h"
#include "imsq_exception.h"
#include "quantizer.h"
#include "test_images.h"

using GIFImage::ColorCounts;
using GIFImage::ColorSampler;
using GIFImage::Palette;

static bool
contains(const Palette& palette, const PixelBGRA& color) {
    return std::find(palette.begin(), palette.end(), color) != palette.end();
}

TEST(ColorSampler, CountsEveryPixelOfEveryFrame) {
    ColorSampler sampler;
    const auto red  = makeRGBA(0xff, 0, 0);
    const auto blue = makeRGBA(0, 0, 0xff);
    sampler.sample(TestSupport::solidFrame(4, 4, red));
    sampler.sample(TestSupport::stripedFrame(2, 3, {red, blue}));

    const auto& counts = sampler.getCounts();
    ASSERT_EQ(counts.size(), 2u);
    EXPECT_EQ(counts.at(red), 16u + 3u);
    EXPECT_EQ(counts.at(blue), 3u);
    EXPECT_EQ(sampler.getSampledPixels(), 22u);
}

TEST(ColorSampler, RejectsBufferNotMatchingSize) {
    ColorSampler sampler;
    auto frame = TestSupport::solidFrame(4, 4, makeRGBA(1, 2, 3));
    frame.buffer.pop_back();
    EXPECT_THROW(sampler.sample(frame), ImageParseException);
}

TEST(BuildPalette, KeepsAllColorsWhenFewEnough) {
    ColorCounts counts{
        {makeRGBA(200, 10, 10), 1},
        {makeRGBA(10, 200, 10), 50},
        {makeRGBA(10, 10, 200), 7},
        {makeRGBA(10, 10, 200, 0), 3},
    };
    const auto palette = GIFImage::buildPalette(counts);
    ASSERT_EQ(palette.size(), 4u);
    // ordered by (r, g, b, a), not by count
    EXPECT_EQ(palette[0], makeRGBA(10, 10, 200, 0));
    EXPECT_EQ(palette[1], makeRGBA(10, 10, 200));
    EXPECT_EQ(palette[2], makeRGBA(10, 200, 10));
    EXPECT_EQ(palette[3], makeRGBA(200, 10, 10));
}

TEST(BuildPalette, ExactlyTwoHundredFiftySixColorsAreKept) {
    ColorCounts counts;
    for (uint32_t i = 0; i < 256; ++i) {
        counts[makeRGBA(TOU8(i), TOU8(255 - i), 0x40)] = i + 1;
    }
    const auto palette = GIFImage::buildPalette(counts);
    EXPECT_EQ(palette.size(), 256u);
    EXPECT_TRUE(std::is_sorted(palette.begin(), palette.end(), channelLess));
}

TEST(BuildPalette, KeepsMostFrequentColorsBeyondLimit) {
    ColorCounts counts;
    // 300 colors, color i seen i + 1 times
    for (uint32_t i = 0; i < 300; ++i) {
        counts[makeRGBA(TOU8(i & 0xff), TOU8(i >> 8), 0x11)] = i + 1;
    }
    const auto palette = GIFImage::buildPalette(counts);
    ASSERT_EQ(palette.size(), 256u);
    // descending by count: colors 299 down to 44
    for (uint32_t k = 0; k < 256; ++k) {
        const uint32_t i = 299 - k;
        EXPECT_EQ(palette[k], makeRGBA(TOU8(i & 0xff), TOU8(i >> 8), 0x11)) << "at " << k;
    }
    EXPECT_FALSE(contains(palette, makeRGBA(43, 0, 0x11)));
}

TEST(BuildPalette, BreaksCountTiesByChannels) {
    ColorCounts counts;
    // 258 colors with the same count: the two largest by (r, g, b, a) drop out
    for (uint32_t i = 0; i < 258; ++i) {
        counts[makeRGBA(TOU8(i >> 1), 0x20, TOU8(i & 1))] = 5;
    }
    const auto palette = GIFImage::buildPalette(counts);
    ASSERT_EQ(palette.size(), 256u);
    EXPECT_TRUE(std::is_sorted(palette.begin(), palette.end(), channelLess));
    EXPECT_EQ(palette.front(), makeRGBA(0, 0x20, 0));
    EXPECT_EQ(palette.back(), makeRGBA(127, 0x20, 1));
    EXPECT_FALSE(contains(palette, makeRGBA(128, 0x20, 0)));
    EXPECT_FALSE(contains(palette, makeRGBA(128, 0x20, 1)));
}

TEST(BuildPalette, SameCountsGiveSamePalette) {
    ColorCounts first, second;
    for (uint32_t i = 0; i < 1000; ++i) {
        const auto color = makeRGBA(TOU8(i), TOU8(i >> 8), TOU8(i * 31));
        first[color] += i % 17;
    }
    // same content, different insertion order
    for (uint32_t i = 1000; i-- > 0;) {
        const auto color = makeRGBA(TOU8(i), TOU8(i >> 8), TOU8(i * 31));
        second[color] += i % 17;
    }
    EXPECT_EQ(GIFImage::buildPalette(first), GIFImage::buildPalette(second));
}

TEST(BuildPalette, FallsBackToBlackAndWhite) {
    const auto palette = GIFImage::buildPalette(ColorCounts{});
    ASSERT_EQ(palette.size(), 2u);
    EXPECT_EQ(palette[0], makeRGBA(0, 0, 0));
    EXPECT_EQ(palette[1], makeRGBA(0xff, 0xff, 0xff));
    EXPECT_EQ(palette, GIFImage::fallbackPalette());
}

TEST(BuildPalette, HonorsSmallerLimit) {
    ColorCounts counts{
        {makeRGBA(1, 1, 1), 10},
        {makeRGBA(2, 2, 2), 30},
        {makeRGBA(3, 3, 3), 20},
    };
    const auto palette = GIFImage::buildPalette(counts, 2);
    ASSERT_EQ(palette.size(), 2u);
    EXPECT_EQ(palette[0], makeRGBA(2, 2, 2));
    EXPECT_EQ(palette[1], makeRGBA(3, 3, 3));
}

TEST(BuildPalette, RejectsInvalidLimit) {
    const ColorCounts counts{{makeRGBA(1, 1, 1), 1}};
    EXPECT_THROW(GIFImage::buildPalette(counts, 0), QuantizeException);
    EXPECT_THROW(GIFImage::buildPalette(counts, 257), QuantizeException);
}

TEST(ColorSampler, TransparentPixelsShareOneColor) {
    ColorSampler sampler;
    const auto red = makeRGBA(0xff, 0, 0);
    sampler.sample(TestSupport::stripedFrame(
        4, 1, {red, makeRGBA(0, 0, 0, 0), makeRGBA(0xff, 0xff, 0xff, 0), makeRGBA(9, 8, 7, 0)}));

    const auto& counts = sampler.getCounts();
    ASSERT_EQ(counts.size(), 2u);
    EXPECT_EQ(counts.at(red), 1u);
    EXPECT_EQ(counts.at(GIFImage::TRANSPARENT_COLOR), 3u);
}
