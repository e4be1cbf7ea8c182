#ifndef GIFIMAGE_QUANTIZER_H
#define GIFIMAGE_QUANTIZER_H

#include <memory>
#include <unordered_map>
#include <vector>

#include "def.h"
#include "imsq.h"

namespace GIFImage {

constexpr uint32_t MAX_PALETTE_SIZE = 256;

using Palette     = std::vector<PixelBGRA>;
using PaletteRef  = std::shared_ptr<const Palette>;
using ColorCounts = std::unordered_map<PixelBGRA, uint64_t, PixelBGRAHash>;

// GIF has a single transparent index, so fully transparent pixels are one color
constexpr PixelBGRA TRANSPARENT_COLOR{0, 0, 0, 0};

[[nodiscard]] inline PixelBGRA
canonicalColor(const PixelBGRA& color) noexcept {
    return color.a == 0 ? TRANSPARENT_COLOR : color;
}

struct IndexedFrame {
    uint32_t width  = 0;
    uint32_t height = 0;
    std::vector<uint8_t> indices;  // row-major, one per pixel
    PaletteRef palette;
};

/**
 * @brief Accumulates exact colors and their occurrence counts over any
 *        number of frames. Fully transparent pixels are counted as
 *        TRANSPARENT_COLOR whatever their RGB.
 */
class ColorSampler {
  public:
    /**
     * @throws ImageParseException if the buffer does not match the frame size
     */
    void
    sample(const Frame& frame);

    [[nodiscard]] const ColorCounts&
    getCounts() const noexcept {
        return m_counts;
    }

    [[nodiscard]] uint64_t
    getSampledPixels() const noexcept {
        return m_sampledPixels;
    }

  private:
    ColorCounts m_counts;
    uint64_t m_sampledPixels = 0;
};

/**
 * @brief Derive an ordered color table of at most @p maxColors entries.
 *
 * Up to @p maxColors distinct colors are all kept, ordered by (r, g, b, a).
 * Beyond that the most frequent colors win, in order of descending count,
 * equal counts ordered by (r, g, b, a).
 * No colors at all gives fallbackPalette().
 *
 * @throws QuantizeException if maxColors is not in [1, 256]
 */
Palette
buildPalette(const ColorCounts& counts, uint32_t maxColors = MAX_PALETTE_SIZE);

/**
 * @return opaque black and opaque white
 */
Palette
fallbackPalette();

/**
 * @brief Maps true color pixels onto a fixed palette. Colors found verbatim
 *        keep their own entry; others go to the entry with the smallest
 *        colorDistance(), the lowest index on ties. Any fully transparent
 *        pixel goes to the first fully transparent entry, if there is one.
 *
 * Instances cache lookups and are not thread safe; use one per thread.
 */
class FrameQuantizer {
  public:
    /**
     * @throws QuantizeException on a null, empty or oversized palette
     */
    explicit FrameQuantizer(PaletteRef palette);

    [[nodiscard]] uint8_t
    getPaletteIndex(const PixelBGRA& color);

    /**
     * @throws ImageParseException if the buffer does not match the frame size
     */
    IndexedFrame
    quantize(const Frame& frame);

  private:
    uint8_t
    findClosestColor(const PixelBGRA& color) const noexcept;

    PaletteRef m_palette;
    std::unordered_map<PixelBGRA, uint8_t, PixelBGRAHash> m_colorMap;
};

}  // namespace GIFImage

#endif  // GIFIMAGE_QUANTIZER_H
