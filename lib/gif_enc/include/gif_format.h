#ifndef GIF_FORMAT_H
#define GIF_FORMAT_H

#include <vector>

#include "def.h"

namespace GIFEnc {
constexpr uint8_t GIF_COLOR_RES      = 8;  // color resolution
constexpr uint8_t GIF_END            = 0x3B;
constexpr uint32_t GIF_MAX_DIMENSION = 0xFFFF;
constexpr uint32_t GIF_MAX_DELAY     = 0xFFFF;  // in hundredths of a second
constexpr uint32_t GIF_MAX_COLORS    = 256;

/**
 * @brief Smallest LZW minimum code size able to address @p paletteSize entries.
 *        GIF does not allow code sizes below 2.
 * @return 0 if paletteSize is 0 or larger than 256
 */
uint32_t
minCodeLengthFor(size_t paletteSize) noexcept;

/**
 * @brief Header, logical screen descriptor and global color table.
 *        The color table is padded with black to (1 << minCodeLength) entries.
 * @return empty vector on invalid arguments
 */
std::vector<uint8_t>
gifHeader(uint32_t width,
          uint32_t height,
          uint32_t backgroundIndex,
          uint32_t minCodeLength,
          const std::vector<PixelBGRA>& globalColorTable) noexcept;

/**
 * @brief NETSCAPE2.0 application extension. 0 loops means forever.
 */
std::vector<uint8_t>
gifLoopExtension(uint32_t loops) noexcept;

/**
 * @brief Graphic control extension, image descriptor and the LZW minimum code size byte.
 *        Frames always cover the whole logical screen and use the global color table.
 * @param delay Frame duration in hundredths of a second.
 */
std::vector<uint8_t>
gifFrameHeader(uint32_t width,
               uint32_t height,
               uint32_t delay,
               bool hasTransparency,
               uint32_t transparentIndex,
               uint32_t disposalMethod,
               uint32_t minCodeLength) noexcept;
};  // namespace GIFEnc

#endif  // GIF_FORMAT_H
