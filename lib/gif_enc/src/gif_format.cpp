#include "gif_format.h"

#include <vector>
using std::vector;

uint32_t
GIFEnc::minCodeLengthFor(const size_t paletteSize) noexcept {
    if (paletteSize == 0 || paletteSize > GIF_MAX_COLORS) {
        return 0;
    }
    uint32_t length = 2;
    while ((1ull << length) < paletteSize) {
        ++length;
    }
    return length;
}

std::vector<uint8_t>
GIFEnc::gifHeader(const uint32_t width,
                  const uint32_t height,
                  const uint32_t backgroundIndex,
                  const uint32_t minCodeLength,
                  const std::vector<PixelBGRA>& globalColorTable) noexcept {
    if (minCodeLength < 2 || minCodeLength > 8) {
        return {};
    }
    if (width == 0 || height == 0 || width > GIF_MAX_DIMENSION || height > GIF_MAX_DIMENSION) {
        return {};
    }
    if (globalColorTable.empty() || globalColorTable.size() > 1u << minCodeLength) {
        return {};
    }
    if (backgroundIndex >= globalColorTable.size()) {
        return {};
    }
    vector<uint8_t> ret{
        0x47,
        0x49,
        0x46,
        0x38,
        0x39,
        0x61,  // "GIF89a"
        TOU8(width & 0xFF),
        TOU8(width >> 8),
        TOU8(height & 0xFF),
        TOU8(height >> 8),
        TOU8(0x80 | ((GIF_COLOR_RES - 1) << 4) | (minCodeLength - 1)),
        TOU8(backgroundIndex),
        0x00,
    };
    ret.reserve(ret.size() + ((1u << minCodeLength) * 3));
    for (uint32_t i = 0; i < (1u << minCodeLength); i++) {
        if (static_cast<size_t>(i) >= globalColorTable.size()) {
            ret.push_back(0);
            ret.push_back(0);
            ret.push_back(0);
        } else {
            ret.push_back(globalColorTable[i].r);
            ret.push_back(globalColorTable[i].g);
            ret.push_back(globalColorTable[i].b);
        }
    }
    return ret;
}

std::vector<uint8_t>
GIFEnc::gifLoopExtension(const uint32_t loops) noexcept {
    return {
        0x21,
        0xFF,
        0x0B,  // Application Extension
        0x4E,
        0x45,
        0x54,
        0x53,
        0x43,
        0x41,
        0x50,
        0x45,
        0x32,
        0x2E,
        0x30,  // "NETSCAPE2.0"
        0x03,
        0x01,
        TOU8(loops & 0xFF),
        TOU8(loops >> 8),
        0x00,
    };
}

std::vector<uint8_t>
GIFEnc::gifFrameHeader(const uint32_t width,
                       const uint32_t height,
                       const uint32_t delay,
                       const bool hasTransparency,
                       const uint32_t transparentIndex,
                       const uint32_t disposalMethod,
                       const uint32_t minCodeLength) noexcept {
    if (minCodeLength < 2 || minCodeLength > 8) {
        return {};
    }
    if (hasTransparency && (transparentIndex >= (1u << minCodeLength))) {
        return {};
    }
    if (disposalMethod > 3 || delay > GIF_MAX_DELAY) {
        return {};
    }
    return {
        0x21,
        0xF9,
        0x04,  // Graphic Control Extension
        TOU8((disposalMethod << 2) | (hasTransparency ? 0x01u : 0x00u)),
        TOU8(delay & 0xFFu),
        TOU8(delay >> 8),
        TOU8(hasTransparency ? transparentIndex : 0x00u),
        0x00,
        0x2C,  // Image Descriptor
        TOU8(0),
        TOU8(0),
        TOU8(0),
        TOU8(0),
        TOU8(width & 0xFFu),
        TOU8(width >> 8),
        TOU8(height & 0xFFu),
        TOU8(height >> 8),
        0x00,  // no local color table, not interlaced
        TOU8(minCodeLength),
    };
}
