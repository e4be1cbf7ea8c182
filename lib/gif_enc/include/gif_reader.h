#ifndef GIF_READER_H
#define GIF_READER_H

#include <span>
#include <vector>

#include "def.h"

namespace GIFEnc {
struct GIFFrameInfo {
    uint32_t width            = 0;
    uint32_t height           = 0;
    uint32_t delay            = 0;  // in hundredths of a second
    uint32_t disposalMethod   = 0;
    bool hasTransparency      = false;
    uint32_t transparentIndex = 0;
    std::vector<uint8_t> indices;
};

struct GIFInfo {
    uint32_t width           = 0;
    uint32_t height          = 0;
    uint32_t backgroundIndex = 0;
    std::vector<PixelBGRA> globalColorTable;  // as stored, including padding
    bool hasLoopExtension = false;
    uint32_t loops        = 0;
    std::vector<GIFFrameInfo> frames;
};

/**
 * @brief Parse a non-interlaced GIF with a global color table, decompressing
 *        every frame into palette indices.
 * @throws GIFParseException on anything it cannot follow.
 */
GIFInfo
readDocument(const std::span<const uint8_t>& data);

};  // namespace GIFEnc

#endif  // GIF_READER_H
