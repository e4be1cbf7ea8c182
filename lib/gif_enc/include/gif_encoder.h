#ifndef GIF_ENCODER_H
#define GIF_ENCODER_H

#include <functional>
#include <span>
#include <vector>

#include "def.h"

namespace GIFEnc {
class GIFEncoder {
  public:
    using WriteChunkCallback = std::function<bool(const std::span<const uint8_t>&)>;

    /**
     * @brief Writes the header and the global color table immediately.
     * @param minCodeLength     LZW minimum code size, see minCodeLengthFor().
     * @param transparentIndex  Ignored unless hasTransparency is set.
     * @param looping           Write a NETSCAPE2.0 extension that loops forever.
     * @param globalColorTable  At most (1 << minCodeLength) entries, padded when written.
     */
    GIFEncoder(const WriteChunkCallback& writeChunkCallback,
               uint32_t width,
               uint32_t height,
               uint32_t backgroundIndex,
               uint32_t minCodeLength,
               bool hasTransparency,
               uint32_t transparentIndex,
               bool looping,
               const std::vector<PixelBGRA>& globalColorTable);

    /**
     * @brief Add a frame to the GIF file.
     * @param frame         The frame data as indexes in the global color table.
     * @param delay         Frame duration in hundredths of a second.
     * @param disposalMethod 0-3
     */
    void
    addFrame(const std::span<const uint8_t>& frame, uint32_t delay, uint32_t disposalMethod);

    /**
     * @brief Write the trailer. Further calls do nothing.
     * @return false if already finished
     */
    bool
    finish();

  private:
    void
    writeFile(const std::span<const uint8_t>& data);

    void
    writeFile(uint8_t byte);

  private:
    WriteChunkCallback m_writeChunkCallback;
    uint32_t m_width            = 0;
    uint32_t m_height           = 0;
    uint32_t m_minCodeLength    = 0;
    bool m_hasTransparency      = false;
    uint32_t m_transparentIndex = 0;
    size_t m_paletteSize        = 0;

    bool m_finished = false;
};
};  // namespace GIFEnc

#endif  // GIF_ENCODER_H
