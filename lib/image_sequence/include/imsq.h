#ifndef GIFSEQ_IMAGE_SEQUENCE_H
#define GIFSEQ_IMAGE_SEQUENCE_H

#include <memory>
#include <string>
#include <vector>

#include "def.h"

namespace GIFImage {

/**
 * @brief Decoded raster in BGRA8888, row-major, no padding.
 */
struct Frame {
    std::vector<PixelBGRA> buffer;
    uint32_t width  = 0;
    uint32_t height = 0;
};

class ImageSequence {
  public:
    using Ref = std::unique_ptr<ImageSequence>;

    /**
     * @brief Sequence backed by files on disk. Nothing is decoded here,
     *        each getFrame() call reads and decodes the file again.
     */
    static Ref
    open(const std::vector<std::string>& paths);

    /**
     * @brief Sequence backed by frames already in memory.
     * @param names Display names, "frame <i>" when empty.
     * @throws ImageParseException on frames not matching their dimensions.
     */
    static Ref
    load(std::vector<Frame> frames, std::vector<std::string> names = {});

    /**
     * @brief Decode the first frame of an image file.
     *        WebP goes through libwebp, everything else through FFmpeg.
     * @throws ImageParseException naming the file.
     */
    static Frame
    decode(const std::string& path);

    /**
     * @brief Stretch @p frame to exactly @p width x @p height with bicubic
     *        resampling on all four channels. A frame that already has the
     *        requested size is returned as is.
     * @throws ImageParseException on empty or inconsistent input.
     */
    static Frame
    normalize(const Frame& frame, uint32_t width, uint32_t height);

    virtual ~ImageSequence() = default;

    [[nodiscard]] virtual uint32_t
    getFrameCount() const noexcept = 0;

    [[nodiscard]] virtual const std::string&
    getFrameName(uint32_t index) const = 0;

    /**
     * @brief Safe to call from several threads at once.
     * @throws ImageParseException
     */
    [[nodiscard]] virtual Frame
    getFrame(uint32_t index) const = 0;
};

}  // namespace GIFImage

#endif  // GIFSEQ_IMAGE_SEQUENCE_H
