#ifndef GIFSEQ_INTERFACE_H
#define GIFSEQ_INTERFACE_H

#include <cstdint>
#include <string>
#include <vector>

#include "gif_encoder.h"
#include "gif_options.h"
#include "imsq.h"
#include "progress.h"
#include "quantizer.h"

namespace GIFSeq {

constexpr int64_t MAX_DELAY_MILLIS = Options::Limits::delay;

struct SamplingResult {
    GIFImage::PaletteRef palette;
    uint32_t width  = 0;  // of the first frame, shared by all output frames
    uint32_t height = 0;
};

struct AnimatedDocument {
    std::vector<GIFImage::IndexedFrame> frames;
    std::vector<uint32_t> delays;  // in hundredths of a second, one per frame
};

/**
 * @return @p delayMillis / 10, truncated
 * @throws ValidationException if negative or too large for a GIF frame
 */
uint32_t
toCentiseconds(int64_t delayMillis);

/**
 * @brief First pass: decode and normalize every frame, count colors and build
 *        the shared palette. Publishes a Sampling event before each frame.
 */
SamplingResult
samplePalette(const GIFImage::ImageSequence& sequence, ProgressChannel* progress = nullptr);

/**
 * @brief Second pass: decode, normalize and quantize every frame again on
 *        @p threadCount threads. Publishes a Quantizing event per finished frame.
 *        The first failure of any worker is rethrown after all of them stopped.
 */
std::vector<GIFImage::IndexedFrame>
quantizeFrames(const GIFImage::ImageSequence& sequence,
               const SamplingResult& sampling,
               uint32_t threadCount,
               ProgressChannel* progress = nullptr);

/**
 * @throws ValidationException on an invalid delay, no frames, or frames that
 *         differ in size or palette
 */
AnimatedDocument
assemble(std::vector<GIFImage::IndexedFrame> frames, int64_t delayMillis);

/**
 * @brief Serialize as GIF89a with one global color table.
 * @throws GIFEnc::GIFEncodeException, or whatever @p writeChunk throws
 */
void
writeDocument(const AnimatedDocument& document, const GIFEnc::GIFEncoder::WriteChunkCallback& writeChunk);

/**
 * @brief Run both passes over @p sequence and write @p outputPath.
 *        A partially written file is removed before rethrowing.
 */
void
encodeSequence(const GIFImage::ImageSequence& sequence,
               const std::string& outputPath,
               int64_t delayMillis,
               uint32_t threadCount,
               ProgressChannel* progress = nullptr);

/**
 * @brief Resolve and validate the inputs of @p args, then encodeSequence().
 *        Errors are logged, the channel is closed on failure.
 * @return false on any error
 */
bool
gifSeqEncode(const Options& args, ProgressChannel* progress = nullptr) noexcept;

}  // namespace GIFSeq

#endif  // GIFSEQ_INTERFACE_H
