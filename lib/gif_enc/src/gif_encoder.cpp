#include "gif_encoder.h"

#include <string>
#include <vector>

#include "def.h"
#include "gif_exception.h"
#include "gif_format.h"
#include "gif_lzw.h"
using std::vector, std::span, std::string;

static bool
checkIndexesValid(const std::span<const uint8_t>& codes, size_t paletteSize) {
    const auto maxIndex = paletteSize - 1;
    for (const auto& code : codes) {
        if (code > maxIndex) {
            return false;
        }
    }
    return true;
}

GIFEnc::GIFEncoder::GIFEncoder(const WriteChunkCallback& writeChunkCallback,
                               const uint32_t width,
                               const uint32_t height,
                               const uint32_t backgroundIndex,
                               const uint32_t minCodeLength,
                               const bool hasTransparency,
                               const uint32_t transparentIndex,
                               const bool looping,
                               const vector<PixelBGRA>& globalColorTable)
    : m_writeChunkCallback(writeChunkCallback),
      m_width(width),
      m_height(height),
      m_minCodeLength(minCodeLength),
      m_hasTransparency(hasTransparency),
      m_transparentIndex(transparentIndex),
      m_paletteSize(globalColorTable.size()) {
    if (!m_writeChunkCallback) {
        throw GIFEnc::GIFEncodeException("No output callback");
    }
    if (minCodeLength < 2 || minCodeLength > 8) {
        throw GIFEnc::GIFEncodeException("Invalid min code size: " + std::to_string(minCodeLength));
    }
    if (globalColorTable.empty() || globalColorTable.size() > (1ull << minCodeLength)) {
        throw GIFEnc::GIFEncodeException("Color table size mismatch: " +
                                         std::to_string(globalColorTable.size()));
    }
    if (hasTransparency && (transparentIndex >= globalColorTable.size())) {
        throw GIFEnc::GIFEncodeException("Transparent index out of range");
    }
    const auto header =
        GIFEnc::gifHeader(m_width, m_height, backgroundIndex, m_minCodeLength, globalColorTable);
    if (header.empty()) {
        m_finished = true;
        throw GIFEnc::GIFEncodeException("Header generation failed");
    }
    writeFile(header);
    if (looping) {
        writeFile(GIFEnc::gifLoopExtension(0));
    }
}

void
GIFEnc::GIFEncoder::addFrame(const span<const uint8_t>& frame,
                             const uint32_t delay,
                             const uint32_t disposalMethod) {
    if (m_finished) {
        throw GIFEnc::GIFEncodeException("Encoder already finished");
    }
    if (frame.size() != static_cast<size_t>(m_width) * m_height) {
        throw GIFEnc::GIFEncodeException("Frame size mismatch");
    }
    if (!checkIndexesValid(frame, m_paletteSize)) {
        throw GIFEnc::GIFEncodeException("Color index out of range");
    }

    auto buffer = GIFEnc::gifFrameHeader(m_width,
                                         m_height,
                                         delay,
                                         m_hasTransparency,
                                         m_transparentIndex,
                                         disposalMethod,
                                         m_minCodeLength);
    if (buffer.empty()) {
        throw GIFEnc::GIFEncodeException("Frame header generation failed");
    }

    bool isFirst          = true;
    const auto compressed = GIFEnc::LZW::compressStream(
        [&frame, &isFirst]() -> span<const uint8_t> {
            if (isFirst) {
                isFirst = false;
                return {frame.data(), frame.size()};
            } else {
                return {};
            }
        },
        [&buffer](const span<const uint8_t>& data) {
            if (data.empty()) return;
            buffer.push_back(TOU8(data.size()));
            buffer.insert(buffer.end(), data.begin(), data.end());
        },
        nullptr,
        m_minCodeLength,
        GIFEnc::LZW::GIF_SUB_BLOCK_SIZE);
    if (compressed == 0) {
        throw GIFEnc::GIFEncodeException("Compression failed");
    }

    buffer.push_back(0);
    writeFile(buffer);
}

bool
GIFEnc::GIFEncoder::finish() {
    if (m_finished) {
        return false;
    }
    writeFile(GIFEnc::GIF_END);
    m_finished = true;
    return true;
}

void
GIFEnc::GIFEncoder::writeFile(const span<const uint8_t>& data) {
    if (m_finished) return;
    if (!m_writeChunkCallback(data)) {
        m_finished = true;
        throw GIFEnc::GIFEncodeException("Failed to write");
    }
}

void
GIFEnc::GIFEncoder::writeFile(const uint8_t byte) {
    if (m_finished) return;
    if (!m_writeChunkCallback({&byte, 1})) {
        m_finished = true;
        throw GIFEnc::GIFEncodeException("Failed to write");
    }
}
