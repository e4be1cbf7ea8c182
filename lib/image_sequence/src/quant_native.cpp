#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "def.h"
#include "imsq_exception.h"
#include "log.h"
#include "quantizer.h"

using namespace GIFImage;
using std::vector;

static void
ensureFrameValid(const Frame& frame) {
    if (frame.buffer.size() != static_cast<size_t>(frame.width) * frame.height) {
        throw ImageParseException("Pixel data size does not match image dimensions: " +
                                  std::to_string(frame.buffer.size()) + " != " + std::to_string(frame.width) + "x" +
                                  std::to_string(frame.height));
    }
}

void
ColorSampler::sample(const Frame& frame) {
    ensureFrameValid(frame);
    for (const auto& pixel : frame.buffer) {
        ++m_counts[canonicalColor(pixel)];
    }
    m_sampledPixels += frame.buffer.size();
}

Palette
GIFImage::fallbackPalette() {
    return {makeRGBA(0, 0, 0), makeRGBA(0xff, 0xff, 0xff)};
}

Palette
GIFImage::buildPalette(const ColorCounts& counts, const uint32_t maxColors) {
    if (maxColors < 1 || maxColors > MAX_PALETTE_SIZE) {
        throw QuantizeException("maxColors out of range: " + std::to_string(maxColors) +
                                ", must be between 1 and 256");
    }
    if (counts.empty()) {
        GeneralLogger::warn("No colors sampled, using black and white.");
        return fallbackPalette();
    }

    vector<std::pair<PixelBGRA, uint64_t>> entries(counts.begin(), counts.end());
    Palette palette;
    palette.reserve(std::min<size_t>(entries.size(), maxColors));

    if (entries.size() <= maxColors) {
        std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
            return channelLess(a.first, b.first);
        });
    } else {
        GeneralLogger::info(std::to_string(entries.size()) + " distinct colors, keeping the " +
                                std::to_string(maxColors) + " most frequent",
                            GeneralLogger::STEP);
        std::partial_sort(entries.begin(),
                          entries.begin() + maxColors,
                          entries.end(),
                          [](const auto& a, const auto& b) {
                              if (a.second != b.second) {
                                  return a.second > b.second;
                              }
                              return channelLess(a.first, b.first);
                          });
        entries.resize(maxColors);
    }
    for (const auto& [color, _] : entries) {
        palette.push_back(color);
    }
    return palette;
}

FrameQuantizer::FrameQuantizer(PaletteRef palette)
    : m_palette(std::move(palette)) {
    if (!m_palette || m_palette->empty() || m_palette->size() > MAX_PALETTE_SIZE) {
        throw QuantizeException("Palette must hold between 1 and 256 colors");
    }
    m_colorMap.reserve(m_palette->size());
    for (size_t i = 0; i < m_palette->size(); ++i) {
        // first occurrence wins
        m_colorMap.emplace((*m_palette)[i], static_cast<uint8_t>(i));
        if ((*m_palette)[i].a == 0) {
            m_colorMap.emplace(TRANSPARENT_COLOR, static_cast<uint8_t>(i));
        }
    }
}

uint8_t
FrameQuantizer::getPaletteIndex(const PixelBGRA& color) {
    const auto key = canonicalColor(color);
    if (const auto it = m_colorMap.find(key); it != m_colorMap.end()) {
        return it->second;
    }
    const uint8_t index = findClosestColor(key);
    m_colorMap.emplace(key, index);
    return index;
}

uint8_t
FrameQuantizer::findClosestColor(const PixelBGRA& color) const noexcept {
    const auto& palette = *m_palette;
    uint32_t ret        = 0;
    uint32_t minDist    = colorDistance(color, palette[0]);
    for (uint32_t i = 1; i < palette.size() && minDist > 0; ++i) {
        const auto dist = colorDistance(color, palette[i]);
        if (dist < minDist) {
            minDist = dist;
            ret     = i;
        }
    }
    return static_cast<uint8_t>(ret);
}

IndexedFrame
FrameQuantizer::quantize(const Frame& frame) {
    ensureFrameValid(frame);
    IndexedFrame ret{
        .width   = frame.width,
        .height  = frame.height,
        .indices = {},
        .palette = m_palette,
    };
    ret.indices.reserve(frame.buffer.size());
    for (const auto& pixel : frame.buffer) {
        ret.indices.push_back(getPaletteIndex(pixel));
    }
    return ret;
}
