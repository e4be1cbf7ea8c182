#include <webp/decode.h>
#include <webp/demux.h>

#include <string>
#include <vector>

#include "defer.h"
#include "file_reader.h"
#include "imsq.h"
#include "imsq_decoders.h"
#include "imsq_exception.h"
#include "log.h"

using namespace GIFImage;
using std::string, std::vector;

static vector<uint8_t>
readWholeFile(const string& path) {
    const auto reader = NaiveIO::FileReader::create(path);
    if (!reader) {
        throw ImageParseException(path, "failed to open file");
    }
    try {
        auto data = reader->readAll();
        if (data.empty()) {
            throw ImageParseException(path, "file is empty");
        }
        return data;
    } catch (const NaiveIO::FileReaderException& e) {
        throw ImageParseException(path, e.what());
    }
}

Frame
GIFImage::decodeWithWebP(const string& path) {
    GeneralLogger::info("Decoding WebP " + path, GeneralLogger::DETAIL);

    const auto bytes = readWholeFile(path);
    WebPData webpData;
    WebPDataInit(&webpData);
    webpData.bytes = bytes.data();
    webpData.size  = bytes.size();

    WebPDemuxer* demux = WebPDemux(&webpData);
    if (demux == nullptr) {
        throw ImageParseException(path, "not a WebP file");
    }
    const Defer deleteDemux([&]() { WebPDemuxDelete(demux); });

    const uint32_t width  = WebPDemuxGetI(demux, WEBP_FF_CANVAS_WIDTH);
    const uint32_t height = WebPDemuxGetI(demux, WEBP_FF_CANVAS_HEIGHT);
    if (width == 0 || height == 0 || width > 0xFFFF || height > 0xFFFF) {
        throw ImageParseException(path,
                                  "invalid dimensions " + std::to_string(width) + "x" + std::to_string(height));
    }

    WebPIterator iter;
    if (!WebPDemuxGetFrame(demux, 1, &iter)) {
        throw ImageParseException(path, "no frame found");
    }
    const Defer releaseIter([&]() { WebPDemuxReleaseIterator(&iter); });

    if (static_cast<uint32_t>(iter.width) != width || static_cast<uint32_t>(iter.height) != height) {
        GeneralLogger::warn("First WebP frame does not cover the canvas: " + path);
    }

    WebPDecoderConfig config;
    if (!WebPInitDecoderConfig(&config)) {
        throw ImageParseException(path, "failed to initialize decoder");
    }

    Frame ret{
        .buffer = vector<PixelBGRA>(static_cast<size_t>(iter.width) * iter.height),
        .width  = static_cast<uint32_t>(iter.width),
        .height = static_cast<uint32_t>(iter.height),
    };
    config.output.colorspace         = MODE_BGRA;
    config.output.is_external_memory = 1;
    config.output.u.RGBA.rgba        = reinterpret_cast<uint8_t*>(ret.buffer.data());
    config.output.u.RGBA.stride      = static_cast<int>(ret.width * sizeof(PixelBGRA));
    config.output.u.RGBA.size        = ret.buffer.size() * sizeof(PixelBGRA);
    config.output.width              = iter.width;
    config.output.height             = iter.height;

    const VP8StatusCode status = WebPDecode(iter.fragment.bytes, iter.fragment.size, &config);
    WebPFreeDecBuffer(&config.output);
    if (status != VP8_STATUS_OK) {
        throw ImageParseException(path, "decoder status " + std::to_string(status));
    }
    return ret;
}
