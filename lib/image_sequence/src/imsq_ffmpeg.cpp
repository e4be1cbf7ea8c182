#include <algorithm>
#include <array>
#include <string>
#include <vector>

#include "defer.h"
#include "imsq.h"
#include "imsq_decoders.h"
#include "imsq_exception.h"
#include "log.h"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libswscale/swscale.h>
}

using namespace GIFImage;
using std::string, std::vector;

static constexpr uint32_t MAX_FRAME_SIDE = 0xFFFF;

// copies a decoded frame of any pixel format into a BGRA buffer of the same size
static Frame
toBGRA(const AVFrame* frame, const string& path) {
    if (frame->width <= 0 || frame->height <= 0 ||
        static_cast<uint32_t>(frame->width) > MAX_FRAME_SIDE ||
        static_cast<uint32_t>(frame->height) > MAX_FRAME_SIDE) {
        throw ImageParseException(path,
                                  "invalid dimensions " + std::to_string(frame->width) + "x" +
                                      std::to_string(frame->height));
    }
    SwsContext* swsCtx = sws_getContext(frame->width,
                                        frame->height,
                                        static_cast<AVPixelFormat>(frame->format),
                                        frame->width,
                                        frame->height,
                                        AV_PIX_FMT_BGRA,
                                        SWS_POINT,
                                        nullptr,
                                        nullptr,
                                        nullptr);
    if (!swsCtx) {
        throw ImageParseException(path, "failed to create conversion context");
    }
    const Defer freeCtx([&]() { sws_freeContext(swsCtx); });

    Frame ret{
        .buffer = vector<PixelBGRA>(static_cast<size_t>(frame->width) * frame->height),
        .width  = static_cast<uint32_t>(frame->width),
        .height = static_cast<uint32_t>(frame->height),
    };
    uint8_t* dstData[1]    = {reinterpret_cast<uint8_t*>(ret.buffer.data())};
    int32_t dstLineSize[1] = {static_cast<int32_t>(ret.width * sizeof(PixelBGRA))};
    if (sws_scale(swsCtx, frame->data, frame->linesize, 0, frame->height, dstData, dstLineSize) <= 0) {
        throw ImageParseException(path, "failed to convert pixel format");
    }
    return ret;
}

Frame
GIFImage::decodeWithFFmpeg(const string& path) {
    AVFormatContext* formatCtx = nullptr;
    AVCodecContext* codecCtx   = nullptr;
    AVPacket* packet           = nullptr;
    AVFrame* frame             = nullptr;
    AVDictionary* options      = nullptr;

    const Defer cleanup([&]() {
        if (options) av_dict_free(&options);
        if (frame) av_frame_free(&frame);
        if (packet) av_packet_free(&packet);
        if (codecCtx) avcodec_free_context(&codecCtx);
        if (formatCtx) avformat_close_input(&formatCtx);
    });

    GeneralLogger::info("Decoding " + path, GeneralLogger::DETAIL);

    // file names are taken literally, "%d" is not a sequence here
    av_dict_set(&options, "pattern_type", "none", 0);
    if (avformat_open_input(&formatCtx, path.c_str(), nullptr, &options) < 0) {
        throw ImageParseException(path, "failed to open file");
    }
    if (avformat_find_stream_info(formatCtx, nullptr) < 0) {
        throw ImageParseException(path, "failed to find stream info");
    }
    int32_t videoStreamIndex = -1;
    for (uint32_t i = 0; i < formatCtx->nb_streams; i++) {
        if (formatCtx->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_VIDEO) {
            videoStreamIndex = static_cast<int32_t>(i);
            break;
        }
    }
    if (videoStreamIndex == -1) {
        throw ImageParseException(path, "no image stream found");
    }

    AVCodecParameters* codecParams = formatCtx->streams[videoStreamIndex]->codecpar;
    const AVCodec* codec           = avcodec_find_decoder(codecParams->codec_id);
    if (!codec) {
        throw ImageParseException(path, "no decoder found");
    }
    codecCtx = avcodec_alloc_context3(codec);
    if (!codecCtx) {
        throw ImageParseException(path, "failed to allocate decoder context");
    }
    if (avcodec_parameters_to_context(codecCtx, codecParams) < 0) {
        throw ImageParseException(path, "failed to copy codec parameters");
    }
    if (avcodec_open2(codecCtx, codec, nullptr) < 0) {
        throw ImageParseException(path, "failed to open decoder");
    }

    packet = av_packet_alloc();
    frame  = av_frame_alloc();
    if (!packet || !frame) {
        throw ImageParseException(path, "failed to allocate frame");
    }

    while (av_read_frame(formatCtx, packet) >= 0) {
        if (packet->stream_index == videoStreamIndex) {
            if (avcodec_send_packet(codecCtx, packet) < 0) {
                av_packet_unref(packet);
                throw ImageParseException(path, "corrupt image data");
            }
            if (avcodec_receive_frame(codecCtx, frame) >= 0) {
                av_packet_unref(packet);
                return toBGRA(frame, path);
            }
        }
        av_packet_unref(packet);
    }

    // drain frames the decoder is still holding
    if (avcodec_send_packet(codecCtx, nullptr) >= 0 && avcodec_receive_frame(codecCtx, frame) >= 0) {
        return toBGRA(frame, path);
    }
    throw ImageParseException(path, "no frame decoded");
}

// premultiplied B, G, R and A as four separate planes
static std::array<vector<uint8_t>, 4>
toPremultipliedPlanes(const Frame& frame) {
    std::array<vector<uint8_t>, 4> planes;
    for (auto& plane : planes) {
        plane.resize(frame.buffer.size());
    }
    for (size_t i = 0; i < frame.buffer.size(); ++i) {
        const auto& pixel = frame.buffer[i];
        planes[0][i]      = TOU8((pixel.b * pixel.a + 127) / 255);
        planes[1][i]      = TOU8((pixel.g * pixel.a + 127) / 255);
        planes[2][i]      = TOU8((pixel.r * pixel.a + 127) / 255);
        planes[3][i]      = pixel.a;
    }
    return planes;
}

static uint8_t
unpremultiply(const uint8_t value, const uint8_t alpha) {
    // ringing may push a channel above its alpha
    return TOU8(std::min<uint32_t>(255, (value * 255u + alpha / 2u) / alpha));
}

Frame
ImageSequence::normalize(const Frame& frame, const uint32_t width, const uint32_t height) {
    if (frame.buffer.empty() || frame.width == 0 || frame.height == 0 || width == 0 || height == 0) {
        throw ImageParseException("Invalid buffer or dimensions for resizing.");
    }
    if (frame.buffer.size() != static_cast<size_t>(frame.width) * frame.height) {
        throw ImageParseException("Buffer size does not match dimensions: " + std::to_string(frame.buffer.size()) +
                                  " != " + std::to_string(frame.width) + "x" + std::to_string(frame.height));
    }
    if (frame.width == width && frame.height == height) {
        return frame;
    }

    GeneralLogger::info("Resizing " + std::to_string(frame.width) + "x" + std::to_string(frame.height) + " to " +
                            std::to_string(width) + "x" + std::to_string(height),
                        GeneralLogger::DETAIL);

    // Each channel is scaled as a full-range gray plane, so no color space
    // conversion happens and a constant plane stays constant.
    SwsContext* swsCtx = sws_getContext(static_cast<int>(frame.width),
                                        static_cast<int>(frame.height),
                                        AV_PIX_FMT_GRAY8,
                                        static_cast<int>(width),
                                        static_cast<int>(height),
                                        AV_PIX_FMT_GRAY8,
                                        SWS_BICUBIC | SWS_ACCURATE_RND,
                                        nullptr,
                                        nullptr,
                                        nullptr);
    if (!swsCtx) {
        throw ImageParseException("Failed to create scaling context");
    }
    const Defer freeCtx([&]() { sws_freeContext(swsCtx); });

    const auto srcPlanes = toPremultipliedPlanes(frame);
    std::array<vector<uint8_t>, 4> dstPlanes;
    for (size_t c = 0; c < srcPlanes.size(); ++c) {
        dstPlanes[c].resize(static_cast<size_t>(width) * height);
        const uint8_t* srcData[1] = {srcPlanes[c].data()};
        const int srcLineSize[1]  = {static_cast<int>(frame.width)};
        uint8_t* dstData[1]       = {dstPlanes[c].data()};
        const int dstLineSize[1]  = {static_cast<int>(width)};
        if (sws_scale(swsCtx, srcData, srcLineSize, 0, static_cast<int>(frame.height), dstData, dstLineSize) <= 0) {
            throw ImageParseException("Failed to resize frame");
        }
    }

    Frame ret{
        .buffer = vector<PixelBGRA>(static_cast<size_t>(width) * height),
        .width  = width,
        .height = height,
    };
    for (size_t i = 0; i < ret.buffer.size(); ++i) {
        const uint8_t alpha = dstPlanes[3][i];
        if (alpha == 0) {
            ret.buffer[i] = {0, 0, 0, 0};
            continue;
        }
        ret.buffer[i] = {
            unpremultiply(dstPlanes[0][i], alpha),
            unpremultiply(dstPlanes[1][i], alpha),
            unpremultiply(dstPlanes[2][i], alpha),
            alpha,
        };
    }
    return ret;
}
