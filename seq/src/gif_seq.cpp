#include "gif_seq.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "def.h"
#include "defer.h"
#include "file_writer.h"
#include "gif_encoder.h"
#include "gif_exception.h"
#include "gif_format.h"
#include "imsq.h"
#include "imsq_exception.h"
#include "input_resolver.h"
#include "log.h"
#include "quantizer.h"
#include "seq_exception.h"

using namespace GIFSeq;
using std::vector, std::string, std::span;

static constexpr uint32_t DISPOSAL_NONE       = 0;
static constexpr uint32_t DISPOSAL_BACKGROUND = 2;

static constexpr const char* WRITING_ITEM = "Creating output GIF";

uint32_t
GIFSeq::toCentiseconds(const int64_t delayMillis) {
    if (delayMillis < 0) {
        throw ValidationException("Delay must not be negative: " + std::to_string(delayMillis) + " ms");
    }
    const int64_t centiseconds = delayMillis / 10;
    if (centiseconds > static_cast<int64_t>(GIFEnc::GIF_MAX_DELAY)) {
        throw ValidationException("Delay too large: " + std::to_string(delayMillis) + " ms, max " +
                                  std::to_string(MAX_DELAY_MILLIS) + " ms");
    }
    return static_cast<uint32_t>(centiseconds);
}

SamplingResult
GIFSeq::samplePalette(const GIFImage::ImageSequence& sequence, ProgressChannel* progress) {
    const uint32_t total = sequence.getFrameCount();
    if (total == 0) {
        throw ValidationException("No frames to sample");
    }

    GIFImage::ColorSampler sampler;
    SamplingResult ret;
    for (uint32_t i = 0; i < total; ++i) {
        const auto& name = sequence.getFrameName(i);
        if (progress) {
            progress->publish({
                .stage           = Stage::Sampling,
                .currentItemName = name,
                .processedCount  = i,
                .totalCount      = total,
            });
        }
        const auto frame = sequence.getFrame(i);
        if (i == 0) {
            if (frame.width > GIFEnc::GIF_MAX_DIMENSION || frame.height > GIFEnc::GIF_MAX_DIMENSION) {
                throw ValidationException("First frame is too large for GIF: " + std::to_string(frame.width) + "x" +
                                          std::to_string(frame.height));
            }
            ret.width  = frame.width;
            ret.height = frame.height;
            GeneralLogger::info("Output size: " + std::to_string(ret.width) + "x" + std::to_string(ret.height),
                                GeneralLogger::STEP);
        }
        sampler.sample(GIFImage::ImageSequence::normalize(frame, ret.width, ret.height));
    }

    GeneralLogger::info(std::to_string(sampler.getCounts().size()) + " distinct colors in " +
                            std::to_string(sampler.getSampledPixels()) + " pixels",
                        GeneralLogger::STEP);
    ret.palette = std::make_shared<const GIFImage::Palette>(GIFImage::buildPalette(sampler.getCounts()));
    GeneralLogger::info("Palette size: " + std::to_string(ret.palette->size()), GeneralLogger::STEP);
    return ret;
}

vector<GIFImage::IndexedFrame>
GIFSeq::quantizeFrames(const GIFImage::ImageSequence& sequence,
                       const SamplingResult& sampling,
                       uint32_t threadCount,
                       ProgressChannel* progress) {
    if (!sampling.palette) {
        throw ValidationException("No palette to quantize against");
    }
    const uint32_t total = sequence.getFrameCount();
    if (total == 0) {
        return {};
    }
    threadCount = std::clamp<uint32_t>(threadCount, 1, total);

    vector<GIFImage::IndexedFrame> outFrames(total);
    std::mutex cntMutex;
    uint32_t cnt = 0;
    std::exception_ptr firstError;
    std::atomic<bool> failed = false;

    const auto framesPerThread = (total + threadCount - 1) / threadCount;
    GeneralLogger::info("Thread count: " + std::to_string(threadCount), GeneralLogger::STEP);

    vector<std::thread> threads;
    threads.reserve(threadCount);
    const Defer joinAll([&threads]() {
        for (auto& thread : threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    });

    for (uint32_t i = 0; i < threadCount; ++i) {
        threads.emplace_back(
            [&sequence, &sampling, &outFrames, &cnt, &cntMutex, &firstError, &failed, progress, total](
                const uint32_t start,
                const uint32_t end) {
                try {
                    GIFImage::FrameQuantizer quantizer(sampling.palette);
                    for (uint32_t j = start; j < end && !failed; ++j) {
                        const auto frame = GIFImage::ImageSequence::normalize(sequence.getFrame(j),
                                                                              sampling.width,
                                                                              sampling.height);
                        outFrames[j] = quantizer.quantize(frame);

                        uint32_t processed;
                        {
                            std::lock_guard<std::mutex> lock(cntMutex);
                            processed = cnt++;
                        }
                        if (progress) {
                            progress->publish({
                                .stage           = Stage::Quantizing,
                                .currentItemName = sequence.getFrameName(j),
                                .processedCount  = processed,
                                .totalCount      = total,
                            });
                        }
                    }
                } catch (...) {
                    // handed to the calling thread below
                    std::lock_guard<std::mutex> lock(cntMutex);
                    if (!firstError) {
                        firstError = std::current_exception();
                    }
                    failed = true;
                }
            },
            i * framesPerThread,
            std::min<uint32_t>((i + 1) * framesPerThread, total));
    }

    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    if (firstError) {
        std::rethrow_exception(firstError);
    }
    return outFrames;
}

AnimatedDocument
GIFSeq::assemble(vector<GIFImage::IndexedFrame> frames, const int64_t delayMillis) {
    const uint32_t delay = toCentiseconds(delayMillis);
    if (frames.empty()) {
        throw ValidationException("No frames to assemble");
    }

    const auto palette = frames.front().palette;
    const auto width   = frames.front().width;
    const auto height  = frames.front().height;
    if (!palette || palette->empty() || palette->size() > GIFImage::MAX_PALETTE_SIZE) {
        throw ValidationException("Frames need a palette of 1 to 256 colors");
    }
    if (width == 0 || height == 0 || width > GIFEnc::GIF_MAX_DIMENSION || height > GIFEnc::GIF_MAX_DIMENSION) {
        throw ValidationException("Invalid frame size: " + std::to_string(width) + "x" + std::to_string(height));
    }
    for (size_t i = 0; i < frames.size(); ++i) {
        const auto& frame = frames[i];
        if (frame.width != width || frame.height != height) {
            throw ValidationException("Frame " + std::to_string(i) + " is " + std::to_string(frame.width) + "x" +
                                      std::to_string(frame.height) + ", expected " + std::to_string(width) + "x" +
                                      std::to_string(height));
        }
        if (frame.palette != palette) {
            throw ValidationException("Frame " + std::to_string(i) + " uses a different palette");
        }
        if (frame.indices.size() != static_cast<size_t>(width) * height) {
            throw ValidationException("Frame " + std::to_string(i) + " has " + std::to_string(frame.indices.size()) +
                                      " indices for " + std::to_string(width) + "x" + std::to_string(height));
        }
        if (!frame.indices.empty() &&
            *std::max_element(frame.indices.begin(), frame.indices.end()) >= palette->size()) {
            throw ValidationException("Frame " + std::to_string(i) + " references a color outside the palette");
        }
    }

    AnimatedDocument document;
    document.delays.assign(frames.size(), delay);
    document.frames = std::move(frames);
    return document;
}

void
GIFSeq::writeDocument(const AnimatedDocument& document, const GIFEnc::GIFEncoder::WriteChunkCallback& writeChunk) {
    if (document.frames.empty() || document.frames.size() != document.delays.size()) {
        throw ValidationException("Document needs one delay per frame and at least one frame");
    }
    const auto& first = document.frames.front();
    if (!first.palette) {
        throw ValidationException("Document has no palette");
    }
    const auto& palette = *first.palette;

    const auto transparent         = std::find_if(palette.begin(), palette.end(), [](const PixelBGRA& color) {
        return color.a == 0;
    });
    const bool hasTransparency      = transparent != palette.end();
    const uint32_t transparentIndex = hasTransparency ? static_cast<uint32_t>(transparent - palette.begin()) : 0;
    const uint32_t disposalMethod   = hasTransparency ? DISPOSAL_BACKGROUND : DISPOSAL_NONE;

    GIFEnc::GIFEncoder encoder(writeChunk,
                               first.width,
                               first.height,
                               transparentIndex,
                               GIFEnc::minCodeLengthFor(palette.size()),
                               hasTransparency,
                               transparentIndex,
                               document.frames.size() > 1,
                               palette);
    for (size_t i = 0; i < document.frames.size(); ++i) {
        encoder.addFrame(document.frames[i].indices, document.delays[i], disposalMethod);
    }
    encoder.finish();
}

void
GIFSeq::encodeSequence(const GIFImage::ImageSequence& sequence,
                       const string& outputPath,
                       const int64_t delayMillis,
                       const uint32_t threadCount,
                       ProgressChannel* progress) {
    const uint32_t total = sequence.getFrameCount();
    if (total == 0) {
        throw ValidationException("No input frames");
    }
    // fail before the slow passes
    GeneralLogger::info("Frame delay: " + std::to_string(toCentiseconds(delayMillis)) + " cs", GeneralLogger::STEP);

    GeneralLogger::info("Sampling colors of " + std::to_string(total) + " frames...");
    const auto sampling = samplePalette(sequence, progress);

    GeneralLogger::info("Quantizing frames...");
    auto frames         = quantizeFrames(sequence, sampling, threadCount, progress);
    const auto document = assemble(std::move(frames), delayMillis);

    GeneralLogger::info("Writing GIF...");
    if (progress) {
        progress->publish({
            .stage           = Stage::Writing,
            .currentItemName = WRITING_ITEM,
            .processedCount  = total,
            .totalCount      = total,
        });
    }
    const auto writer = NaiveIO::FileWriter::create(outputPath);
    try {
        writeDocument(document, [&writer](const span<const uint8_t>& chunk) {
            return writer->write(chunk) == chunk.size();
        });
        if (!writer->close()) {
            throw NaiveIO::FileWriterException("Failed to close output file: " + outputPath);
        }
    } catch (...) {
        GeneralLogger::warn("Removing incomplete output file: " + outputPath);
        writer->deleteFile();
        throw;
    }
    GeneralLogger::info("Output file: " + writer->getFilePath() + " (" + std::to_string(writer->getWrittenSize()) +
                        " bytes)");

    if (progress) {
        vector<string> files;
        files.reserve(total);
        for (uint32_t i = 0; i < total; ++i) {
            files.push_back(sequence.getFrameName(i));
        }
        progress->publish({
            .stage           = Stage::Done,
            .currentItemName = outputPath,
            .processedCount  = total,
            .totalCount      = total,
            .finalOutputPath = outputPath,
            .processedFiles  = std::move(files),
        });
    }
}

bool
GIFSeq::gifSeqEncode(const Options& args, ProgressChannel* progress) noexcept {
    GeneralLogger::info("Starting GIF sequence encoding...");
    GeneralLogger::info("Output file: " + args.outputPath, GeneralLogger::STEP);
    GeneralLogger::info("Frame duration: " + std::to_string(args.delay) + " ms", GeneralLogger::STEP);

    try {
        const auto files = args.inputFiles.empty() ? expandInputPatterns(args.inputPatterns) : args.inputFiles;
        validateInputFiles(files);
        GeneralLogger::info("Input files: " + std::to_string(files.size()), GeneralLogger::STEP);
        for (const auto& file : files) {
            GeneralLogger::info(file, GeneralLogger::DETAIL);
        }

        const auto sequence = GIFImage::ImageSequence::open(files);
        encodeSequence(*sequence, args.outputPath, args.delay, args.threadCount, progress);
        return true;
    } catch (const InputException& e) {
        GeneralLogger::error("Invalid input: " + string(e.what()));
    } catch (const ImageParseException& e) {
        GeneralLogger::error("Failed to read image: " + string(e.what()));
    } catch (const ValidationException& e) {
        GeneralLogger::error("Invalid parameters: " + string(e.what()));
    } catch (const NaiveIO::FileWriterException& e) {
        GeneralLogger::error("Failed to write GIF file: " + string(e.what()));
    } catch (const GIFEnc::GIFEncodeException& e) {
        GeneralLogger::error("Failed to encode GIF: " + string(e.what()));
    } catch (const std::exception& e) {
        GeneralLogger::error("Unexpected error: " + string(e.what()));
    }
    if (progress) {
        progress->close();
    }
    return false;
}
