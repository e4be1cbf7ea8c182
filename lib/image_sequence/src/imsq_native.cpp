#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "def.h"
#include "file_utils.h"
#include "imsq.h"
#include "imsq_decoders.h"
#include "imsq_exception.h"
#include "log.h"

using std::string, std::vector;

class ImageSequenceFileImpl : public GIFImage::ImageSequence {
  public:
    explicit ImageSequenceFileImpl(vector<string> paths) noexcept
        : m_paths(std::move(paths)) {}

    ~ImageSequenceFileImpl() noexcept override = default;

    [[nodiscard]] uint32_t
    getFrameCount() const noexcept override {
        return static_cast<uint32_t>(m_paths.size());
    }

    [[nodiscard]] const string&
    getFrameName(const uint32_t index) const override {
        if (index >= m_paths.size()) {
            throw ImageParseException("Frame index out of range: " + std::to_string(index));
        }
        return m_paths[index];
    }

    [[nodiscard]] GIFImage::Frame
    getFrame(const uint32_t index) const override {
        return GIFImage::ImageSequence::decode(getFrameName(index));
    }

  private:
    vector<string> m_paths;
};

class ImageSequenceNativeImpl : public GIFImage::ImageSequence {
  public:
    ImageSequenceNativeImpl(vector<GIFImage::Frame> frames, vector<string> names) noexcept
        : m_frames(std::move(frames)),
          m_names(std::move(names)) {}

    ~ImageSequenceNativeImpl() noexcept override = default;

    [[nodiscard]] uint32_t
    getFrameCount() const noexcept override {
        return static_cast<uint32_t>(m_frames.size());
    }

    [[nodiscard]] const string&
    getFrameName(const uint32_t index) const override {
        if (index >= m_names.size()) {
            throw ImageParseException("Frame index out of range: " + std::to_string(index));
        }
        return m_names[index];
    }

    [[nodiscard]] GIFImage::Frame
    getFrame(const uint32_t index) const override {
        if (index >= m_frames.size()) {
            throw ImageParseException("Frame index out of range: " + std::to_string(index));
        }
        return m_frames[index];
    }

  private:
    vector<GIFImage::Frame> m_frames;
    vector<string> m_names;
};

GIFImage::ImageSequence::Ref
GIFImage::ImageSequence::open(const vector<string>& paths) {
    return std::make_unique<ImageSequenceFileImpl>(paths);
}

GIFImage::ImageSequence::Ref
GIFImage::ImageSequence::load(vector<Frame> frames, vector<string> names) {
    if (!names.empty() && names.size() != frames.size()) {
        throw ImageParseException("Frame names do not match frame count: " + std::to_string(names.size()) +
                                  " != " + std::to_string(frames.size()));
    }
    for (size_t i = 0; i < frames.size(); ++i) {
        const auto& frame = frames[i];
        if (frame.width == 0 || frame.height == 0 ||
            frame.buffer.size() != static_cast<size_t>(frame.width) * frame.height) {
            throw ImageParseException("Frame " + std::to_string(i) + " does not match its dimensions");
        }
    }
    if (names.empty()) {
        names.reserve(frames.size());
        for (size_t i = 0; i < frames.size(); ++i) {
            names.push_back("frame " + std::to_string(i));
        }
    }
    return std::make_unique<ImageSequenceNativeImpl>(std::move(frames), std::move(names));
}

GIFImage::Frame
GIFImage::ImageSequence::decode(const string& path) {
    if (NaiveIO::checkFileExists(path).empty()) {
        throw ImageParseException(path, "file does not exist");
    }
    if (NaiveIO::getExtName(path) == ".webp") {
        return decodeWithWebP(path);
    }
    return decodeWithFFmpeg(path);
}
