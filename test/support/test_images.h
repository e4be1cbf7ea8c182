#ifndef GIFSEQ_TEST_IMAGES_H
#define GIFSEQ_TEST_IMAGES_H

#include <filesystem>
#include <string>
#include <vector>

#include "def.h"
#include "imsq.h"

namespace TestSupport {

// fresh directory under the system temp dir, removed with its contents
class TempDir {
  public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&)            = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path&
    path() const noexcept {
        return m_path;
    }

    [[nodiscard]] std::string
    file(const std::string& name) const;

    // empty file
    void
    touch(const std::string& name) const;

  private:
    std::filesystem::path m_path;
};

GIFImage::Frame
solidFrame(uint32_t width, uint32_t height, const PixelBGRA& color);

// vertical stripes cycling through colors, each stripeWidth pixels wide
GIFImage::Frame
stripedFrame(uint32_t width, uint32_t height, const std::vector<PixelBGRA>& colors, uint32_t stripeWidth = 1);

// RGBA PNG, throws std::runtime_error on failure
void
writePng(const std::string& path, const GIFImage::Frame& frame);

std::vector<uint8_t>
readFile(const std::string& path);

}  // namespace TestSupport

#endif  // GIFSEQ_TEST_IMAGES_H
