#ifndef NAIVEIO_FILE_READER_H
#define NAIVEIO_FILE_READER_H

#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace NaiveIO {

class FileReaderException final : public std::exception {
  public:
    explicit FileReaderException(const std::string&& msg)
        : msg(msg) {}

    [[nodiscard]] inline const char*
    what() const noexcept override {
        return msg.c_str();
    }

  private:
    std::string msg;
};

class FileReader {
  public:
    using Ref = std::unique_ptr<FileReader>;

    /**
     * @return nullptr if the file does not exist or cannot be opened
     */
    static Ref
    create(const std::string& fileName) noexcept;

    virtual ~FileReader() = default;

    virtual bool
    close() = 0;

    [[nodiscard]] virtual bool
    isOpen() const = 0;

    [[nodiscard]] virtual bool
    isEOF() const = 0;

    virtual size_t
    read(const std::span<uint8_t>& buffer) = 0;

    /**
     * @brief Read from the current position to the end of the file.
     */
    std::vector<uint8_t>
    readAll();
};

}  // namespace NaiveIO

#endif  // NAIVEIO_FILE_READER_H
