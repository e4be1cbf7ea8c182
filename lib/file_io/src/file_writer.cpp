#include "file_writer.h"

#include <filesystem>
#include <fstream>

#include "file_utils.h"
#include "log.h"

using namespace NaiveIO;

class FileWriterImpl final : public NaiveIO::FileWriter {
  public:
    explicit FileWriterImpl(const std::string& path) {
        m_filePath = std::filesystem::path(localizePath(path));
        m_file.open(m_filePath, std::ios::binary | std::ios::trunc);
        if (!m_file.is_open()) {
            throw FileWriterException("Failed to open output file: " + path);
        }
        GeneralLogger::info("Opened output file: " + path, GeneralLogger::DETAIL);
    }

    ~FileWriterImpl() override {
        close();
    }

    bool
    close() noexcept override {
        if (isOpen()) {
            m_file.close();
            return !m_file.fail();
        }
        return false;
    }

    [[nodiscard]] bool
    isOpen() const noexcept override {
        return m_file.is_open();
    }

    [[nodiscard]] size_t
    getWrittenSize() const noexcept override {
        return m_writtenSize;
    }

    size_t
    write(const std::span<const uint8_t>& buffer) override {
        if (!isOpen()) {
            throw FileWriterException("File is not open: " + getFilePath());
        }
        m_file.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        if (m_file.fail()) {
            throw FileWriterException("Failed to write to file: " + getFilePath());
        }
        m_writtenSize += buffer.size();
        return buffer.size();
    }

    bool
    deleteFile() noexcept override {
        if (isOpen()) {
            close();
        }
        std::error_code ec;
        if (std::filesystem::exists(m_filePath, ec)) {
            return std::filesystem::remove(m_filePath, ec);
        }
        return false;
    }

    [[nodiscard]] std::string
    getFilePath() const noexcept override {
        return deLocalizePath(m_filePath);
    }

  private:
    std::filesystem::path m_filePath;
    std::ofstream m_file;
    size_t m_writtenSize = 0;
};

NaiveIO::FileWriter::Ref
NaiveIO::FileWriter::create(const std::string& fileName) {
    return std::make_unique<FileWriterImpl>(fileName);
}
