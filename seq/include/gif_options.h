#ifndef GIFSEQ_GIF_OPTIONS_H
#define GIFSEQ_GIF_OPTIONS_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace GIFSeq {

class Options {
  public:
    struct Defaults {
        static constexpr const char* command  = "convert";
        static constexpr int64_t delay        = 100;  // in milliseconds
        static constexpr uint32_t threadCount = 0;    // 0 means auto-detect
    };

    struct Limits {
        static constexpr int64_t delay        = 655359;  // u16 hundredths of a second
        static constexpr uint32_t threadCount = 64;
        static constexpr uint32_t autoThreads = 4;
    };

    std::vector<std::string> inputPatterns;  // as given, in flag order
    std::vector<std::string> inputFiles;     // resolved, filled by gifSeqEncode when empty
    std::string outputPath;
    int64_t delay        = Defaults::delay;
    uint32_t threadCount = Defaults::threadCount;
    bool debug           = false;

  public:
    /**
     * @brief Parse "convert -i <pattern>... -o <output>" style arguments.
     *        Also switches GeneralLogger::verbose on for --debug.
     * @return std::nullopt after printing help or an error
     */
    static std::optional<Options>
    parseArgs(int argc, const char* const* argv) noexcept;

    /**
     * @throws OptionInvalidException
     */
    void
    ensureValid() const;
};

}  // namespace GIFSeq

#endif  // GIFSEQ_GIF_OPTIONS_H
