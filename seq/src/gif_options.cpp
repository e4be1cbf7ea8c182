#include "gif_options.h"

#include <iostream>
#include <thread>

// patterns are taken whole, regular expressions may contain commas
#define CXXOPTS_VECTOR_DELIMITER '\0'
#include "cxxopts.hpp"
#include "log.h"

using namespace GIFSeq;
using std::string, std::vector;

static uint32_t
getThreadCount() {
    uint32_t threadCount = std::thread::hardware_concurrency();
    return threadCount == 0 ? 1 : (threadCount > Options::Limits::autoThreads ? Options::Limits::autoThreads : threadCount);
}

class OptionInvalidException final : public std::exception {
  public:
    explicit OptionInvalidException(const std::string&& msg)
        : msg(msg) {}

    [[nodiscard]] const char*
    what() const noexcept override {
        return msg.c_str();
    }

  private:
    std::string msg;
};

std::optional<Options>
Options::parseArgs(int argc, const char* const* argv) noexcept {
    cxxopts::Options options("gifseq", "Combine a sequence of images into one animated GIF");

    options.add_options()
        //
        ("command", "Command to run, only 'convert' is available", cxxopts::value<string>())
        //
        ("i,input",
         "Input file pattern, a shell glob or a regular expression. May be repeated.",
         cxxopts::value<vector<string>>())
        //
        ("o,output", "Output GIF file.", cxxopts::value<string>())
        //
        ("d,delay",
         "Frame duration in milliseconds, stored in hundredths of a second. Max: " + std::to_string(Limits::delay),
         cxxopts::value<int64_t>()->default_value(std::to_string(Defaults::delay)))
        //
        ("p,threads",
         "Number of threads used for quantization, 0 = auto-detect.",
         cxxopts::value<uint32_t>()->default_value(std::to_string(Defaults::threadCount)))
        //
        ("debug", "Verbose logging and a detailed summary")
        //
        ("h,help", "Show help message");

    options.positional_help("convert");
    options.parse_positional({"command"});

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return std::nullopt;
        }

        if (!result.count("command")) {
            throw OptionInvalidException("A command is required: " + string(Defaults::command));
        }
        if (const auto command = result["command"].as<string>(); command != Defaults::command) {
            throw OptionInvalidException("Unknown command: " + command);
        }
        if (!result.count("input") || !result.count("output")) {
            throw OptionInvalidException("'--input' and '--output' arguments are required.");
        }

        Options gifOptions;
        gifOptions.inputPatterns = result["input"].as<vector<string>>();
        gifOptions.outputPath    = result["output"].as<string>();
        gifOptions.delay         = result["delay"].as<int64_t>();
        gifOptions.threadCount   = result["threads"].as<uint32_t>();
        gifOptions.debug         = result.count("debug") > 0;

        if (gifOptions.threadCount == 0) {
            gifOptions.threadCount = getThreadCount();
        }

        gifOptions.ensureValid();

        GeneralLogger::verbose = gifOptions.debug;
        return gifOptions;
    } catch (const cxxopts::exceptions::exception& e) {
        GeneralLogger::error("Error parsing command line arguments: " + string(e.what()));
        std::cout << options.help() << std::endl;
        return std::nullopt;
    } catch (const OptionInvalidException& e) {
        GeneralLogger::error("Invalid argument: " + string(e.what()));
        std::cout << options.help() << std::endl;
        return std::nullopt;
    } catch (const std::exception& e) {
        GeneralLogger::error("Unexpected error: " + string(e.what()));
        return std::nullopt;
    }
}

void
Options::ensureValid() const {
    if (inputPatterns.empty() && inputFiles.empty()) {
        throw OptionInvalidException("At least one input pattern is required.");
    }
    for (const auto& pattern : inputPatterns) {
        if (pattern.empty()) {
            throw OptionInvalidException("Input pattern must not be empty.");
        }
    }
    if (outputPath.empty()) {
        throw OptionInvalidException("Output file is required.");
    }
    if (threadCount == 0 || threadCount > Limits::threadCount) {
        throw OptionInvalidException("Thread count must be between 1 and " + std::to_string(Limits::threadCount) +
                                     ".");
    }
    // delay is range-checked by the assembler
}
