#include "input_resolver.h"

#include <fnmatch.h>

#include <algorithm>
#include <filesystem>
#include <regex>
#include <system_error>

#include "file_utils.h"
#include "log.h"
#include "seq_exception.h"

using std::string, std::vector;

static constexpr std::string_view REGEX_META_CHARS = ".*+?[](){}|";

static bool
looksLikeRegex(const string& pattern) {
    return (!pattern.empty() && pattern[0] == '^') || pattern.find_first_of(REGEX_META_CHARS) != string::npos;
}

static string
joinPath(const string& dir, const string& name) {
    if (dir.empty()) {
        return name;
    }
    if (dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

bool
GIFSeq::isAllowedImage(const string& path) noexcept {
    const auto ext = NaiveIO::getExtName(path);
    return std::find(ALLOWED_EXTENSIONS.begin(), ALLOWED_EXTENSIONS.end(), ext) != ALLOWED_EXTENSIONS.end();
}

vector<string>
GIFSeq::expandInputPattern(const string& pattern) {
    const auto sep   = pattern.find_last_of('/');
    const string dir = sep == string::npos ? "" : (sep == 0 ? "/" : pattern.substr(0, sep));
    const string base = sep == string::npos ? pattern : pattern.substr(sep + 1);

    const std::filesystem::path dirPath(NaiveIO::localizePath(dir.empty() ? "." : dir));
    std::error_code ec;
    if (!std::filesystem::is_directory(dirPath, ec)) {
        throw InputException("Input directory does not exist: " + (dir.empty() ? string(".") : dir));
    }

    vector<string> names;
    for (const auto& entry : std::filesystem::directory_iterator(dirPath, ec)) {
        std::error_code entryEc;
        if (!entry.is_regular_file(entryEc)) {
            continue;
        }
        auto name = NaiveIO::deLocalizePath(entry.path().filename());
        if (isAllowedImage(name)) {
            names.push_back(std::move(name));
        }
    }
    if (ec) {
        throw InputException("Failed to list directory " + dirPath.string() + ": " + ec.message());
    }

    vector<string> matched;
    for (const auto& name : names) {
        if (fnmatch(base.c_str(), name.c_str(), 0) == 0) {
            matched.push_back(name);
        }
    }

    if (matched.empty() && looksLikeRegex(base)) {
        GeneralLogger::info("No glob match, trying " + base + " as a regular expression", GeneralLogger::STEP);
        std::regex re;
        try {
            re = std::regex(base, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw InputException("Invalid regular expression " + base + ": " + e.what());
        }
        for (const auto& name : names) {
            if (std::regex_search(name, re)) {
                matched.push_back(name);
            }
        }
    }

    if (matched.empty()) {
        throw InputException("No image files found matching pattern: " + pattern);
    }

    std::sort(matched.begin(), matched.end());
    vector<string> ret;
    ret.reserve(matched.size());
    for (const auto& name : matched) {
        ret.push_back(joinPath(dir, name));
    }
    GeneralLogger::info(pattern + " matched " + std::to_string(ret.size()) + " file(s)", GeneralLogger::STEP);
    return ret;
}

vector<string>
GIFSeq::expandInputPatterns(const vector<string>& patterns) {
    vector<string> ret;
    for (const auto& pattern : patterns) {
        const auto files = expandInputPattern(pattern);
        ret.insert(ret.end(), files.begin(), files.end());
    }
    return ret;
}

void
GIFSeq::validateInputFiles(const vector<string>& files) {
    if (files.empty()) {
        throw InputException("No input files provided");
    }
    for (const auto& file : files) {
        if (!isAllowedImage(file)) {
            throw InputException("Unsupported file type (expected .png or .webp): " + file);
        }
        if (NaiveIO::checkFileExists(file).empty()) {
            throw InputException("Input file does not exist: " + file);
        }
    }
}
