#ifndef NAIVEIO_FILE_UTILS_H
#define NAIVEIO_FILE_UTILS_H

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>

#ifdef _WIN32

#include <windows.h>
#endif

namespace NaiveIO {

#ifdef _WIN32

inline std::wstring
localizePath(const std::string& str) {
    int size_needed = MultiByteToWideChar(CP_UTF8, 0, str.c_str(), (int)str.size(), nullptr, 0);
    std::wstring wstr(size_needed, 0);
    MultiByteToWideChar(CP_UTF8, 0, str.c_str(), (int)str.size(), &wstr[0], size_needed);
    return wstr;
}

inline std::string
deLocalizePath(const std::wstring& wstr) {
    int size_needed = WideCharToMultiByte(CP_UTF8, 0, wstr.c_str(), (int)wstr.size(), nullptr, 0, nullptr, nullptr);
    std::string str(size_needed, 0);
    WideCharToMultiByte(CP_UTF8, 0, wstr.c_str(), (int)wstr.size(), &str[0], size_needed, nullptr, nullptr);
    return str;
}

inline std::string
deLocalizePath(const std::filesystem::path& path) {
    std::wstring wstr = path.wstring();
    int size_needed   = WideCharToMultiByte(CP_UTF8, 0, wstr.c_str(), (int)wstr.size(), nullptr, 0, nullptr, nullptr);
    std::string str(size_needed, 0);
    WideCharToMultiByte(CP_UTF8, 0, wstr.c_str(), (int)wstr.size(), &str[0], size_needed, nullptr, nullptr);
    return str;
}

#else  // _WIN32

inline std::string
localizePath(const std::string& str) {
    return str;
}

inline std::string
deLocalizePath(const std::string& str) {
    return str;
}

inline std::string
deLocalizePath(const std::filesystem::path& path) {
    return path.string();
}

#endif  // _WIN32

/**
 * @return lower-cased extension including the dot, empty if there is none
 */
inline std::string
getExtName(const std::string& str) {
    const auto pos = str.find_last_of('.');
    const auto sep = str.find_last_of("/\\");
    if (pos == std::string::npos || (sep != std::string::npos && pos < sep)) {
        return "";
    }
    std::string ext = str.substr(pos);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext;
}

/**
 * @return the localized path if it names an existing regular file, empty otherwise
 */
inline auto
checkFileExists(const std::string& filename) {
    auto localized = NaiveIO::localizePath(filename);
    std::error_code ec;
    if (const std::filesystem::path filePath(localized); std::filesystem::is_regular_file(filePath, ec)) {
        return localized;
    } else {
        return decltype(localized)();
    }
}

}  // namespace NaiveIO

#endif  // NAIVEIO_FILE_UTILS_H