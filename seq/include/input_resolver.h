#ifndef GIFSEQ_INPUT_RESOLVER_H
#define GIFSEQ_INPUT_RESOLVER_H

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace GIFSeq {

inline constexpr std::array<std::string_view, 2> ALLOWED_EXTENSIONS{".png", ".webp"};

[[nodiscard]] bool
isAllowedImage(const std::string& path) noexcept;

/**
 * @brief Expand a file name pattern into the matching image files, sorted.
 *
 * The part after the last '/' is matched against the entries of the
 * directory before it ("." if there is no '/'). It is first tried as a shell
 * glob, which also covers plain file names. If that finds nothing and the
 * pattern looks like a regular expression, it is searched for in each name.
 * Only regular files with an allowed extension count.
 *
 * @throws InputException on a missing directory, an invalid regular expression
 *         or when nothing matches.
 */
std::vector<std::string>
expandInputPattern(const std::string& pattern);

/**
 * @brief expandInputPattern() for each pattern, results concatenated in order.
 */
std::vector<std::string>
expandInputPatterns(const std::vector<std::string>& patterns);

/**
 * @throws InputException on an empty list, a file with an unsupported
 *         extension or a file that does not exist.
 */
void
validateInputFiles(const std::vector<std::string>& files);

}  // namespace GIFSeq

#endif  // GIFSEQ_INPUT_RESOLVER_H
