#pragma once

#include <filesystem>
#include <string>

namespace ptyrun {

/**
 * @brief Reads the whole content of a text file
 * @param path path of the text file
 * @return the content of the file, encoding unspecified
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief Reads the whole content of a text file
 * @param def returned if the file does not exist
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief True if the string is well-formed UTF-8 (surrogates are rejected)
 */
bool utf8_check_is_valid(const std::string &string);

/**
 * @brief Replaces every byte that is not part of a well-formed sequence
 * with U+FFFD, the way a lossy decoder would
 * @return the string itself if it is already valid
 */
std::string utf8_replace_invalid(const std::string &string);

/**
 * @brief Counts the characters of a UTF-8 string
 * A well-formed sequence is one character. Every other byte, such as a
 * stray continuation byte or a truncated sequence, is a character of its own.
 */
size_t utf8_length(const std::string &string);

/**
 * @brief Keeps the first `limit` characters of a UTF-8 string
 * Characters are counted as in utf8_length, so a well-formed sequence is
 * never split.
 */
std::string utf8_head(const std::string &string, size_t limit);

/**
 * @brief Keeps the last `limit` characters of a UTF-8 string
 * Characters are counted as in utf8_length. The result holds at most
 * 4 * limit bytes.
 */
std::string utf8_tail(const std::string &string, size_t limit);

}  // namespace ptyrun
