/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Small string helpers shared by the document value types and the
 * configuration layer.
 */

#pragma once

#include <cstddef>
#include <string>

namespace bras {
namespace utils {

/**
 * @brief Convert string to lowercase
 *
 * @param str Input string
 * @return Lowercase string
 */
std::string toLower(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Keep only ASCII decimal digits, in order
 *
 * @param str Input string
 * @return Digit characters of str ("984.844.854-39" -> "98484485439")
 */
std::string digitsOnly(const std::string& str);

/**
 * @brief Left-pad a string to a minimum width
 *
 * Strings already at or above width are returned unchanged.
 *
 * @param str Input string
 * @param width Minimum resulting length
 * @param fill Padding character
 * @return Padded string
 */
std::string padLeft(const std::string& str, size_t width, char fill = '0');

/**
 * @brief Check if a string is one character repeated
 *
 * @param str Input string
 * @return true if str is non-empty and every character equals the first
 */
bool allSameChar(const std::string& str);

} // namespace utils
} // namespace bras
