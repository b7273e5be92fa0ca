#pragma once

/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Common string operations used across the FDR status services.
 *
 * @version 1.0.0
 * @date 2026-10-18
 */

#include <string>
#include <optional>
#include <utility>

namespace fdr {
namespace utils {

/**
 * @brief Convert string to lowercase
 *
 * @param str Input string
 * @return Lowercase string
 */
std::string toLower(const std::string& str);

/**
 * @brief Convert string to uppercase
 *
 * @param str Input string
 * @return Uppercase string
 */
std::string toUpper(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Split at the first occurrence of a delimiter
 *
 * @param str Input string
 * @param delimiter Delimiter character
 * @return {before, after}, or std::nullopt if the delimiter is absent
 *
 * @example
 * splitFirst("A=B=C", '=')  // {"A", "B=C"}
 */
std::optional<std::pair<std::string, std::string>> splitFirst(
    const std::string& str,
    char delimiter
);

/**
 * @brief Check whether a string starts with a prefix
 */
bool startsWith(const std::string& str, const std::string& prefix);

/**
 * @brief Check whether a string ends with a suffix
 */
bool endsWith(const std::string& str, const std::string& suffix);

/**
 * @brief Parse a complete unsigned decimal integer
 *
 * Unlike std::stoi, the whole string must be digits: "80x", "", " 80",
 * "+80", "-1" and values outside the int range all yield std::nullopt.
 *
 * @param str Input string
 * @return Parsed value, or std::nullopt
 */
std::optional<int> parseInt(const std::string& str);

} // namespace utils
} // namespace fdr
