/**
 * @file string_utils.cpp
 * @brief Common string utility functions implementation
 */

#include "fdr/utils/string_utils.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace fdr {
namespace utils {

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string toUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }

    if (start == str.length()) {
        return "";
    }

    size_t end = str.length();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }

    return str.substr(start, end - start);
}

std::optional<std::pair<std::string, std::string>> splitFirst(
    const std::string& str,
    char delimiter
) {
    size_t pos = str.find(delimiter);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return std::make_pair(str.substr(0, pos), str.substr(pos + 1));
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<int> parseInt(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    // strtol accepts leading whitespace and a sign; ports are plain digits
    if (!std::isdigit(static_cast<unsigned char>(str.front()))) {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    long value = std::strtol(str.c_str(), &end, 10);

    if (end == str.c_str() || *end != '\0' || errno == ERANGE) {
        return std::nullopt;
    }
    if (value < INT_MIN || value > INT_MAX) {
        return std::nullopt;
    }

    return static_cast<int>(value);
}

} // namespace utils
} // namespace fdr
