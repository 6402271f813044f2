/**
 * @file string_utils.cpp
 * @brief String utility functions implementation
 */

#include "bras/utils/string_utils.h"
#include <algorithm>
#include <cctype>

namespace bras {
namespace utils {

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
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

std::string digitsOnly(const std::string& str) {
    std::string result;
    result.reserve(str.length());

    // std::isdigit is locale-sensitive; only ASCII '0'-'9' count here
    for (char c : str) {
        if (c >= '0' && c <= '9') {
            result.push_back(c);
        }
    }
    return result;
}

std::string padLeft(const std::string& str, size_t width, char fill) {
    if (str.length() >= width) {
        return str;
    }
    return std::string(width - str.length(), fill) + str;
}

bool allSameChar(const std::string& str) {
    if (str.empty()) {
        return false;
    }
    return std::all_of(str.begin(), str.end(),
                       [&str](char c) { return c == str.front(); });
}

} // namespace utils
} // namespace bras
