/**
 * @file string_utils.hpp
 * @brief String helpers for command parsing
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace timeuuid::cli::utils {

/**
 * @brief Upper-case copy (command names are matched upper-case)
 */
inline std::string to_upper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

/**
 * @brief Lower-case copy (format names are matched lower-case)
 */
inline std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

inline std::string trim(const std::string& str) {
    const char* ws = " \t\r\n";
    size_t start = str.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(ws);
    return str.substr(start, end - start + 1);
}

/**
 * @brief Split a command line on whitespace; single or double quotes group words
 */
inline std::vector<std::string> tokenize(const std::string& input) {
    std::vector<std::string> tokens;
    std::string current;
    bool has_token = false;
    char quote = '\0';

    for (char c : input) {
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            } else {
                current += c;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
            has_token = true;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (has_token) {
                tokens.push_back(current);
                current.clear();
                has_token = false;
            }
        } else {
            current += c;
            has_token = true;
        }
    }

    if (has_token) {
        tokens.push_back(current);
    }
    return tokens;
}

/**
 * @brief Parse a decimal count; std::nullopt unless the whole string is digits
 */
inline std::optional<uint64_t> parse_unsigned(const std::string& str) {
    if (str.empty() || str.size() > 19) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (char c : str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    return value;
}

} // namespace timeuuid::cli::utils
