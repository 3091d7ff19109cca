/**
 * @file output_formatter.cpp
 * @brief Output formatting implementation
 */

#include "output_formatter.hpp"

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <iostream>

namespace timeuuid::cli {

OutputFormatter::OutputFormatter(bool json_mode)
    : json_mode_(json_mode) {}

void OutputFormatter::print_error(const std::string& message) {
    if (json_mode_) {
        std::cout << R"({"error":")" << escape_json_string(message) << "\"}\n";
    } else {
        std::cerr << "(error) " << message << "\n";
    }
}

void OutputFormatter::print_bulk_string(const std::string& value) {
    if (json_mode_) {
        std::cout << "\"" << escape_json_string(value) << "\"\n";
    } else {
        std::cout << value << "\n";
    }
}

void OutputFormatter::print_array(const std::vector<std::string>& items) {
    if (json_mode_) {
        std::cout << "[";
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) std::cout << ",";
            std::cout << "\"" << escape_json_string(items[i]) << "\"";
        }
        std::cout << "]\n";
        return;
    }

    if (items.empty()) {
        std::cout << "(empty array)\n";
        return;
    }
    // A single identifier prints bare so the output can be used in scripts.
    if (items.size() == 1) {
        std::cout << items[0] << "\n";
        return;
    }
    for (size_t i = 0; i < items.size(); ++i) {
        std::cout << std::setw(3) << (i + 1) << ") " << items[i] << "\n";
    }
}

void OutputFormatter::print_key_values(const std::vector<std::pair<std::string, std::string>>& pairs) {
    if (json_mode_) {
        std::cout << "{";
        for (size_t i = 0; i < pairs.size(); ++i) {
            if (i > 0) std::cout << ",";
            std::cout << "\"" << escape_json_string(pairs[i].first) << "\":\""
                      << escape_json_string(pairs[i].second) << "\"";
        }
        std::cout << "}\n";
        return;
    }

    size_t max_key_len = 0;
    for (const auto& [key, _] : pairs) {
        max_key_len = std::max(max_key_len, key.size());
    }
    for (const auto& [key, value] : pairs) {
        std::cout << std::left << std::setw(static_cast<int>(max_key_len + 1)) << (key + ":")
                  << " " << value << "\n";
    }
    std::cout << std::right;
}

void OutputFormatter::print_line(const std::string& text) {
    if (!json_mode_) {
        std::cout << text << "\n";
    }
}

std::string OutputFormatter::escape_json_string(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

// OutputBuffer implementation
OutputBuffer::OutputBuffer() {
    old_cout_ = std::cout.rdbuf(buffer_.rdbuf());
}

OutputBuffer::~OutputBuffer() {
    std::cout.rdbuf(old_cout_);
}

std::string OutputBuffer::str() const {
    return buffer_.str();
}

} // namespace timeuuid::cli
