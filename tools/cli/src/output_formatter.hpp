/**
 * @file output_formatter.hpp
 * @brief Output formatting for CLI (plain text and JSON)
 */

#pragma once

#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace timeuuid::cli {

/**
 * @brief Output formatter supporting plain text and JSON
 */
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode = false);

    void print_error(const std::string& message);
    void print_bulk_string(const std::string& value);

    // Numbered list, or a JSON array
    void print_array(const std::vector<std::string>& items);

    // Aligned "key: value" lines, or a JSON object
    void print_key_values(const std::vector<std::pair<std::string, std::string>>& pairs);

    // Plain text only; ignored in JSON mode
    void print_line(const std::string& text);

    static std::string escape_json_string(const std::string& s);

private:
    bool json_mode_;
};

/**
 * @brief RAII helper that captures std::cout for its lifetime
 */
class OutputBuffer {
public:
    OutputBuffer();
    ~OutputBuffer();

    OutputBuffer(const OutputBuffer&) = delete;
    OutputBuffer& operator=(const OutputBuffer&) = delete;

    std::string str() const;

private:
    std::stringstream buffer_;
    std::streambuf* old_cout_;
};

} // namespace timeuuid::cli
