/**
 * @file base62.cpp
 * @brief Base62 implementation.
 *
 * @copyright Copyright (c) 2024 timeuuid Contributors
 * @license MIT License
 */

#include "timeuuid/core/base62.hpp"
#include "timeuuid/core/errors.hpp"

#include <algorithm>
#include <limits>

namespace timeuuid {
namespace core {

const char Base62::ALPHABET[] =
    "0123456789"
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz";

std::string Base62::encode(uint64_t value) {
    if (value == 0) {
        return std::string(1, ALPHABET[0]);
    }

    std::string result;
    while (value > 0) {
        result.push_back(ALPHABET[value % BASE]);
        value /= BASE;
    }
    std::reverse(result.begin(), result.end());
    return result;
}

uint64_t Base62::decode(const std::string& text) {
    if (text.empty()) {
        throw InvalidEncodingError("empty base62 string");
    }

    constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
    uint64_t value = 0;

    for (char c : text) {
        int digit = digitValue(c);
        if (digit < 0) {
            throw InvalidEncodingError("invalid base62 character '" + std::string(1, c) +
                                       "' in \"" + text + "\"");
        }
        if (value > (kMax - static_cast<uint64_t>(digit)) / BASE) {
            throw InvalidEncodingError("base62 value overflows 64 bits: \"" + text + "\"");
        }
        value = value * BASE + static_cast<uint64_t>(digit);
    }

    return value;
}

int Base62::digitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
    if (c >= 'a' && c <= 'z') return c - 'a' + 36;
    return -1;
}

}  // namespace core
}  // namespace timeuuid
