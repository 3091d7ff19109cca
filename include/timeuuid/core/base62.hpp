/**
 * @file base62.hpp
 * @brief Base-62 encoding of unsigned integers.
 *
 * Digits are taken from "0-9A-Za-z" in that order, most significant first.
 *
 * @copyright Copyright (c) 2024 timeuuid Contributors
 * @license MIT License
 */

#pragma once

#include "timeuuid/core/export.hpp"

#include <cstdint>
#include <string>

namespace timeuuid {
namespace core {

/**
 * @class Base62
 * @brief Stateless base-62 codec.
 *
 * Usage:
 * @code
 * std::string text = Base62::encode(3843);   // "zz"
 * uint64_t value = Base62::decode("zz");     // 3843
 * @endcode
 */
class TIMEUUID_CORE_API Base62 {
public:
    static constexpr uint64_t BASE = 62;
    static const char ALPHABET[];

    /**
     * @brief Encode @p value. Zero encodes as "0".
     */
    static std::string encode(uint64_t value);

    /**
     * @brief Decode @p text, the exact inverse of encode().
     *
     * Leading '0' digits are accepted and contribute nothing.
     *
     * @throws InvalidEncodingError if @p text is empty, holds a character
     *         outside the alphabet, or does not fit in 64 bits.
     */
    static uint64_t decode(const std::string& text);

    /**
     * @brief Value of a single digit, or -1 if @p c is not in the alphabet.
     */
    static int digitValue(char c);
};

}  // namespace core
}  // namespace timeuuid
