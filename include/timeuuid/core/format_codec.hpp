/**
 * @file format_codec.hpp
 * @brief Textual encodings of a time-based UUID.
 *
 * A UUID is carried as five unsigned fields and rendered in one of four
 * formats:
 * - default: 01234567-abcd-8901-efab-234567890123
 * - compact: 01234567abcd8901efab234567890123
 * - urn:     urn:uuid:01234567-abcd-8901-efab-234567890123
 * - teenie:  each field in base 62, fixed columns {6, 3, 3, 3, 9}
 *
 * @copyright Copyright (c) 2024 timeuuid Contributors
 * @license MIT License
 */

#pragma once

#include "timeuuid/core/export.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace timeuuid {
namespace core {

/**
 * @enum Format
 * @brief Supported textual formats.
 */
enum class Format {
    Default,
    Compact,
    Urn,
    Teenie
};

/// All formats, in declaration order.
constexpr std::array<Format, 4> kAllFormats = {
    Format::Default, Format::Compact, Format::Urn, Format::Teenie
};

/**
 * @struct UuidFields
 * @brief The five logical fields of a UUID.
 */
struct TIMEUUID_CORE_API UuidFields {
    uint32_t time_low = 0;          ///< Low 32 bits of the clock tick
    uint16_t time_mid = 0;          ///< Next 16 bits of the clock tick
    uint16_t time_hi_version = 0;   ///< Top 12 bits of the tick | version tag
    uint16_t clock_seq = 0;         ///< Generator sequence number
    uint64_t node = 0;              ///< 48-bit node identifier

    bool operator==(const UuidFields& other) const {
        return time_low == other.time_low &&
               time_mid == other.time_mid &&
               time_hi_version == other.time_hi_version &&
               clock_seq == other.clock_seq &&
               node == other.node;
    }

    bool operator!=(const UuidFields& other) const { return !(*this == other); }
};

/// Version tag OR'd into time_hi_version to mark a time-based UUID.
constexpr uint16_t kVersionClock = 0x0100;

/// Mask applied to the node field.
constexpr uint64_t kNodeMask = 0xFFFFFFFFFFFFULL;

/// Column widths of the teenie format, one per field.
constexpr std::array<size_t, 5> kTeenieWidths = {6, 3, 3, 3, 9};

/// Total length of a teenie string.
constexpr size_t kTeenieLength = 24;

/**
 * @brief Lower-case token for a format ("default", "compact", "urn", "teenie").
 */
TIMEUUID_CORE_API const char* formatToString(Format format);

/**
 * @brief Parse a format token. A leading ':' is tolerated (":urn").
 * @throws InvalidFormatError for any other token.
 */
TIMEUUID_CORE_API Format formatFromString(const std::string& token);

/**
 * @brief Split a 60-bit clock tick and stamp the version tag.
 */
TIMEUUID_CORE_API UuidFields fieldsFromTick(uint64_t tick, uint32_t sequence, uint64_t node);

/**
 * @brief Render @p fields in @p format.
 */
TIMEUUID_CORE_API std::string render(const UuidFields& fields, Format format);

/**
 * @brief Parse @p value, which must be in @p format.
 * @throws InvalidInputError if the value does not have the format's shape,
 *         or a teenie column decodes to more bits than its field holds.
 */
TIMEUUID_CORE_API UuidFields parse(const std::string& value, Format format);

/**
 * @brief True if @p value is in compact, default or urn shape.
 *
 * Hex digits may be upper or lower case. The RFC 4122 layout (variant and
 * version bits) is not checked.
 */
TIMEUUID_CORE_API bool validate(const std::string& value);

/**
 * @brief True if @p value looks like a teenie string.
 *
 * Accepts exactly 24 characters from digits, ASCII letters and the six
 * characters between 'Z' and 'a' ("[\]^_`"). This class is wider than what
 * the teenie encoder emits; parse() rejects the extra characters.
 */
TIMEUUID_CORE_API bool validateTeenie(const std::string& value);

/**
 * @brief True if @p value has the shape of one specific @p format.
 */
TIMEUUID_CORE_API bool validate(const std::string& value, Format format);

}  // namespace core
}  // namespace timeuuid
