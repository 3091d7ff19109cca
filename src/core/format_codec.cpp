/**
 * @file format_codec.cpp
 * @brief Rendering, parsing and shape validation of UUID strings.
 *
 * @copyright Copyright (c) 2024 timeuuid Contributors
 * @license MIT License
 */

#include "timeuuid/core/format_codec.hpp"
#include "timeuuid/core/base62.hpp"
#include "timeuuid/core/errors.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace timeuuid {
namespace core {

namespace {

constexpr const char* kUrnPrefix = "urn:uuid:";
constexpr size_t kUrnPrefixLength = 9;
constexpr size_t kDefaultLength = 36;
constexpr size_t kCompactLength = 32;

// Hex group widths shared by the default, compact and urn layouts.
constexpr std::array<size_t, 5> kHexWidths = {8, 4, 4, 4, 12};

bool isHex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

bool allHex(const std::string& value, size_t begin, size_t end) {
    for (size_t i = begin; i < end; ++i) {
        if (!isHex(value[i])) {
            return false;
        }
    }
    return true;
}

// 8-4-4-4-12 starting at @p offset, running to the end of the string.
bool isHyphenated(const std::string& value, size_t offset) {
    if (value.size() != offset + kDefaultLength) {
        return false;
    }
    size_t pos = offset;
    for (size_t g = 0; g < kHexWidths.size(); ++g) {
        if (g > 0) {
            if (value[pos] != '-') {
                return false;
            }
            ++pos;
        }
        if (!allHex(value, pos, pos + kHexWidths[g])) {
            return false;
        }
        pos += kHexWidths[g];
    }
    return true;
}

bool isCompact(const std::string& value) {
    return value.size() == kCompactLength && allHex(value, 0, kCompactLength);
}

bool isUrn(const std::string& value) {
    if (value.size() != kUrnPrefixLength + kDefaultLength) {
        return false;
    }
    for (size_t i = 0; i < kUrnPrefixLength; ++i) {
        if (std::tolower(static_cast<unsigned char>(value[i])) != kUrnPrefix[i]) {
            return false;
        }
    }
    return isHyphenated(value, kUrnPrefixLength);
}

bool isLooseTeenieChar(char c) {
    auto u = static_cast<unsigned char>(c);
    return std::isdigit(u) || (u >= 'A' && u <= 'z');
}

// Five hex groups starting at @p offset; @p separator is 1 for hyphens, 0 otherwise.
UuidFields parseHexGroups(const std::string& value, size_t offset, size_t separator) {
    std::array<uint64_t, 5> parts{};
    size_t pos = offset;
    for (size_t g = 0; g < kHexWidths.size(); ++g) {
        if (g > 0) {
            pos += separator;
        }
        parts[g] = std::stoull(value.substr(pos, kHexWidths[g]), nullptr, 16);
        pos += kHexWidths[g];
    }

    UuidFields fields;
    fields.time_low = static_cast<uint32_t>(parts[0]);
    fields.time_mid = static_cast<uint16_t>(parts[1]);
    fields.time_hi_version = static_cast<uint16_t>(parts[2]);
    fields.clock_seq = static_cast<uint16_t>(parts[3]);
    fields.node = parts[4];
    return fields;
}

uint64_t decodeColumn(const std::string& value, size_t begin, size_t width, uint64_t limit) {
    uint64_t decoded = Base62::decode(value.substr(begin, width));
    if (decoded > limit) {
        throw InvalidInputError("teenie column \"" + value.substr(begin, width) +
                                "\" exceeds its field width");
    }
    return decoded;
}

UuidFields parseTeenie(const std::string& value) {
    constexpr std::array<uint64_t, 5> limits = {
        0xFFFFFFFFULL, 0xFFFFULL, 0xFFFFULL, 0xFFFFULL, kNodeMask
    };

    std::array<uint64_t, 5> parts{};
    size_t pos = 0;
    for (size_t i = 0; i < kTeenieWidths.size(); ++i) {
        parts[i] = decodeColumn(value, pos, kTeenieWidths[i], limits[i]);
        pos += kTeenieWidths[i];
    }

    UuidFields fields;
    fields.time_low = static_cast<uint32_t>(parts[0]);
    fields.time_mid = static_cast<uint16_t>(parts[1]);
    fields.time_hi_version = static_cast<uint16_t>(parts[2]);
    fields.clock_seq = static_cast<uint16_t>(parts[3]);
    fields.node = parts[4];
    return fields;
}

void renderHex(std::ostringstream& oss, const UuidFields& fields, const char* separator) {
    oss << std::hex << std::setfill('0');
    oss << std::setw(8) << fields.time_low << separator;
    oss << std::setw(4) << fields.time_mid << separator;
    oss << std::setw(4) << fields.time_hi_version << separator;
    oss << std::setw(4) << fields.clock_seq << separator;
    oss << std::setw(12) << (fields.node & kNodeMask);
}

// Right-aligned in its column; unused leading positions hold '0', the base62 zero digit.
void appendColumn(std::string& out, uint64_t value, size_t width) {
    std::string digits = Base62::encode(value);
    if (digits.size() < width) {
        out.append(width - digits.size(), Base62::ALPHABET[0]);
    }
    out.append(digits, 0, width);
}

}  // namespace

const char* formatToString(Format format) {
    switch (format) {
        case Format::Default: return "default";
        case Format::Compact: return "compact";
        case Format::Urn:     return "urn";
        case Format::Teenie:  return "teenie";
        default:              return "unknown";
    }
}

Format formatFromString(const std::string& token) {
    std::string name = (!token.empty() && token[0] == ':') ? token.substr(1) : token;
    for (Format format : kAllFormats) {
        if (name == formatToString(format)) {
            return format;
        }
    }
    throw InvalidFormatError(name);
}

UuidFields fieldsFromTick(uint64_t tick, uint32_t sequence, uint64_t node) {
    UuidFields fields;
    fields.time_low = static_cast<uint32_t>(tick & 0xFFFFFFFFULL);
    fields.time_mid = static_cast<uint16_t>((tick >> 32) & 0xFFFF);
    fields.time_hi_version = static_cast<uint16_t>(((tick >> 48) & 0x0FFF) | kVersionClock);
    fields.clock_seq = static_cast<uint16_t>(sequence & 0xFFFF);
    fields.node = node & kNodeMask;
    return fields;
}

std::string render(const UuidFields& fields, Format format) {
    switch (format) {
        case Format::Default: {
            std::ostringstream oss;
            renderHex(oss, fields, "-");
            return oss.str();
        }
        case Format::Compact: {
            std::ostringstream oss;
            renderHex(oss, fields, "");
            return oss.str();
        }
        case Format::Urn: {
            std::ostringstream oss;
            oss << kUrnPrefix;
            renderHex(oss, fields, "-");
            return oss.str();
        }
        case Format::Teenie: {
            std::string out;
            out.reserve(kTeenieLength);
            appendColumn(out, fields.time_low, kTeenieWidths[0]);
            appendColumn(out, fields.time_mid, kTeenieWidths[1]);
            appendColumn(out, fields.time_hi_version, kTeenieWidths[2]);
            appendColumn(out, fields.clock_seq, kTeenieWidths[3]);
            appendColumn(out, fields.node & kNodeMask, kTeenieWidths[4]);
            return out;
        }
    }
    throw InvalidFormatError(std::to_string(static_cast<int>(format)));
}

UuidFields parse(const std::string& value, Format format) {
    if (!validate(value, format)) {
        throw InvalidInputError("\"" + value + "\" is not a valid " +
                                formatToString(format) + " UUID");
    }

    switch (format) {
        case Format::Default: return parseHexGroups(value, 0, 1);
        case Format::Compact: return parseHexGroups(value, 0, 0);
        case Format::Urn:     return parseHexGroups(value, kUrnPrefixLength, 1);
        case Format::Teenie:  return parseTeenie(value);
    }
    throw InvalidFormatError(std::to_string(static_cast<int>(format)));
}

bool validate(const std::string& value) {
    return isCompact(value) || isHyphenated(value, 0) || isUrn(value);
}

bool validateTeenie(const std::string& value) {
    if (value.size() != kTeenieLength) {
        return false;
    }
    for (char c : value) {
        if (!isLooseTeenieChar(c)) {
            return false;
        }
    }
    return true;
}

bool validate(const std::string& value, Format format) {
    switch (format) {
        case Format::Default: return isHyphenated(value, 0);
        case Format::Compact: return isCompact(value);
        case Format::Urn:     return isUrn(value);
        case Format::Teenie:  return validateTeenie(value);
    }
    return false;
}

}  // namespace core
}  // namespace timeuuid
