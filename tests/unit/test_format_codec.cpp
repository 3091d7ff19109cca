/**
 * @file test_format_codec.cpp
 * @brief Unit tests for rendering, parsing and validating UUID strings
 */

#include <gtest/gtest.h>
#include <timeuuid/core/errors.hpp>
#include <timeuuid/core/format_codec.hpp>

#include <string>

using namespace timeuuid::core;

namespace {

UuidFields sampleFields() {
    UuidFields fields;
    fields.time_low = 0x01234567;
    fields.time_mid = 0xabcd;
    fields.time_hi_version = 0x8901;
    fields.clock_seq = 0xefab;
    fields.node = 0x234567890123ULL;
    return fields;
}

const std::string kSampleDefault = "01234567-abcd-8901-efab-234567890123";
const std::string kSampleCompact = "01234567abcd8901efab234567890123";
const std::string kSampleUrn = "urn:uuid:01234567-abcd-8901-efab-234567890123";
const std::string kSampleTeenie = "01I5qxBRN97hFxb0B0lC2BJD";

}  // namespace

// =============================================================================
// Format tokens
// =============================================================================

TEST(FormatTokenTest, RoundTripsAllFormats) {
    for (Format format : kAllFormats) {
        EXPECT_EQ(formatFromString(formatToString(format)), format);
    }
}

TEST(FormatTokenTest, AcceptsLeadingColon) {
    EXPECT_EQ(formatFromString(":urn"), Format::Urn);
    EXPECT_EQ(formatFromString(":teenie"), Format::Teenie);
}

TEST(FormatTokenTest, RejectsUnknownToken) {
    try {
        formatFromString("unknown");
        FAIL() << "unknown token accepted";
    } catch (const InvalidFormatError& e) {
        EXPECT_STREQ(e.what(), "invalid UUID format :unknown");
        EXPECT_EQ(e.format(), "unknown");
    }
    EXPECT_THROW(formatFromString(""), InvalidFormatError);
    EXPECT_THROW(formatFromString("DEFAULT"), InvalidFormatError);
}

// =============================================================================
// Rendering
// =============================================================================

TEST(FormatRenderTest, HexLayouts) {
    EXPECT_EQ(render(sampleFields(), Format::Default), kSampleDefault);
    EXPECT_EQ(render(sampleFields(), Format::Compact), kSampleCompact);
    EXPECT_EQ(render(sampleFields(), Format::Urn), kSampleUrn);
}

TEST(FormatRenderTest, HexIsZeroPadded) {
    UuidFields fields;
    fields.time_low = 1;
    fields.time_mid = 2;
    fields.time_hi_version = 0x100;
    fields.clock_seq = 3;
    fields.node = 4;
    EXPECT_EQ(render(fields, Format::Default), "00000001-0002-0100-0003-000000000004");
}

TEST(FormatRenderTest, TeenieColumnsAreRightAligned) {
    EXPECT_EQ(render(sampleFields(), Format::Teenie), kSampleTeenie);

    UuidFields fields;
    fields.time_low = 1;
    fields.time_mid = 2;
    fields.time_hi_version = 0x100;
    fields.clock_seq = 3;
    fields.node = 4;
    std::string teenie = render(fields, Format::Teenie);
    EXPECT_EQ(teenie, "000001002048003000000004");
    EXPECT_EQ(teenie.size(), kTeenieLength);
}

TEST(FormatRenderTest, FieldsFromTick) {
    uint64_t tick = 0x0123456789ABCDE0ULL;
    UuidFields fields = fieldsFromTick(tick, 0x12345, 0xFF0000000000FFULL);

    EXPECT_EQ(fields.time_low, 0x89ABCDE0u);
    EXPECT_EQ(fields.time_mid, 0x4567);
    EXPECT_EQ(fields.time_hi_version, 0x0123 | kVersionClock);
    EXPECT_EQ(fields.clock_seq, 0x2345);
    EXPECT_EQ(fields.node, 0x0000000000FFULL);
}

// =============================================================================
// Parsing
// =============================================================================

TEST(FormatParseTest, ParsesEveryFormat) {
    EXPECT_EQ(parse(kSampleDefault, Format::Default), sampleFields());
    EXPECT_EQ(parse(kSampleCompact, Format::Compact), sampleFields());
    EXPECT_EQ(parse(kSampleUrn, Format::Urn), sampleFields());
    EXPECT_EQ(parse(kSampleTeenie, Format::Teenie), sampleFields());
}

TEST(FormatParseTest, AcceptsUpperCaseHex) {
    EXPECT_EQ(parse("01234567-ABCD-8901-EFAB-234567890123", Format::Default), sampleFields());
    EXPECT_EQ(parse("URN:UUID:01234567-abcd-8901-efab-234567890123", Format::Urn), sampleFields());
}

TEST(FormatParseTest, ParsesGeneratedTeenie) {
    UuidFields fields = parse("4etJlQGyu04qEJs002f129iS", Format::Teenie);
    EXPECT_EQ(render(fields, Format::Default), "fe703e10-ff00-012c-d708-002332dd1f48");
}

TEST(FormatParseTest, RejectsWrongShape) {
    EXPECT_THROW(parse(kSampleCompact, Format::Default), InvalidInputError);
    EXPECT_THROW(parse(kSampleDefault, Format::Compact), InvalidInputError);
    EXPECT_THROW(parse(kSampleDefault, Format::Urn), InvalidInputError);
    EXPECT_THROW(parse(kSampleDefault, Format::Teenie), InvalidInputError);
    EXPECT_THROW(parse("", Format::Default), InvalidInputError);
}

TEST(FormatParseTest, RejectsTeenieOutsideEncoderAlphabet) {
    // Passes the loose shape check but is not base62
    std::string value = "01I5qxBRN97hFxb0B0lC2BJ_";
    EXPECT_TRUE(validateTeenie(value));
    EXPECT_THROW(parse(value, Format::Teenie), InvalidInputError);
}

TEST(FormatParseTest, RejectsTeenieColumnOverflow) {
    // "zzz" is 238327, wider than the 16-bit time_mid field
    EXPECT_THROW(parse("01I5qxzzz97hFxb0B0lC2BJD", Format::Teenie), InvalidInputError);
}

TEST(FormatParseTest, EveryFormatPairRoundTrips) {
    UuidFields fields = sampleFields();
    for (Format from : kAllFormats) {
        for (Format to : kAllFormats) {
            std::string rendered = render(parse(render(fields, from), from), to);
            EXPECT_EQ(parse(rendered, to), fields)
                << formatToString(from) << " -> " << formatToString(to);
        }
    }
}

// =============================================================================
// Validation
// =============================================================================

TEST(FormatValidateTest, AcceptsHexFormats) {
    EXPECT_TRUE(validate(kSampleDefault));
    EXPECT_TRUE(validate(kSampleCompact));
    EXPECT_TRUE(validate(kSampleUrn));
    EXPECT_TRUE(validate("01234567ABCD8901EFAB234567890123"));
}

TEST(FormatValidateTest, RejectsMalformedHex) {
    EXPECT_FALSE(validate(""));
    EXPECT_FALSE(validate(kSampleCompact.substr(0, 31)));
    EXPECT_FALSE(validate(kSampleCompact + "0"));
    EXPECT_FALSE(validate(kSampleCompact + "012"));
    EXPECT_FALSE(validate("01234567abcd8901efab23456789012z"));
    EXPECT_FALSE(validate("01234567-abcd-8901-efab234567890123"));
    EXPECT_FALSE(validate("0123456-7abcd-8901-efab-234567890123"));
    EXPECT_FALSE(validate("uuid:01234567-abcd-8901-efab-234567890123"));
    EXPECT_FALSE(validate(" " + kSampleDefault));
    EXPECT_FALSE(validate(kSampleTeenie));
}

TEST(FormatValidateTest, TeenieShape) {
    EXPECT_TRUE(validateTeenie("4etJlQGyu04qEJs002f129iS"));
    EXPECT_TRUE(validateTeenie(kSampleTeenie));
    EXPECT_FALSE(validateTeenie("4etJlQGyu04qEJs002f129iS0"));
    EXPECT_FALSE(validateTeenie("4etJlQGyu04qEJs002f129i"));
    EXPECT_FALSE(validateTeenie("4etJlQGyu04qEJs002f129-S"));
    EXPECT_FALSE(validateTeenie(""));
}

TEST(FormatValidateTest, PerFormat) {
    EXPECT_TRUE(validate(kSampleDefault, Format::Default));
    EXPECT_FALSE(validate(kSampleDefault, Format::Compact));
    EXPECT_TRUE(validate(kSampleCompact, Format::Compact));
    EXPECT_TRUE(validate(kSampleUrn, Format::Urn));
    EXPECT_FALSE(validate(kSampleUrn, Format::Default));
    EXPECT_TRUE(validate(kSampleTeenie, Format::Teenie));
}
