#include <gtest/gtest.h>
#include <set>

#include "../tiffprobe/include/tiffprobe/registry.hpp"
#include "../tiffprobe/include/tiffprobe/types.hpp"

using namespace tiffprobe;

// ============================================================================
// Tag Registry
// ============================================================================

TEST(TagRegistry, RoundTripsEveryRegisteredTag) {
    ASSERT_FALSE(registry::registered_tags().empty());
    for (const auto& info : registry::registered_tags()) {
        const uint16_t code = registry::encode_tag(info.code);
        auto decoded = registry::decode_tag(code);
        ASSERT_TRUE(decoded.has_value()) << "code " << code;
        EXPECT_EQ(*decoded, info.code);
        EXPECT_EQ(registry::tag_name(info.code), info.name);
    }
}

TEST(TagRegistry, CodesAndNamesAreUnique) {
    std::set<uint16_t> codes;
    std::set<std::string_view> names;
    for (const auto& info : registry::registered_tags()) {
        EXPECT_TRUE(codes.insert(registry::encode_tag(info.code)).second);
        EXPECT_TRUE(names.insert(info.name).second) << info.name;
    }
}

TEST(TagRegistry, UnregisteredCodesDoNotResolve) {
    EXPECT_FALSE(registry::decode_tag(0).has_value());
    EXPECT_FALSE(registry::decode_tag(253).has_value());
    EXPECT_FALSE(registry::decode_tag(50000).has_value());
    EXPECT_FALSE(registry::decode_tag(0xFFFF).has_value());
}

TEST(TagRegistry, WellKnownCodes) {
    EXPECT_EQ(registry::decode_tag(256), TagCode::ImageWidth);
    EXPECT_EQ(registry::decode_tag(259), TagCode::Compression);
    EXPECT_EQ(registry::decode_tag(273), TagCode::StripOffsets);
    EXPECT_EQ(registry::decode_tag(34665), TagCode::EXIFIFDOffset);
    EXPECT_EQ(registry::tag_name(TagCode::PhotometricInterpretation), "PhotometricInterpretation");
}

TEST(TagRegistry, ShortOrLongExceptionIsLimitedToFourTags) {
    for (const auto& info : registry::registered_tags()) {
        const bool expected_exception =
            info.code == TagCode::ImageWidth ||
            info.code == TagCode::ImageLength ||
            info.code == TagCode::RowsPerStrip ||
            info.code == TagCode::StripByteCounts;
        EXPECT_EQ(info.has_expectation && info.expectation.accepts_short_or_long, expected_exception)
            << info.name;
    }
}

TEST(TagRegistry, TypeMatching) {
    auto width = registry::tag_expectation(TagCode::ImageWidth);
    ASSERT_TRUE(width.has_value());
    EXPECT_TRUE(registry::type_matches(*width, TiffDataType::Short));
    EXPECT_TRUE(registry::type_matches(*width, TiffDataType::Long));
    EXPECT_FALSE(registry::type_matches(*width, TiffDataType::Byte));
    EXPECT_FALSE(registry::type_matches(*width, TiffDataType::SLong));

    auto compression = registry::tag_expectation(TagCode::Compression);
    ASSERT_TRUE(compression.has_value());
    EXPECT_TRUE(registry::type_matches(*compression, TiffDataType::Short));
    EXPECT_FALSE(registry::type_matches(*compression, TiffDataType::Long));
}

TEST(TagRegistry, CountMatching) {
    auto bits = registry::tag_expectation(TagCode::BitsPerSample);
    ASSERT_TRUE(bits.has_value());
    EXPECT_EQ(bits->count, 0u);
    EXPECT_TRUE(registry::count_matches(*bits, 1));
    EXPECT_TRUE(registry::count_matches(*bits, 4));

    auto orientation = registry::tag_expectation(TagCode::Orientation);
    ASSERT_TRUE(orientation.has_value());
    EXPECT_TRUE(registry::count_matches(*orientation, 1));
    EXPECT_FALSE(registry::count_matches(*orientation, 2));

    auto white_point = registry::tag_expectation(TagCode::WhitePoint);
    ASSERT_TRUE(white_point.has_value());
    EXPECT_EQ(white_point->datatype, TiffDataType::Rational);
    EXPECT_TRUE(registry::count_matches(*white_point, 2));
}

TEST(TagRegistry, UnconstrainedTagsHaveNoExpectation) {
    EXPECT_FALSE(registry::tag_expectation(TagCode::SubIFD).has_value());
    EXPECT_FALSE(registry::tag_expectation(TagCode::JPEGTables).has_value());
}

TEST(TagRegistry, EnumeratedValueNames) {
    EXPECT_EQ(registry::value_name(TagCode::Compression, 1), "None");
    EXPECT_EQ(registry::value_name(TagCode::Compression, 32773), "PackBits");
    EXPECT_EQ(registry::value_name(TagCode::PhotometricInterpretation, 0), "WhiteIsZero");
    EXPECT_EQ(registry::value_name(TagCode::PhotometricInterpretation, 2), "RGB");
    EXPECT_EQ(registry::value_name(TagCode::PlanarConfiguration, 2), "Planar");
    EXPECT_EQ(registry::value_name(TagCode::ResolutionUnit, 3), "Centimeter");
    EXPECT_EQ(registry::value_name(TagCode::SampleFormat, 3), "IEEE floating point");
}

TEST(TagRegistry, UnnamedValues) {
    // Not a defined scheme
    EXPECT_FALSE(registry::value_name(TagCode::Compression, 9).has_value());
    // Truncating 0x10001 to 16 bits would give a valid code
    EXPECT_FALSE(registry::value_name(TagCode::Compression, 0x10001).has_value());
    // Tag without enumerated values
    EXPECT_FALSE(registry::value_name(TagCode::ImageWidth, 1).has_value());
}

// ============================================================================
// Type Registry
// ============================================================================

TEST(TypeRegistry, DecodesExactlyCodesOneToTwelve) {
    for (uint32_t code = 0; code <= 0xFFFF; ++code) {
        auto decoded = registry::decode_type(static_cast<uint16_t>(code));
        if (code >= 1 && code <= 12) {
            ASSERT_TRUE(decoded.has_value()) << code;
            EXPECT_EQ(registry::encode_type(*decoded), code);
        } else {
            ASSERT_FALSE(decoded.has_value()) << code;
        }
    }
}

TEST(TypeRegistry, NamesAndSizes) {
    EXPECT_EQ(registry::type_name(TiffDataType::Short), "SHORT");
    EXPECT_EQ(registry::type_name(TiffDataType::SRational), "SRATIONAL");
    EXPECT_EQ(tiff_type_size(TiffDataType::Byte), 1u);
    EXPECT_EQ(tiff_type_size(TiffDataType::Ascii), 1u);
    EXPECT_EQ(tiff_type_size(TiffDataType::SShort), 2u);
    EXPECT_EQ(tiff_type_size(TiffDataType::Float), 4u);
    EXPECT_EQ(tiff_type_size(TiffDataType::Rational), 8u);
    EXPECT_EQ(tiff_type_size(TiffDataType::Double), 8u);
}
