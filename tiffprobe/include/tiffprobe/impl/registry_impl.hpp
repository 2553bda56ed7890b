#pragma once

// This file contains the registry tables and lookups.
// Do not include this file directly - it is included by registry.hpp

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include "../types.hpp"
#include "../types/tag_codes.hpp"

#ifndef TIFFPROBE_REGISTRY_HEADER
#include "../registry.hpp" // for linters
#endif

namespace tiffprobe {

namespace registry {

namespace detail {

constexpr TagInfo unconstrained(TagCode code, std::string_view name) noexcept {
    return TagInfo{code, name, false, TagExpectation{TiffDataType::Undefined, 0, false}};
}

constexpr TagInfo expects(TagCode code, std::string_view name, TiffDataType datatype, uint32_t count) noexcept {
    return TagInfo{code, name, true, TagExpectation{datatype, count, false}};
}

constexpr TagInfo expects_short_or_long(TagCode code, std::string_view name, uint32_t count) noexcept {
    return TagInfo{code, name, true, TagExpectation{TiffDataType::Long, count, true}};
}

// Sorted by code. Keep it sorted: lookups use binary search.
inline constexpr auto tag_table = std::to_array<TagInfo>({
    expects(TagCode::NewSubfileType, "NewSubfileType", TiffDataType::Long, 1),
    expects(TagCode::SubfileType, "SubfileType", TiffDataType::Short, 1),
    expects_short_or_long(TagCode::ImageWidth, "ImageWidth", 1),
    expects_short_or_long(TagCode::ImageLength, "ImageLength", 1),
    expects(TagCode::BitsPerSample, "BitsPerSample", TiffDataType::Short, 0),
    expects(TagCode::Compression, "Compression", TiffDataType::Short, 1),
    expects(TagCode::PhotometricInterpretation, "PhotometricInterpretation", TiffDataType::Short, 1),
    expects(TagCode::Threshholding, "Threshholding", TiffDataType::Short, 1),
    expects(TagCode::CellWidth, "CellWidth", TiffDataType::Short, 1),
    expects(TagCode::CellLength, "CellLength", TiffDataType::Short, 1),
    expects(TagCode::FillOrder, "FillOrder", TiffDataType::Short, 1),
    expects(TagCode::ImageDescription, "ImageDescription", TiffDataType::Ascii, 0),
    expects(TagCode::Make, "Make", TiffDataType::Ascii, 0),
    expects(TagCode::Model, "Model", TiffDataType::Ascii, 0),
    expects(TagCode::StripOffsets, "StripOffsets", TiffDataType::Long, 0),
    expects(TagCode::Orientation, "Orientation", TiffDataType::Short, 1),
    expects(TagCode::SamplesPerPixel, "SamplesPerPixel", TiffDataType::Short, 1),
    expects_short_or_long(TagCode::RowsPerStrip, "RowsPerStrip", 1),
    expects_short_or_long(TagCode::StripByteCounts, "StripByteCounts", 0),
    expects(TagCode::MinSampleValue, "MinSampleValue", TiffDataType::Short, 0),
    expects(TagCode::MaxSampleValue, "MaxSampleValue", TiffDataType::Short, 0),
    expects(TagCode::XResolution, "XResolution", TiffDataType::Rational, 1),
    expects(TagCode::YResolution, "YResolution", TiffDataType::Rational, 1),
    expects(TagCode::PlanarConfiguration, "PlanarConfiguration", TiffDataType::Short, 1),
    expects(TagCode::FreeOffsets, "FreeOffsets", TiffDataType::Long, 0),
    expects(TagCode::FreeByteCounts, "FreeByteCounts", TiffDataType::Long, 0),
    expects(TagCode::GrayResponseUnit, "GrayResponseUnit", TiffDataType::Short, 1),
    expects(TagCode::GrayResponseCurve, "GrayResponseCurve", TiffDataType::Short, 0),
    expects(TagCode::ResolutionUnit, "ResolutionUnit", TiffDataType::Short, 1),
    expects(TagCode::TransferFunction, "TransferFunction", TiffDataType::Short, 0),
    expects(TagCode::Software, "Software", TiffDataType::Ascii, 0),
    expects(TagCode::DateTime, "DateTime", TiffDataType::Ascii, 0),
    expects(TagCode::Artist, "Artist", TiffDataType::Ascii, 0),
    expects(TagCode::HostComputer, "HostComputer", TiffDataType::Ascii, 0),
    expects(TagCode::Predictor, "Predictor", TiffDataType::Short, 1),
    expects(TagCode::WhitePoint, "WhitePoint", TiffDataType::Rational, 2),
    expects(TagCode::PrimaryChromaticities, "PrimaryChromaticities", TiffDataType::Rational, 6),
    expects(TagCode::ColorMap, "ColorMap", TiffDataType::Short, 0),
    unconstrained(TagCode::SubIFD, "SubIFD"),
    expects(TagCode::ExtraSamples, "ExtraSamples", TiffDataType::Short, 0),
    expects(TagCode::SampleFormat, "SampleFormat", TiffDataType::Short, 0),
    expects(TagCode::TransferRange, "TransferRange", TiffDataType::Short, 6),
    unconstrained(TagCode::JPEGTables, "JPEGTables"),
    expects(TagCode::YCbCrCoefficients, "YCbCrCoefficients", TiffDataType::Rational, 3),
    expects(TagCode::YCbCrSubSampling, "YCbCrSubSampling", TiffDataType::Short, 2),
    expects(TagCode::YCbCrPositioning, "YCbCrPositioning", TiffDataType::Short, 1),
    expects(TagCode::ReferenceBlackWhite, "ReferenceBlackWhite", TiffDataType::Rational, 6),
    expects(TagCode::XMLPacket, "XMLPacket", TiffDataType::Byte, 0),
    unconstrained(TagCode::CFARepeatPatternDim, "CFARepeatPatternDim"),
    unconstrained(TagCode::BatteryLevel, "BatteryLevel"),
    expects(TagCode::Copyright, "Copyright", TiffDataType::Ascii, 0),
    unconstrained(TagCode::RichTIFFIPTC, "RichTIFFIPTC"),
    expects(TagCode::Photoshop, "Photoshop", TiffDataType::Byte, 0),
    expects(TagCode::EXIFIFDOffset, "EXIFIFDOffset", TiffDataType::Long, 0),
    expects(TagCode::ICCProfile, "ICCProfile", TiffDataType::Undefined, 0),
    unconstrained(TagCode::Interlace, "Interlace"),
    unconstrained(TagCode::TimeZoneOffset, "TimeZoneOffset"),
    unconstrained(TagCode::SelfTimerMode, "SelfTimerMode"),
    unconstrained(TagCode::Noise, "Noise"),
    unconstrained(TagCode::ImageNumber, "ImageNumber"),
    unconstrained(TagCode::SecurityClassification, "SecurityClassification"),
    unconstrained(TagCode::ImageHistory, "ImageHistory"),
    unconstrained(TagCode::TIFFEPStandardID, "TIFFEPStandardID"),
});

constexpr bool code_less(const TagInfo& lhs, const TagInfo& rhs) noexcept {
    return static_cast<uint16_t>(lhs.code) < static_cast<uint16_t>(rhs.code);
}

constexpr bool table_is_strictly_sorted() noexcept {
    return std::adjacent_find(tag_table.begin(), tag_table.end(),
        [](const TagInfo& lhs, const TagInfo& rhs) { return !code_less(lhs, rhs); }) == tag_table.end();
}

static_assert(table_is_strictly_sorted(), "tag_table must be sorted by code without duplicates");

constexpr const TagInfo* find_tag(uint16_t code) noexcept {
    auto it = std::lower_bound(tag_table.begin(), tag_table.end(), code,
        [](const TagInfo& info, uint16_t value) { return static_cast<uint16_t>(info.code) < value; });
    if (it == tag_table.end() || static_cast<uint16_t>(it->code) != code) {
        return nullptr;
    }
    return &*it;
}

} // namespace detail

constexpr std::span<const TagInfo> registered_tags() noexcept {
    return std::span<const TagInfo>(detail::tag_table);
}

constexpr std::optional<TagCode> decode_tag(uint16_t code) noexcept {
    const TagInfo* info = detail::find_tag(code);
    if (info == nullptr) {
        return std::nullopt;
    }
    return info->code;
}

constexpr uint16_t encode_tag(TagCode tag) noexcept {
    return static_cast<uint16_t>(tag);
}

constexpr std::string_view tag_name(TagCode tag) noexcept {
    const TagInfo* info = detail::find_tag(encode_tag(tag));
    return info != nullptr ? info->name : std::string_view{"Unknown"};
}

constexpr std::optional<TagExpectation> tag_expectation(TagCode tag) noexcept {
    const TagInfo* info = detail::find_tag(encode_tag(tag));
    if (info == nullptr || !info->has_expectation) {
        return std::nullopt;
    }
    return info->expectation;
}

constexpr bool type_matches(const TagExpectation& expectation, TiffDataType declared) noexcept {
    if (expectation.accepts_short_or_long) {
        return declared == TiffDataType::Short || declared == TiffDataType::Long;
    }
    return declared == expectation.datatype;
}

constexpr bool count_matches(const TagExpectation& expectation, uint32_t declared) noexcept {
    return expectation.count == 0 || expectation.count == declared;
}

namespace detail {

constexpr std::optional<std::string_view> compression_name(CompressionScheme scheme) noexcept {
    switch (scheme) {
        case CompressionScheme::None: return "None";
        case CompressionScheme::CCITT_RLE: return "CCITT RLE";
        case CompressionScheme::CCITT_Fax3: return "CCITT Group 3";
        case CompressionScheme::CCITT_Fax4: return "CCITT Group 4";
        case CompressionScheme::LZW: return "LZW";
        case CompressionScheme::JPEG_Old: return "Old-style JPEG";
        case CompressionScheme::JPEG: return "JPEG";
        case CompressionScheme::Deflate_Adobe: return "Adobe Deflate";
        case CompressionScheme::PackBits: return "PackBits";
        case CompressionScheme::Deflate: return "Deflate";
    }
    return std::nullopt;
}

constexpr std::optional<std::string_view> photometric_name(PhotometricInterpretation photometric) noexcept {
    switch (photometric) {
        case PhotometricInterpretation::MinIsWhite: return "WhiteIsZero";
        case PhotometricInterpretation::MinIsBlack: return "BlackIsZero";
        case PhotometricInterpretation::RGB: return "RGB";
        case PhotometricInterpretation::Palette: return "Palette";
        case PhotometricInterpretation::Mask: return "Transparency mask";
        case PhotometricInterpretation::CMYK: return "CMYK";
        case PhotometricInterpretation::YCbCr: return "YCbCr";
        case PhotometricInterpretation::CIELab: return "CIELab";
    }
    return std::nullopt;
}

constexpr std::optional<std::string_view> planar_name(PlanarConfiguration planar) noexcept {
    switch (planar) {
        case PlanarConfiguration::Chunky: return "Chunky";
        case PlanarConfiguration::Planar: return "Planar";
    }
    return std::nullopt;
}

constexpr std::optional<std::string_view> resolution_unit_name(ResolutionUnit unit) noexcept {
    switch (unit) {
        case ResolutionUnit::None: return "None";
        case ResolutionUnit::Inch: return "Inch";
        case ResolutionUnit::Centimeter: return "Centimeter";
    }
    return std::nullopt;
}

constexpr std::optional<std::string_view> sample_format_name(SampleFormat format) noexcept {
    switch (format) {
        case SampleFormat::UnsignedInt: return "Unsigned integer";
        case SampleFormat::SignedInt: return "Signed integer";
        case SampleFormat::IEEEFloat: return "IEEE floating point";
        case SampleFormat::Undefined: return "Undefined";
    }
    return std::nullopt;
}

} // namespace detail

constexpr std::optional<std::string_view> value_name(TagCode tag, uint32_t value) noexcept {
    // All enumerated values are 16-bit; a wider value is never one of them
    if (value > 0xFFFFu) {
        return std::nullopt;
    }
    const auto v = static_cast<uint16_t>(value);
    switch (tag) {
        case TagCode::Compression: return detail::compression_name(static_cast<CompressionScheme>(v));
        case TagCode::PhotometricInterpretation: return detail::photometric_name(static_cast<PhotometricInterpretation>(v));
        case TagCode::PlanarConfiguration: return detail::planar_name(static_cast<PlanarConfiguration>(v));
        case TagCode::ResolutionUnit: return detail::resolution_unit_name(static_cast<ResolutionUnit>(v));
        case TagCode::SampleFormat: return detail::sample_format_name(static_cast<SampleFormat>(v));
        default: return std::nullopt;
    }
}

constexpr std::optional<TiffDataType> decode_type(uint16_t code) noexcept {
    if (code < static_cast<uint16_t>(TiffDataType::Byte) || code > static_cast<uint16_t>(TiffDataType::Double)) {
        return std::nullopt;
    }
    return static_cast<TiffDataType>(code);
}

constexpr uint16_t encode_type(TiffDataType type) noexcept {
    return static_cast<uint16_t>(type);
}

constexpr std::string_view type_name(TiffDataType type) noexcept {
    switch (type) {
        case TiffDataType::Byte: return "BYTE";
        case TiffDataType::Ascii: return "ASCII";
        case TiffDataType::Short: return "SHORT";
        case TiffDataType::Long: return "LONG";
        case TiffDataType::Rational: return "RATIONAL";
        case TiffDataType::SByte: return "SBYTE";
        case TiffDataType::Undefined: return "UNDEFINED";
        case TiffDataType::SShort: return "SSHORT";
        case TiffDataType::SLong: return "SLONG";
        case TiffDataType::SRational: return "SRATIONAL";
        case TiffDataType::Float: return "FLOAT";
        case TiffDataType::Double: return "DOUBLE";
    }
    return "UNKNOWN";
}

static_assert(decode_tag(0x0100) == TagCode::ImageWidth);
static_assert(!decode_type(0).has_value() && !decode_type(13).has_value());

} // namespace registry

} // namespace tiffprobe
