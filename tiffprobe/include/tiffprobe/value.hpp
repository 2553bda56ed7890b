#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <variant>
#include "types.hpp"

namespace tiffprobe {

/// @name Scalar value alternatives
/// One distinct wrapper per TIFF data type, so that BYTE and UNDEFINED (both
/// uint8_t on disk) remain distinguishable once decoded.
/// @{
struct ByteValue      { uint8_t value;     bool operator==(const ByteValue&) const = default; };
struct AsciiValue     { std::string value; bool operator==(const AsciiValue&) const = default; };
struct ShortValue     { uint16_t value;    bool operator==(const ShortValue&) const = default; };
struct LongValue      { uint32_t value;    bool operator==(const LongValue&) const = default; };
struct RationalValue  { Rational value;    bool operator==(const RationalValue&) const = default; };
struct SByteValue     { int8_t value;      bool operator==(const SByteValue&) const = default; };
struct UndefinedValue { uint8_t value;     bool operator==(const UndefinedValue&) const = default; };
struct SShortValue    { int16_t value;     bool operator==(const SShortValue&) const = default; };
struct SLongValue     { int32_t value;     bool operator==(const SLongValue&) const = default; };
struct SRationalValue { SRational value;   bool operator==(const SRationalValue&) const = default; };
struct FloatValue     { float value;       bool operator==(const FloatValue&) const = default; };
struct DoubleValue    { double value;      bool operator==(const DoubleValue&) const = default; };
/// @}

/// @brief A decoded TIFF value, exactly one alternative per TIFF data type
/// @note Alternatives are in TiffDataType order: index() + 1 is the type code.
using ScalarValue = std::variant<
    ByteValue,
    AsciiValue,
    ShortValue,
    LongValue,
    RationalValue,
    SByteValue,
    UndefinedValue,
    SShortValue,
    SLongValue,
    SRationalValue,
    FloatValue,
    DoubleValue
>;

static_assert(std::variant_size_v<ScalarValue> == 12, "One alternative per TIFF 6.0 data type");

/// @brief TIFF data type carried by a value
[[nodiscard]] inline TiffDataType scalar_type(const ScalarValue& value) noexcept {
    return static_cast<TiffDataType>(value.index() + 1);
}

namespace detail {

/// Map a TiffDataType to its wrapper and on-disk C++ type
template <TiffDataType Type> struct scalar_traits;

template <> struct scalar_traits<TiffDataType::Byte>      { using wrapper = ByteValue;      using storage = uint8_t; };
template <> struct scalar_traits<TiffDataType::Short>     { using wrapper = ShortValue;     using storage = uint16_t; };
template <> struct scalar_traits<TiffDataType::Long>      { using wrapper = LongValue;      using storage = uint32_t; };
template <> struct scalar_traits<TiffDataType::SByte>     { using wrapper = SByteValue;     using storage = int8_t; };
template <> struct scalar_traits<TiffDataType::Undefined> { using wrapper = UndefinedValue; using storage = uint8_t; };
template <> struct scalar_traits<TiffDataType::SShort>    { using wrapper = SShortValue;    using storage = int16_t; };
template <> struct scalar_traits<TiffDataType::SLong>     { using wrapper = SLongValue;     using storage = int32_t; };
template <> struct scalar_traits<TiffDataType::Float>     { using wrapper = FloatValue;     using storage = float; };
template <> struct scalar_traits<TiffDataType::Double>    { using wrapper = DoubleValue;    using storage = double; };

/// Decode one fixed-width element stored in SourceEndian order
template <TiffDataType Type, std::endian SourceEndian>
[[nodiscard]] inline ScalarValue decode_element(const std::byte* src) noexcept {
    using Traits = scalar_traits<Type>;
    typename Traits::storage value;
    std::memcpy(&value, src, sizeof(value));
    convert_endianness<typename Traits::storage, SourceEndian, std::endian::native>(value);
    return typename Traits::wrapper{value};
}

/// Decode one rational (two consecutive 32-bit components) stored in SourceEndian order
template <TiffDataType Type, std::endian SourceEndian>
[[nodiscard]] inline ScalarValue decode_rational(const std::byte* src) noexcept {
    if constexpr (Type == TiffDataType::Rational) {
        Rational r;
        std::memcpy(&r.numerator, src, sizeof(uint32_t));
        std::memcpy(&r.denominator, src + sizeof(uint32_t), sizeof(uint32_t));
        convert_endianness<uint32_t, SourceEndian, std::endian::native>(r.numerator);
        convert_endianness<uint32_t, SourceEndian, std::endian::native>(r.denominator);
        return RationalValue{r};
    } else {
        static_assert(Type == TiffDataType::SRational, "decode_rational expects a rational type");
        SRational r;
        std::memcpy(&r.numerator, src, sizeof(int32_t));
        std::memcpy(&r.denominator, src + sizeof(int32_t), sizeof(int32_t));
        convert_endianness<int32_t, SourceEndian, std::endian::native>(r.numerator);
        convert_endianness<int32_t, SourceEndian, std::endian::native>(r.denominator);
        return SRationalValue{r};
    }
}

} // namespace detail

} // namespace tiffprobe
