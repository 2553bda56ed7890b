#pragma once

#include <array>
#include <bit>
#include <cstdint>
#include <cstring>
#include <type_traits>

namespace tiffprobe {

/// @brief Byte order marker, the first two bytes of every TIFF file
/// @details Both values are byte-order symmetric ("II" and "MM"), so they can
/// be recognized before the byte order of the file is known.
enum class ByteOrder : uint16_t {
    LittleEndian = 0x4949, ///< "II" (Intel)
    BigEndian    = 0x4D4D, ///< "MM" (Motorola)
};

/// @brief Magic number as it appears when read as a little-endian u16
/// @details The constant is 42 in both cases; the raw pattern depends on the
/// byte order of the file.
enum class HeaderMagic : uint16_t {
    LittleEndian = 0x002A,
    BigEndian    = 0x2A00,
};

/// Value of the magic field once decoded with the file's byte order
inline constexpr uint16_t tiff_magic_number = 42;

/// @brief TIFF data type enumeration (TIFF 6.0, section 2)
enum class TiffDataType : uint16_t {
    Byte      = 1,  ///< 8-bit unsigned integer
    Ascii     = 2,  ///< 8-bit byte containing a 7-bit ASCII code
    Short     = 3,  ///< 16-bit unsigned integer
    Long      = 4,  ///< 32-bit unsigned integer
    Rational  = 5,  ///< Two LONGs: numerator, denominator
    SByte     = 6,  ///< 8-bit signed integer
    Undefined = 7,  ///< 8-bit byte (uninterpreted)
    SShort    = 8,  ///< 16-bit signed integer
    SLong     = 9,  ///< 32-bit signed integer
    SRational = 10, ///< Two SLONGs: numerator, denominator
    Float     = 11, ///< Single precision (4-byte) IEEE format
    Double    = 12, ///< Double precision (8-byte) IEEE format
};

/// @brief Rational number representation (unsigned)
struct Rational {
    uint32_t numerator;
    uint32_t denominator;

    [[nodiscard]] constexpr bool operator==(const Rational&) const noexcept = default;
};

/// @brief Rational number representation (signed)
struct SRational {
    int32_t numerator;
    int32_t denominator;

    [[nodiscard]] constexpr bool operator==(const SRational&) const noexcept = default;
};

/// @brief Magic pattern that goes with a byte order
[[nodiscard]] constexpr HeaderMagic magic_for(ByteOrder order) noexcept;

/// @brief Byte-swap an integral value
/// @note For 1-byte types, returns the value unchanged
template <typename T>
[[nodiscard]] constexpr T byteswap(T value) noexcept requires std::is_integral_v<T>;

/// @brief Convert a value from source endianness to target endianness in place
/// @note Handles integral and floating point types
template <typename T, std::endian SourceEndian, std::endian TargetEndian>
constexpr void convert_endianness([[maybe_unused]] T& value) noexcept;

/// @brief Size in bytes of one element of a TIFF data type
/// @return Size in bytes, or 0 for codes outside of the TIFF 6.0 catalogue
[[nodiscard]] constexpr std::size_t tiff_type_size(TiffDataType type) noexcept;

// MSVC ignores the packed attribute
#pragma pack(push, 1)

/// @brief Value/offset slot of a directory entry, as stored on disk
/// @details If count*size <= 4 bytes, the value is stored inline and
/// left-justified. Otherwise, this slot contains an absolute file offset.
union [[gnu::packed]] TagValue {
    uint32_t offset;
    std::array<std::byte, 4> bytes;
};

/// @brief One 12-byte directory entry as stored on disk
/// @tparam StorageEndian Endianness of the TIFF file
template <std::endian StorageEndian>
struct [[gnu::packed]] RawEntry {
    uint16_t code;     ///< Tag identifier
    uint16_t datatype; ///< Data type code (not validated)
    uint32_t count;    ///< Number of values of the specified type
    TagValue value;    ///< Value or offset to value

    template <std::endian TargetEndian = std::endian::native>
    [[nodiscard]] uint16_t get_code() const noexcept;

    template <std::endian TargetEndian = std::endian::native>
    [[nodiscard]] uint16_t get_datatype() const noexcept;

    template <std::endian TargetEndian = std::endian::native>
    [[nodiscard]] uint32_t get_count() const noexcept;

    /// @brief The value/offset slot decoded as a u32
    template <std::endian TargetEndian = std::endian::native>
    [[nodiscard]] uint32_t get_value_offset() const noexcept;
};

#pragma pack(pop)

static_assert(sizeof(TagValue) == 4, "TagValue must be 4 bytes");
static_assert(sizeof(RawEntry<std::endian::little>) == 12, "RawEntry must be 12 bytes");
static_assert(sizeof(RawEntry<std::endian::big>) == 12, "RawEntry must be 12 bytes");

/// Size of the value/offset slot of an entry
inline constexpr std::size_t inline_bytecount_limit = sizeof(TagValue);

} // namespace tiffprobe

#define TIFFPROBE_TYPES_HEADER
#include "impl/types_impl.hpp"
