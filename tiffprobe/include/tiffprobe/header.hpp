#pragma once

#include <cstdint>
#include "cursor.hpp"
#include "reader_base.hpp"
#include "types.hpp"
#include "types/result.hpp"

namespace tiffprobe {

/// @brief Byte order and magic pattern found at the start of a file
struct ByteOrderAndMagic {
    ByteOrder byte_order;
    HeaderMagic magic;
};

/// @brief Decoded 8-byte TIFF header
/// @details byte_order and magic always agree: magic == magic_for(byte_order).
struct Header {
    ByteOrder byte_order;
    HeaderMagic magic;
    uint32_t directory_offset; ///< Absolute offset of the first directory, not validated here

    [[nodiscard]] constexpr bool operator==(const Header&) const noexcept = default;
};

/// @brief Detect the byte order and check the magic number
///
/// Reads the 2-byte marker at the cursor, then the 16-bit magic field decoded
/// with the detected byte order. Advances the cursor by 4 bytes.
///
/// @return InvalidByteOrderMarker (raw_value: marker, first byte in the low half),
///         InvalidMagicNumber (raw_value: decoded field) or IOError on short read
template <typename Reader>
    requires RawReader<Reader>
[[nodiscard]] Result<ByteOrderAndMagic> detect_byte_order_and_magic(ByteCursor<Reader>& cursor) noexcept;

/// @brief Read the directory offset that follows the magic number
/// @note The offset is not range-checked; the directory seek reports it.
template <typename Reader>
    requires RawReader<Reader>
[[nodiscard]] Result<Header> parse_header(ByteCursor<Reader>& cursor, const ByteOrderAndMagic& detected) noexcept;

/// @brief Seek to offset 0 and decode the whole header
template <typename Reader>
    requires RawReader<Reader>
[[nodiscard]] Result<Header> read_header(ByteCursor<Reader>& cursor) noexcept;

} // namespace tiffprobe

#define TIFFPROBE_HEADER_HEADER
#include "impl/header_impl.hpp"
