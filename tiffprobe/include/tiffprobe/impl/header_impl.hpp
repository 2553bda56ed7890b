#pragma once

// This file contains the implementation of header decoding.
// Do not include this file directly - it is included by header.hpp

#include <array>
#include <cstddef>
#include <string>

#ifndef TIFFPROBE_HEADER_HEADER
#include "../header.hpp" // for linters
#endif

namespace tiffprobe {

namespace detail {

template <std::endian SourceEndian, typename Reader>
    requires RawReader<Reader>
Result<ByteOrderAndMagic> check_magic(ByteCursor<Reader>& cursor, ByteOrder byte_order) noexcept {
    auto magic_result = cursor.template read<uint16_t, SourceEndian>();
    if (magic_result.is_error()) {
        return magic_result.error();
    }

    const uint16_t magic = magic_result.value();
    if (magic != tiff_magic_number) {
        return Err(Error::Code::InvalidMagicNumber,
                   "Invalid TIFF magic number: " + std::to_string(magic) + ", expected " + std::to_string(tiff_magic_number),
                   magic);
    }

    return Ok(ByteOrderAndMagic{byte_order, magic_for(byte_order)});
}

} // namespace detail

template <typename Reader>
    requires RawReader<Reader>
Result<ByteOrderAndMagic> detect_byte_order_and_magic(ByteCursor<Reader>& cursor) noexcept {
    auto marker_result = cursor.template read_struct<std::array<std::byte, 2>>();
    if (marker_result.is_error()) {
        return marker_result.error();
    }

    // Both markers are palindromes: no byte order is needed to recognize them
    const auto& marker = marker_result.value();
    const uint16_t raw = static_cast<uint16_t>(
        std::to_integer<uint16_t>(marker[0]) | (std::to_integer<uint16_t>(marker[1]) << 8));

    switch (static_cast<ByteOrder>(raw)) {
        case ByteOrder::LittleEndian:
            return detail::check_magic<std::endian::little>(cursor, ByteOrder::LittleEndian);
        case ByteOrder::BigEndian:
            return detail::check_magic<std::endian::big>(cursor, ByteOrder::BigEndian);
    }

    return Err(Error::Code::InvalidByteOrderMarker,
               "Invalid TIFF byte order marker: " + std::to_string(raw), raw);
}

template <typename Reader>
    requires RawReader<Reader>
Result<Header> parse_header(ByteCursor<Reader>& cursor, const ByteOrderAndMagic& detected) noexcept {
    auto offset_result = detected.byte_order == ByteOrder::BigEndian
        ? cursor.template read<uint32_t, std::endian::big>()
        : cursor.template read<uint32_t, std::endian::little>();
    if (offset_result.is_error()) {
        return offset_result.error();
    }

    return Ok(Header{detected.byte_order, detected.magic, offset_result.value()});
}

template <typename Reader>
    requires RawReader<Reader>
Result<Header> read_header(ByteCursor<Reader>& cursor) noexcept {
    auto seek_result = cursor.seek(0);
    if (seek_result.is_error()) {
        return seek_result.error();
    }

    auto detected = detect_byte_order_and_magic(cursor);
    if (detected.is_error()) {
        return detected.error();
    }

    return parse_header(cursor, detected.value());
}

} // namespace tiffprobe
