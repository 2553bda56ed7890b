#pragma once

// This file contains the implementation of value materialization.
// Do not include this file directly - it is included by values.hpp

#include <array>
#include <cstddef>
#include <cstring>
#include <limits>
#include <span>
#include <string>
#include "../cursor.hpp"

#ifndef TIFFPROBE_VALUES_HEADER
#include "../values.hpp" // for linters
#endif

namespace tiffprobe {

namespace detail {

template <TiffDataType Type, std::endian SourceEndian>
void decode_elements(std::span<const std::byte> bytes, std::vector<ScalarValue>& values) {
    constexpr std::size_t element_size = tiff_type_size(Type);
    values.reserve(bytes.size() / element_size);
    for (std::size_t pos = 0; pos + element_size <= bytes.size(); pos += element_size) {
        if constexpr (Type == TiffDataType::Rational || Type == TiffDataType::SRational) {
            values.push_back(decode_rational<Type, SourceEndian>(bytes.data() + pos));
        } else {
            values.push_back(decode_element<Type, SourceEndian>(bytes.data() + pos));
        }
    }
}

inline AsciiValue decode_ascii(std::span<const std::byte> bytes) {
    std::string text(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    auto last = text.find_last_not_of('\0');
    text.resize(last == std::string::npos ? 0 : last + 1);
    return AsciiValue{std::move(text)};
}

template <std::endian SourceEndian>
std::vector<ScalarValue> decode_values(TiffDataType type, std::span<const std::byte> bytes) {
    std::vector<ScalarValue> values;
    switch (type) {
        case TiffDataType::Ascii:
            values.push_back(decode_ascii(bytes));
            break;
        case TiffDataType::Byte:      decode_elements<TiffDataType::Byte, SourceEndian>(bytes, values); break;
        case TiffDataType::Short:     decode_elements<TiffDataType::Short, SourceEndian>(bytes, values); break;
        case TiffDataType::Long:      decode_elements<TiffDataType::Long, SourceEndian>(bytes, values); break;
        case TiffDataType::Rational:  decode_elements<TiffDataType::Rational, SourceEndian>(bytes, values); break;
        case TiffDataType::SByte:     decode_elements<TiffDataType::SByte, SourceEndian>(bytes, values); break;
        case TiffDataType::Undefined: decode_elements<TiffDataType::Undefined, SourceEndian>(bytes, values); break;
        case TiffDataType::SShort:    decode_elements<TiffDataType::SShort, SourceEndian>(bytes, values); break;
        case TiffDataType::SLong:     decode_elements<TiffDataType::SLong, SourceEndian>(bytes, values); break;
        case TiffDataType::SRational: decode_elements<TiffDataType::SRational, SourceEndian>(bytes, values); break;
        case TiffDataType::Float:     decode_elements<TiffDataType::Float, SourceEndian>(bytes, values); break;
        case TiffDataType::Double:    decode_elements<TiffDataType::Double, SourceEndian>(bytes, values); break;
    }
    return values;
}

template <std::endian SourceEndian, typename Reader>
    requires RawReader<Reader>
Result<std::vector<ScalarValue>> read_entry_values_impl(const Reader& reader, const Entry& entry) noexcept {
    if (entry.declared_count == 0) {
        return Ok(std::vector<ScalarValue>{});
    }

    const uint64_t byte_size = entry.value_byte_size();

    if (entry.is_inline()) {
        // Put the slot back in file order to recover the bytes as stored
        uint32_t slot = entry.raw_field;
        convert_endianness<uint32_t, std::endian::native, SourceEndian>(slot);
        std::array<std::byte, sizeof(uint32_t)> bytes;
        std::memcpy(bytes.data(), &slot, sizeof(slot));
        return Ok(decode_values<SourceEndian>(
            entry.declared_type, std::span<const std::byte>(bytes.data(), static_cast<std::size_t>(byte_size))));
    }

    if (byte_size > std::numeric_limits<std::size_t>::max()) {
        return Err(Error::Code::IOError,
                   "Value block of " + std::to_string(byte_size) + " bytes is too large to read");
    }

    auto size_result = reader.size();
    if (size_result.is_error()) {
        return Err(Error::Code::IOError, "Failed to read values: " + size_result.error().message);
    }
    if (static_cast<uint64_t>(entry.raw_field) + byte_size > size_result.value()) {
        return Err(Error::Code::IOError,
                   "Value block at offset " + std::to_string(entry.raw_field) + " (" + std::to_string(byte_size) +
                   " bytes) extends past the end of the source (" + std::to_string(size_result.value()) + " bytes)");
    }

    std::vector<std::byte> bytes(static_cast<std::size_t>(byte_size));
    ByteCursor<Reader> cursor(reader);
    auto seek_result = cursor.seek(entry.raw_field);
    if (seek_result.is_error()) {
        return seek_result.error();
    }
    auto read_result = cursor.read_bytes(std::span<std::byte>(bytes));
    if (read_result.is_error()) {
        return read_result.error();
    }

    return Ok(decode_values<SourceEndian>(entry.declared_type, std::span<const std::byte>(bytes)));
}

} // namespace detail

template <typename Reader>
    requires RawReader<Reader>
Result<std::vector<ScalarValue>> read_entry_values(
    const Reader& reader,
    ByteOrder byte_order,
    const Entry& entry) noexcept {
    if (byte_order == ByteOrder::BigEndian) {
        return detail::read_entry_values_impl<std::endian::big>(reader, entry);
    }
    return detail::read_entry_values_impl<std::endian::little>(reader, entry);
}

} // namespace tiffprobe
