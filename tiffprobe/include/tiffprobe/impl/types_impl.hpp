// Do not include this file directly. Include "tiffprobe/types.hpp" instead.

#pragma once

#include <bit>
#include <cstdint>
#include <cstring>

#ifndef TIFFPROBE_TYPES_HEADER
#include "../types.hpp" // for linters
#endif

namespace tiffprobe {

constexpr HeaderMagic magic_for(ByteOrder order) noexcept {
    return order == ByteOrder::BigEndian ? HeaderMagic::BigEndian : HeaderMagic::LittleEndian;
}

// byteswap template

template <typename T>
constexpr T byteswap(T value) noexcept requires std::is_integral_v<T> {
    if constexpr (sizeof(T) == 1) {
        return value;
    } else {
        using U = std::make_unsigned_t<T>;
        U v = static_cast<U>(value);
        if constexpr (sizeof(T) == 2) {
            v = static_cast<U>((v >> 8) | (v << 8));
        } else if constexpr (sizeof(T) == 4) {
            v = static_cast<U>(
                ((v & 0xFF000000u) >> 24) |
                ((v & 0x00FF0000u) >> 8)  |
                ((v & 0x0000FF00u) << 8)  |
                ((v & 0x000000FFu) << 24)
            );
        } else if constexpr (sizeof(T) == 8) {
            v = static_cast<U>(
                ((v & 0xFF00000000000000ULL) >> 56) |
                ((v & 0x00FF000000000000ULL) >> 40) |
                ((v & 0x0000FF0000000000ULL) >> 24) |
                ((v & 0x000000FF00000000ULL) >> 8)  |
                ((v & 0x00000000FF000000ULL) << 8)  |
                ((v & 0x0000000000FF0000ULL) << 24) |
                ((v & 0x000000000000FF00ULL) << 40) |
                ((v & 0x00000000000000FFULL) << 56)
            );
        }
        return static_cast<T>(v);
    }
}

// convert_endianness template

template <typename T, std::endian SourceEndian, std::endian TargetEndian>
constexpr void convert_endianness([[maybe_unused]] T& value) noexcept {
    if constexpr (SourceEndian != TargetEndian) {
        if constexpr (std::is_integral_v<T>) {
            value = byteswap(value);
        } else if constexpr (std::is_floating_point_v<T>) {
            if constexpr (sizeof(T) == 4) {
                uint32_t temp;
                std::memcpy(&temp, &value, sizeof(T));
                temp = byteswap(temp);
                std::memcpy(&value, &temp, sizeof(T));
            } else if constexpr (sizeof(T) == 8) {
                uint64_t temp;
                std::memcpy(&temp, &value, sizeof(T));
                temp = byteswap(temp);
                std::memcpy(&value, &temp, sizeof(T));
            }
        } else {
            static_assert(sizeof(T) == 0, "convert_endianness not specialized for this type");
        }
    }
}

// tiff_type_size function

constexpr std::size_t tiff_type_size(TiffDataType type) noexcept {
    switch (type) {
        case TiffDataType::Byte:
        case TiffDataType::Ascii:
        case TiffDataType::SByte:
        case TiffDataType::Undefined:
            return 1;
        case TiffDataType::Short:
        case TiffDataType::SShort:
            return 2;
        case TiffDataType::Long:
        case TiffDataType::SLong:
        case TiffDataType::Float:
            return 4;
        case TiffDataType::Rational:
        case TiffDataType::SRational:
        case TiffDataType::Double:
            return 8;
    }
    return 0;
}

// RawEntry template implementations

template <std::endian StorageEndian>
template <std::endian TargetEndian>
uint16_t RawEntry<StorageEndian>::get_code() const noexcept {
    if constexpr (TargetEndian == StorageEndian) {
        return code;
    } else {
        return byteswap(code);
    }
}

template <std::endian StorageEndian>
template <std::endian TargetEndian>
uint16_t RawEntry<StorageEndian>::get_datatype() const noexcept {
    if constexpr (TargetEndian == StorageEndian) {
        return datatype;
    } else {
        return byteswap(datatype);
    }
}

template <std::endian StorageEndian>
template <std::endian TargetEndian>
uint32_t RawEntry<StorageEndian>::get_count() const noexcept {
    if constexpr (TargetEndian == StorageEndian) {
        return count;
    } else {
        return byteswap(count);
    }
}

template <std::endian StorageEndian>
template <std::endian TargetEndian>
uint32_t RawEntry<StorageEndian>::get_value_offset() const noexcept {
    if constexpr (TargetEndian == StorageEndian) {
        return value.offset;
    } else {
        return byteswap(value.offset);
    }
}

} // namespace tiffprobe
