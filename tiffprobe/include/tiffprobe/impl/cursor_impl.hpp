#pragma once

// This file contains the implementation of ByteCursor.
// Do not include this file directly - it is included by cursor.hpp

#include <array>
#include <cstring>
#include <string>

#ifndef TIFFPROBE_CURSOR_HEADER
#include "../cursor.hpp" // for linters
#endif

namespace tiffprobe {

template <typename Reader>
    requires RawReader<Reader>
Result<void> ByteCursor<Reader>::seek(std::size_t offset) noexcept {
    auto size_result = reader_.size();
    if (size_result.is_error()) {
        return Err(Error::Code::IOError, "Failed to seek to offset " + std::to_string(offset) + ": " + size_result.error().message);
    }
    if (offset > size_result.value()) {
        return Err(Error::Code::IOError,
                   "Failed to seek to offset " + std::to_string(offset) + ": source is only " + std::to_string(size_result.value()) + " bytes");
    }
    position_ = offset;
    return Ok();
}

template <typename Reader>
    requires RawReader<Reader>
Result<void> ByteCursor<Reader>::read_bytes(std::span<std::byte> output) noexcept {
    if (output.empty()) {
        return Ok();
    }

    auto read_result = reader_.read_into(output.data(), position_, output.size());
    if (read_result.is_error()) {
        return Err(Error::Code::IOError,
                   "Failed to read " + std::to_string(output.size()) + " bytes at offset " + std::to_string(position_) + ": " + read_result.error().message);
    }

    if (read_result.value() < output.size()) {
        return Err(Error::Code::IOError,
                   "Incomplete read at offset " + std::to_string(position_) + ": got " + std::to_string(read_result.value()) + " of " + std::to_string(output.size()) + " bytes");
    }

    position_ += output.size();
    return Ok();
}

template <typename Reader>
    requires RawReader<Reader>
template <typename T>
    requires std::is_trivially_copyable_v<T>
Result<T> ByteCursor<Reader>::read_struct() noexcept {
    std::array<std::byte, sizeof(T)> storage;
    auto result = read_bytes(std::span<std::byte>(storage));
    if (result.is_error()) {
        return result.error();
    }

    T value;
    std::memcpy(&value, storage.data(), sizeof(T));
    return Ok(std::move(value));
}

template <typename Reader>
    requires RawReader<Reader>
template <typename T, std::endian SourceEndian>
    requires std::is_arithmetic_v<T>
Result<T> ByteCursor<Reader>::read() noexcept {
    auto result = read_struct<T>();
    if (result.is_error()) {
        return result.error();
    }

    T value = result.value();
    convert_endianness<T, SourceEndian, std::endian::native>(value);
    return Ok(value);
}

} // namespace tiffprobe
