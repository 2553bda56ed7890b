#pragma once

#include <bit>
#include <cstddef>
#include <span>
#include <type_traits>
#include "reader_base.hpp"
#include "types.hpp"
#include "types/result.hpp"

namespace tiffprobe {

/// @brief Sequential reader over a RawReader
///
/// Keeps a current position, advanced by every successful read. Any transport
/// failure or short read is reported as Error::Code::IOError, with the
/// transport message appended. The cursor borrows the reader: the reader must
/// outlive it.
template <typename Reader>
    requires RawReader<Reader>
class ByteCursor {
private:
    const Reader& reader_;
    std::size_t position_{0};

public:
    explicit ByteCursor(const Reader& reader, std::size_t position = 0) noexcept
        : reader_(reader), position_(position) {}

    /// @brief Current absolute position
    [[nodiscard]] std::size_t position() const noexcept { return position_; }

    /// @brief Move to an absolute offset
    /// @return IOError if the offset lies past the end of the source
    [[nodiscard]] Result<void> seek(std::size_t offset) noexcept;

    /// @brief Read exactly output.size() bytes
    [[nodiscard]] Result<void> read_bytes(std::span<std::byte> output) noexcept;

    /// @brief Read a trivially copyable struct as stored, without endianness conversion
    template <typename T>
        requires std::is_trivially_copyable_v<T>
    [[nodiscard]] Result<T> read_struct() noexcept;

    /// @brief Read an arithmetic value stored in SourceEndian order
    template <typename T, std::endian SourceEndian>
        requires std::is_arithmetic_v<T>
    [[nodiscard]] Result<T> read() noexcept;
};

} // namespace tiffprobe

#define TIFFPROBE_CURSOR_HEADER
#include "impl/cursor_impl.hpp"
