#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <span>
#include <vector>
#include "../reader_base.hpp"

namespace tiffprobe {
namespace buffer_impl {

/// Read-only view for borrowed buffer data (zero-copy)
class BorrowedBufferReadView {
private:
    std::span<const std::byte> data_;

public:
    BorrowedBufferReadView() noexcept = default;

    explicit BorrowedBufferReadView(std::span<const std::byte> data) noexcept
        : data_(data) {}

    [[nodiscard]] std::span<const std::byte> data() const noexcept { return data_; }
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    BorrowedBufferReadView(BorrowedBufferReadView&&) noexcept = default;
    BorrowedBufferReadView& operator=(BorrowedBufferReadView&&) noexcept = default;
    BorrowedBufferReadView(const BorrowedBufferReadView&) = delete;
    BorrowedBufferReadView& operator=(const BorrowedBufferReadView&) = delete;
};

static_assert(DataReadOnlyView<BorrowedBufferReadView>, "BorrowedBufferReadView must satisfy DataReadOnlyView concept");

} // namespace buffer_impl

/// In-memory buffer view reader (borrowed, zero-copy)
/// The caller keeps the buffer alive for as long as the reader is used.
class BufferViewReader {
private:
    std::span<const std::byte> buffer_;

public:
    using ReadViewType = buffer_impl::BorrowedBufferReadView;

    static constexpr bool read_must_allocate = false;

    BufferViewReader() noexcept = default;

    explicit BufferViewReader(std::span<const std::byte> buffer) noexcept
        : buffer_(buffer) {}

    // Template constructor for any span type
    template <typename T>
    explicit BufferViewReader(std::span<const T> data) noexcept
        : buffer_(std::as_bytes(data)) {}

    explicit BufferViewReader(const std::vector<std::byte>& data) noexcept
        : buffer_(data.data(), data.size()) {}

    [[nodiscard]] Result<ReadViewType> read(std::size_t offset, std::size_t size) const noexcept {
        if (offset >= buffer_.size()) [[unlikely]] {
            return Err(Error::Code::OutOfBounds, "Read offset beyond buffer size");
        }

        std::size_t bytes_to_read = std::min(size, buffer_.size() - offset);
        return Ok(buffer_impl::BorrowedBufferReadView(buffer_.subspan(offset, bytes_to_read)));
    }

    [[nodiscard]] Result<std::size_t> read_into(void* dest_buffer, std::size_t offset, std::size_t size) const noexcept {
        if (offset >= buffer_.size()) [[unlikely]] {
            return Err(Error::Code::OutOfBounds, "Read offset beyond buffer size");
        }

        std::size_t bytes_to_read = std::min(size, buffer_.size() - offset);
        std::memcpy(dest_buffer, buffer_.data() + offset, bytes_to_read);
        return Ok(bytes_to_read);
    }

    [[nodiscard]] Result<std::size_t> size() const noexcept {
        return Ok(buffer_.size());
    }

    [[nodiscard]] bool is_valid() const noexcept {
        // An empty buffer is still valid - it just has zero size
        return true;
    }
};

static_assert(RawReader<BufferViewReader>, "BufferViewReader must satisfy RawReader concept");

} // namespace tiffprobe
