#pragma once

#include <concepts>
#include <cstddef>
#include <span>
#include <type_traits>
#include "types/result.hpp"

namespace tiffprobe {

/// Concept for a read-only view into data with RAII lifetime management
/// Only one thread at a time should access the view
template <typename T>
concept DataReadOnlyView = requires(T view) {
    // Access to the underlying data
    { view.data() } -> std::same_as<std::span<const std::byte>>;

    // Size of the data
    { view.size() } -> std::same_as<std::size_t>;

    // Check if view is empty
    { view.empty() } -> std::same_as<bool>;

    // Must be movable for Result<T>
    requires std::move_constructible<T>;
    requires std::is_nothrow_move_constructible_v<T>;
};

/// Concept for a byte source that provides positioned reads
///
/// read() and read_into() may return fewer bytes than requested when the range
/// crosses the end of the source. A read starting at or past the end fails with
/// OutOfBounds.
template <typename T>
concept RawReader = requires(const T reader, void* buffer, std::size_t offset, std::size_t size) {
    // Read operation returning a view (implementation may use zero-copy or allocate)
    { reader.read(offset, size) } -> std::same_as<Result<typename T::ReadViewType>>;
    requires DataReadOnlyView<typename T::ReadViewType>;

    // Alternative read_into() method that reads directly into provided buffer.
    // Returns the number of bytes actually copied.
    { reader.read_into(buffer, offset, size) } -> std::same_as<Result<std::size_t>>;

    // Get total size of the readable content
    { reader.size() } -> std::same_as<Result<std::size_t>>;

    // Check if reader is valid/open
    { reader.is_valid() } -> std::same_as<bool>;

    // Hint whether read() must allocate new buffer or can return zero-copy views
    // If true, read_into() should be preferred for performance
    { T::read_must_allocate } -> std::convertible_to<bool>;
};

} // namespace tiffprobe
