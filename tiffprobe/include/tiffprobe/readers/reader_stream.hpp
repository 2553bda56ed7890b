#pragma once

#include <algorithm>
#include <cstddef>
#include <fstream>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include "../reader_base.hpp"

namespace tiffprobe {
namespace stream_impl {

/// Read-only view that owns allocated buffer
class OwnedBufferReadView {
private:
    std::span<const std::byte> data_;
    std::shared_ptr<std::byte[]> buffer_;

public:
    OwnedBufferReadView() noexcept = default;

    OwnedBufferReadView(std::span<const std::byte> data, std::shared_ptr<std::byte[]> buffer) noexcept
        : data_(data), buffer_(std::move(buffer)) {}

    [[nodiscard]] std::span<const std::byte> data() const noexcept { return data_; }
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    OwnedBufferReadView(OwnedBufferReadView&&) noexcept = default;
    OwnedBufferReadView& operator=(OwnedBufferReadView&&) noexcept = default;
    OwnedBufferReadView(const OwnedBufferReadView&) = delete;
    OwnedBufferReadView& operator=(const OwnedBufferReadView&) = delete;
};

static_assert(DataReadOnlyView<OwnedBufferReadView>, "OwnedBufferReadView must satisfy DataReadOnlyView concept");

} // namespace stream_impl

/// Portable file reader using std::fstream
/// Reads are serialized with a mutex. The stream is closed on destruction.
class StreamFileReader {
private:
    mutable std::ifstream stream_;
    mutable std::mutex mutex_;
    std::size_t size_{0};
    std::string path_;

    // Caller holds mutex_
    [[nodiscard]] Result<std::size_t> read_locked(char* dest, std::size_t offset, std::size_t size) const noexcept {
        std::size_t bytes_to_read = std::min(size, size_ - offset);

        stream_.clear();
        stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
        if (!stream_) {
            return Err(Error::Code::ReadError, "Failed to seek to offset");
        }

        stream_.read(dest, static_cast<std::streamsize>(bytes_to_read));
        if (!stream_ && !stream_.eof()) {
            return Err(Error::Code::ReadError, "Failed to read from file");
        }

        return Ok(static_cast<std::size_t>(stream_.gcount()));
    }

public:
    using ReadViewType = stream_impl::OwnedBufferReadView;

    static constexpr bool read_must_allocate = true;

    StreamFileReader() noexcept = default;

    explicit StreamFileReader(std::string_view path) noexcept {
        (void)open(path);
    }

    ~StreamFileReader() noexcept {
        close();
    }

    StreamFileReader(const StreamFileReader&) = delete;
    StreamFileReader& operator=(const StreamFileReader&) = delete;

    StreamFileReader(StreamFileReader&& other) noexcept
        : stream_(std::move(other.stream_))
        , size_(other.size_)
        , path_(std::move(other.path_)) {
        other.size_ = 0;
    }

    StreamFileReader& operator=(StreamFileReader&& other) noexcept {
        if (this != &other) {
            close();
            stream_ = std::move(other.stream_);
            size_ = other.size_;
            path_ = std::move(other.path_);
            other.size_ = 0;
        }
        return *this;
    }

    [[nodiscard]] Result<void> open(std::string_view path) noexcept {
        close();

        path_ = path;
        stream_.open(path_, std::ios::binary | std::ios::in);
        if (!stream_) {
            return Err(Error::Code::FileNotFound, "Failed to open file: " + std::string(path));
        }

        // Get file size
        stream_.seekg(0, std::ios::end);
        auto end = stream_.tellg();
        if (!stream_ || end < 0) {
            stream_.close();
            return Err(Error::Code::ReadError, "Failed to determine size of file: " + std::string(path));
        }
        size_ = static_cast<std::size_t>(end);
        stream_.seekg(0, std::ios::beg);

        return Ok();
    }

    void close() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stream_.is_open()) {
            stream_.close();
            size_ = 0;
        }
    }

    [[nodiscard]] Result<ReadViewType> read(std::size_t offset, std::size_t size) const noexcept {
        if (!is_valid()) {
            return Err(Error::Code::ReadError, "File not open");
        }

        if (offset >= size_) {
            return Err(Error::Code::OutOfBounds, "Read offset beyond file size");
        }

        std::size_t bytes_to_read = std::min(size, size_ - offset);
        auto buffer = std::shared_ptr<std::byte[]>(new std::byte[bytes_to_read]);

        std::lock_guard<std::mutex> lock(mutex_);
        auto result = read_locked(reinterpret_cast<char*>(buffer.get()), offset, bytes_to_read);
        if (!result) {
            return result.error();
        }

        std::span<const std::byte> data_span(buffer.get(), result.value());
        return Ok(stream_impl::OwnedBufferReadView(data_span, std::move(buffer)));
    }

    [[nodiscard]] Result<std::size_t> read_into(void* dest_buffer, std::size_t offset, std::size_t size) const noexcept {
        if (!is_valid()) {
            return Err(Error::Code::ReadError, "File not open");
        }

        if (offset >= size_) {
            return Err(Error::Code::OutOfBounds, "Read offset beyond file size");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        return read_locked(reinterpret_cast<char*>(dest_buffer), offset, size);
    }

    [[nodiscard]] Result<std::size_t> size() const noexcept {
        if (!is_valid()) {
            return Err(Error::Code::ReadError, "File not open");
        }
        return Ok(size_);
    }

    [[nodiscard]] bool is_valid() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return stream_.is_open();
    }
};

static_assert(RawReader<StreamFileReader>, "StreamFileReader must satisfy RawReader concept");

} // namespace tiffprobe
