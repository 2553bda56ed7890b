#pragma once

#include <concepts>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace tiffprobe {

/// Error type for TIFF header and directory decoding
struct Error {
    enum class Code {
        Success,
        // Transport level (reported by readers)
        FileNotFound,
        ReadError,
        OutOfBounds,
        // Decoding level
        IOError,                ///< Short read or failed seek, wraps the transport error
        InvalidByteOrderMarker, ///< First two bytes are neither "II" nor "MM"
        InvalidMagicNumber,     ///< Magic field does not decode to 42
        UnknownTag,             ///< Tag code outside of the registry
        UnknownTagType,         ///< Type code outside of 1..12
        TypeMismatch,           ///< Declared type differs from the registry (warning)
        CountMismatch           ///< Declared count differs from the registry (warning)
    };

    Code code;
    std::string message;
    uint32_t raw_value{0}; ///< Offending raw field (marker, magic, tag or type code)

    Error(Code c, std::string msg = "", uint32_t raw = 0) noexcept
        : code(c), message(std::move(msg)), raw_value(raw) {}
};

/// Short printable name of an error code
[[nodiscard]] constexpr const char* error_code_name(Error::Code code) noexcept {
    switch (code) {
        case Error::Code::Success: return "Success";
        case Error::Code::FileNotFound: return "FileNotFound";
        case Error::Code::ReadError: return "ReadError";
        case Error::Code::OutOfBounds: return "OutOfBounds";
        case Error::Code::IOError: return "IOError";
        case Error::Code::InvalidByteOrderMarker: return "InvalidByteOrderMarker";
        case Error::Code::InvalidMagicNumber: return "InvalidMagicNumber";
        case Error::Code::UnknownTag: return "UnknownTag";
        case Error::Code::UnknownTagType: return "UnknownTagType";
        case Error::Code::TypeMismatch: return "TypeMismatch";
        case Error::Code::CountMismatch: return "CountMismatch";
    }
    return "Unknown";
}

/// Result type for operations that may fail without exceptions
template <typename T>
class [[nodiscard]] Result {
private:
    std::variant<T, Error> data_;

public:
    Result(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : data_(std::forward<T>(value)) {}

    Result(const T& value) noexcept(std::is_nothrow_copy_constructible_v<T>)
        : data_(value) {}

    Result(Error&& error) noexcept
        : data_(std::forward<Error>(error)) {}

    Result(const Error& error) noexcept
        : data_(error) {}

    [[nodiscard]] bool is_ok() const noexcept {
        return std::holds_alternative<T>(data_);
    }

    [[nodiscard]] bool is_error() const noexcept {
        return std::holds_alternative<Error>(data_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return is_ok();
    }

    [[nodiscard]] T& value() & noexcept {
        return std::get<T>(data_);
    }

    [[nodiscard]] const T& value() const& noexcept {
        return std::get<T>(data_);
    }

    [[nodiscard]] T&& value() && noexcept {
        return std::get<T>(std::move(data_));
    }

    [[nodiscard]] const Error& error() const noexcept {
        return std::get<Error>(data_);
    }
};

// Specialization for void
template <>
class [[nodiscard]] Result<void> {
private:
    std::variant<std::monostate, Error> data_;

public:
    Result() noexcept : data_(std::monostate{}) {}

    Result(Error&& error) noexcept
        : data_(std::forward<Error>(error)) {}

    Result(const Error& error) noexcept
        : data_(error) {}

    [[nodiscard]] bool is_ok() const noexcept {
        return std::holds_alternative<std::monostate>(data_);
    }

    [[nodiscard]] bool is_error() const noexcept {
        return std::holds_alternative<Error>(data_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return is_ok();
    }

    [[nodiscard]] const Error& error() const noexcept {
        return std::get<Error>(data_);
    }
};

// Helper functions for creating results
template <typename T>
[[nodiscard]] Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>{std::forward<T>(value)};
}

[[nodiscard]] inline Result<void> Ok() {
    return Result<void>{};
}

[[nodiscard]] inline Error Err(Error::Code code, std::string message = "", uint32_t raw_value = 0) {
    return Error{code, std::move(message), raw_value};
}

} // namespace tiffprobe
