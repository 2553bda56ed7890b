#pragma once

/**
 * @file directory.hpp
 * @brief Directory (IFD) reading and per-entry decoding
 *
 * A directory is a 16-bit entry count followed by that many 12-byte entries,
 * all in the byte order of the file. Each entry is resolved against the tag
 * and type registries, cross-checked against the registry expectation and,
 * when it holds a single small scalar, materialized.
 *
 * Findings that do not stop the read (type and count mismatches, and in
 * lenient mode the skipped unknown entries) are collected as Diagnostic
 * records on the Directory.
 *
 * The next-directory offset that follows the entries is not read: only the
 * first directory is decoded.
 */

#include <bit>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "cursor.hpp"
#include "header.hpp"
#include "reader_base.hpp"
#include "registry.hpp"
#include "types.hpp"
#include "types/result.hpp"
#include "types/tag_codes.hpp"
#include "value.hpp"

namespace tiffprobe {

/// @brief What to do with entries whose tag or type code is unknown
enum class ValidationPolicy : uint8_t {
    Strict,  ///< Abort the whole read with UnknownTag / UnknownTagType
    Lenient, ///< Skip the entry, record a Diagnostic and continue
};

/// @brief Caller-selected load configuration
struct LoadOptions {
    ValidationPolicy policy = ValidationPolicy::Strict;
};

/// @brief Non-fatal finding about one directory entry
struct Diagnostic {
    uint16_t entry_index; ///< Position of the entry in the on-disk table
    Error::Code code;     ///< TypeMismatch, CountMismatch, UnknownTag or UnknownTagType
    uint16_t raw_tag;
    uint16_t raw_type;
    std::string message;
};

/// @brief One decoded directory entry
struct Entry {
    uint16_t index;               ///< Position in the on-disk table
    TagCode tag;
    TiffDataType declared_type;
    uint32_t declared_count;
    uint32_t raw_field;           ///< Value/offset slot decoded as a u32 in the file byte order
    std::optional<ScalarValue> resolved_value; ///< Set only for single inline scalars

    /// @brief Total byte size of the values, declared_count * size(declared_type)
    [[nodiscard]] uint64_t value_byte_size() const noexcept {
        return static_cast<uint64_t>(declared_count) * tiff_type_size(declared_type);
    }

    /// @brief True if the values live in the 4-byte slot itself
    [[nodiscard]] bool is_inline() const noexcept {
        return value_byte_size() <= inline_bytecount_limit;
    }
};

/// @brief Decoded directory
/// @details In strict mode entries.size() == entry_count. In lenient mode
/// skipped entries are absent and each has a diagnostic.
struct Directory {
    uint16_t entry_count{0};
    std::vector<Entry> entries;
    std::vector<Diagnostic> diagnostics;

    /// @brief First entry with the given tag, or nullptr
    [[nodiscard]] const Entry* find(TagCode tag) const noexcept {
        for (const auto& entry : entries) {
            if (entry.tag == tag) {
                return &entry;
            }
        }
        return nullptr;
    }
};

/// @brief Decode one raw entry
///
/// Resolves tag then type (UnknownTag / UnknownTagType errors carry the raw
/// code), appends TypeMismatch / CountMismatch diagnostics, and materializes
/// the value for count 1 inline scalars of type Byte, Short, Long, SByte,
/// SShort, SLong or Float.
template <std::endian SourceEndian>
[[nodiscard]] Result<Entry> decode_entry(
    const RawEntry<SourceEndian>& raw,
    uint16_t index,
    std::vector<Diagnostic>& diagnostics) noexcept;

/// @brief Materialize a count 1 inline scalar from the value slot
/// @return std::nullopt for the types that never resolve inline
template <std::endian SourceEndian>
[[nodiscard]] std::optional<ScalarValue> resolve_inline_scalar(TiffDataType type, TagValue slot) noexcept;

/// @brief Read the directory at an offset, with a compile-time byte order
template <std::endian SourceEndian, typename Reader>
    requires RawReader<Reader>
[[nodiscard]] Result<Directory> read_directory(
    ByteCursor<Reader>& cursor,
    uint32_t directory_offset,
    const LoadOptions& options = {}) noexcept;

/// @brief Read the directory a header points to
/// Dispatches to the byte order found in the header.
template <typename Reader>
    requires RawReader<Reader>
[[nodiscard]] Result<Directory> read_directory(
    ByteCursor<Reader>& cursor,
    const Header& header,
    const LoadOptions& options = {}) noexcept;

} // namespace tiffprobe

#define TIFFPROBE_DIRECTORY_HEADER
#include "impl/directory_impl.hpp"
