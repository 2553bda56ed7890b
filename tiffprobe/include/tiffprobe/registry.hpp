#pragma once

/**
 * @file registry.hpp
 * @brief Static tag and type registries
 *
 * Both registries are compile-time tables keyed by the on-disk 16-bit codes.
 * They are never mutated and can be read concurrently.
 *
 * - The tag registry maps between the on-disk tag code and TagCode, gives the
 *   printable name of a tag, and the type/count TIFF 6.0 expects for it.
 * - The type registry maps the on-disk type code (1..12) to TiffDataType.
 *
 * @code{.cpp}
 * using namespace tiffprobe;
 *
 * auto tag = registry::decode_tag(0x0100);          // TagCode::ImageWidth
 * auto expectation = registry::tag_expectation(*tag);
 * bool ok = registry::type_matches(*expectation, TiffDataType::Short); // true
 * auto label = registry::value_name(TagCode::Compression, 5);        // "LZW"
 * @endcode
 */

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include "types.hpp"
#include "types/tag_codes.hpp"

namespace tiffprobe {

namespace registry {

/// @brief Type and count TIFF 6.0 expects for a tag
struct TagExpectation {
    TiffDataType datatype;
    uint32_t count;             ///< 0 means any count is accepted
    bool accepts_short_or_long; ///< Short and Long are interchangeable for this tag
};

/// @brief One row of the tag registry
struct TagInfo {
    TagCode code;
    std::string_view name;
    bool has_expectation;
    TagExpectation expectation;
};

/// @brief All registered tags, sorted by code
[[nodiscard]] constexpr std::span<const TagInfo> registered_tags() noexcept;

/// @brief Resolve an on-disk tag code
/// @return The tag, or std::nullopt if the code is not registered
[[nodiscard]] constexpr std::optional<TagCode> decode_tag(uint16_t code) noexcept;

/// @brief On-disk code of a tag
[[nodiscard]] constexpr uint16_t encode_tag(TagCode tag) noexcept;

/// @brief Printable name of a tag ("ImageWidth", ...)
[[nodiscard]] constexpr std::string_view tag_name(TagCode tag) noexcept;

/// @brief Expected (type, count) for a tag
/// @return std::nullopt when TIFF 6.0 leaves the tag unconstrained here
[[nodiscard]] constexpr std::optional<TagExpectation> tag_expectation(TagCode tag) noexcept;

/// @brief Check a declared type against an expectation
/// @note Short/Long is the only cross-type equivalence, and only for tags flagged so
[[nodiscard]] constexpr bool type_matches(const TagExpectation& expectation, TiffDataType declared) noexcept;

/// @brief Check a declared count against an expectation (count 0 accepts anything)
[[nodiscard]] constexpr bool count_matches(const TagExpectation& expectation, uint32_t declared) noexcept;

/// @brief Printable name of an enumerated tag value ("LZW", "RGB", ...)
/// @return std::nullopt if the tag has no enumerated values or the value is not one of them
[[nodiscard]] constexpr std::optional<std::string_view> value_name(TagCode tag, uint32_t value) noexcept;

/// @brief Resolve an on-disk type code
/// @return The type for codes 1..12, std::nullopt otherwise
[[nodiscard]] constexpr std::optional<TiffDataType> decode_type(uint16_t code) noexcept;

/// @brief On-disk code of a type
[[nodiscard]] constexpr uint16_t encode_type(TiffDataType type) noexcept;

/// @brief Printable name of a type ("SHORT", ...)
[[nodiscard]] constexpr std::string_view type_name(TiffDataType type) noexcept;

} // namespace registry

} // namespace tiffprobe

#define TIFFPROBE_REGISTRY_HEADER
#include "impl/registry_impl.hpp"
