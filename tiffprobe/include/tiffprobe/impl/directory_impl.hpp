#pragma once

// This file contains the implementation of directory reading.
// Do not include this file directly - it is included by directory.hpp

#include <string>
#include <utility>

#ifndef TIFFPROBE_DIRECTORY_HEADER
#include "../directory.hpp" // for linters
#endif

namespace tiffprobe {

namespace detail {

inline std::string describe_tag(TagCode tag) {
    return std::string(registry::tag_name(tag)) + " (" + std::to_string(registry::encode_tag(tag)) + ")";
}

inline void check_expectation(const Entry& entry, uint16_t raw_type, std::vector<Diagnostic>& diagnostics) {
    const auto expectation = registry::tag_expectation(entry.tag);
    if (!expectation) {
        return;
    }

    const uint16_t raw_tag = registry::encode_tag(entry.tag);

    if (!registry::type_matches(*expectation, entry.declared_type)) {
        std::string expected = expectation->accepts_short_or_long
            ? std::string("SHORT or LONG")
            : std::string(registry::type_name(expectation->datatype));
        diagnostics.push_back(Diagnostic{
            entry.index, Error::Code::TypeMismatch, raw_tag, raw_type,
            "Entry " + std::to_string(entry.index) + ": tag " + describe_tag(entry.tag) +
            " declared as " + std::string(registry::type_name(entry.declared_type)) + ", expected " + expected});
    }

    if (!registry::count_matches(*expectation, entry.declared_count)) {
        diagnostics.push_back(Diagnostic{
            entry.index, Error::Code::CountMismatch, raw_tag, raw_type,
            "Entry " + std::to_string(entry.index) + ": tag " + describe_tag(entry.tag) +
            " declared with count " + std::to_string(entry.declared_count) +
            ", expected " + std::to_string(expectation->count)});
    }
}

} // namespace detail

template <std::endian SourceEndian>
std::optional<ScalarValue> resolve_inline_scalar(TiffDataType type, TagValue slot) noexcept {
    // The slot keeps the on-disk bytes: values are left-justified
    const std::byte* src = slot.bytes.data();
    switch (type) {
        case TiffDataType::Byte:   return detail::decode_element<TiffDataType::Byte, SourceEndian>(src);
        case TiffDataType::Short:  return detail::decode_element<TiffDataType::Short, SourceEndian>(src);
        case TiffDataType::Long:   return detail::decode_element<TiffDataType::Long, SourceEndian>(src);
        case TiffDataType::SByte:  return detail::decode_element<TiffDataType::SByte, SourceEndian>(src);
        case TiffDataType::SShort: return detail::decode_element<TiffDataType::SShort, SourceEndian>(src);
        case TiffDataType::SLong:  return detail::decode_element<TiffDataType::SLong, SourceEndian>(src);
        case TiffDataType::Float:  return detail::decode_element<TiffDataType::Float, SourceEndian>(src);
        case TiffDataType::Ascii:
        case TiffDataType::Rational:
        case TiffDataType::Undefined:
        case TiffDataType::SRational:
        case TiffDataType::Double:
            return std::nullopt;
    }
    return std::nullopt;
}

template <std::endian SourceEndian>
Result<Entry> decode_entry(
    const RawEntry<SourceEndian>& raw,
    uint16_t index,
    std::vector<Diagnostic>& diagnostics) noexcept {

    const uint16_t raw_tag = raw.template get_code<std::endian::native>();
    const uint16_t raw_type = raw.template get_datatype<std::endian::native>();

    const auto tag = registry::decode_tag(raw_tag);
    if (!tag) {
        return Err(Error::Code::UnknownTag,
                   "Entry " + std::to_string(index) + ": unknown tag " + std::to_string(raw_tag), raw_tag);
    }

    const auto type = registry::decode_type(raw_type);
    if (!type) {
        return Err(Error::Code::UnknownTagType,
                   "Entry " + std::to_string(index) + ": tag " + detail::describe_tag(*tag) +
                   " has unknown type " + std::to_string(raw_type), raw_type);
    }

    Entry entry{
        index,
        *tag,
        *type,
        raw.template get_count<std::endian::native>(),
        raw.template get_value_offset<std::endian::native>(),
        std::nullopt};

    detail::check_expectation(entry, raw_type, diagnostics);

    if (entry.declared_count == 1) {
        entry.resolved_value = resolve_inline_scalar<SourceEndian>(entry.declared_type, raw.value);
    }

    return Ok(std::move(entry));
}

template <std::endian SourceEndian, typename Reader>
    requires RawReader<Reader>
Result<Directory> read_directory(
    ByteCursor<Reader>& cursor,
    uint32_t directory_offset,
    const LoadOptions& options) noexcept {

    auto seek_result = cursor.seek(directory_offset);
    if (seek_result.is_error()) {
        return seek_result.error();
    }

    auto count_result = cursor.template read<uint16_t, SourceEndian>();
    if (count_result.is_error()) {
        return count_result.error();
    }

    Directory directory;
    directory.entry_count = count_result.value();
    directory.entries.reserve(directory.entry_count);

    for (uint16_t i = 0; i < directory.entry_count; ++i) {
        auto raw_result = cursor.template read_struct<RawEntry<SourceEndian>>();
        if (raw_result.is_error()) {
            return raw_result.error();
        }

        const auto& raw = raw_result.value();
        auto entry_result = decode_entry<SourceEndian>(raw, i, directory.diagnostics);
        if (entry_result.is_ok()) {
            directory.entries.push_back(std::move(entry_result).value());
            continue;
        }

        if (options.policy == ValidationPolicy::Strict) {
            return entry_result.error();
        }

        const Error& error = entry_result.error();
        directory.diagnostics.push_back(Diagnostic{
            i, error.code,
            raw.template get_code<std::endian::native>(),
            raw.template get_datatype<std::endian::native>(),
            error.message + ", entry skipped"});
    }

    return Ok(std::move(directory));
}

template <typename Reader>
    requires RawReader<Reader>
Result<Directory> read_directory(
    ByteCursor<Reader>& cursor,
    const Header& header,
    const LoadOptions& options) noexcept {
    if (header.byte_order == ByteOrder::BigEndian) {
        return read_directory<std::endian::big>(cursor, header.directory_offset, options);
    }
    return read_directory<std::endian::little>(cursor, header.directory_offset, options);
}

} // namespace tiffprobe
