#pragma once

#include <vector>
#include "directory.hpp"
#include "reader_base.hpp"
#include "types.hpp"
#include "types/result.hpp"
#include "value.hpp"

namespace tiffprobe {

/// @brief Read every value of an entry
///
/// Values of at most 4 bytes are taken from the entry's value slot
/// (left-justified), larger ones from the absolute offset held in raw_field.
/// This never modifies entry.resolved_value.
///
/// - ASCII yields a single AsciiValue, with trailing NULs trimmed
/// - RATIONAL / SRATIONAL yield one value per numerator/denominator pair
/// - All other types yield declared_count values
///
/// @param reader Source the entry was read from
/// @param byte_order Byte order of the file (Header::byte_order)
/// @return IOError when the value block does not fit in the source
template <typename Reader>
    requires RawReader<Reader>
[[nodiscard]] Result<std::vector<ScalarValue>> read_entry_values(
    const Reader& reader,
    ByteOrder byte_order,
    const Entry& entry) noexcept;

} // namespace tiffprobe

#define TIFFPROBE_VALUES_HEADER
#include "impl/values_impl.hpp"
