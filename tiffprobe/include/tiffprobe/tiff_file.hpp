#pragma once

/**
 * @file tiff_file.hpp
 * @brief Entry point: decode the header and first directory of a Classic TIFF
 *
 * @code{.cpp}
 * using namespace tiffprobe;
 *
 * auto result = load("image.tif");
 * if (!result) {
 *     std::cerr << result.error().message << "\n";
 *     return 1;
 * }
 * const TiffFile& file = result.value();
 * if (const Entry* width = file.directory.find(TagCode::ImageWidth)) {
 *     // width->resolved_value holds ShortValue or LongValue
 * }
 * @endcode
 */

#include <string_view>
#include "directory.hpp"
#include "header.hpp"
#include "reader_base.hpp"
#include "readers/reader_stream.hpp"
#include "types/result.hpp"

namespace tiffprobe {

/// @brief Header and first directory of a file
struct TiffFile {
    Header header;
    Directory directory;
};

/// @brief Decode a file from any byte source
///
/// Header errors (InvalidByteOrderMarker, InvalidMagicNumber, IOError) abort
/// immediately. IOError during the directory read is fatal under both
/// policies; UnknownTag / UnknownTagType are fatal only under
/// ValidationPolicy::Strict.
template <typename Reader>
    requires RawReader<Reader>
[[nodiscard]] Result<TiffFile> load(const Reader& reader, const LoadOptions& options = {}) noexcept;

/// @brief Open a file and decode it
/// @note The file is closed before returning, on success and on error.
///       A file that cannot be opened is reported as IOError.
[[nodiscard]] inline Result<TiffFile> load(std::string_view path, const LoadOptions& options = {}) noexcept;

} // namespace tiffprobe

#define TIFFPROBE_TIFF_FILE_HEADER
#include "impl/tiff_file_impl.hpp"
