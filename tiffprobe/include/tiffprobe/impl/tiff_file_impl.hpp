#pragma once

// This file contains the implementation of the load entry points.
// Do not include this file directly - it is included by tiff_file.hpp

#include <string>
#include <utility>
#include "../cursor.hpp"

#ifndef TIFFPROBE_TIFF_FILE_HEADER
#include "../tiff_file.hpp" // for linters
#endif

namespace tiffprobe {

template <typename Reader>
    requires RawReader<Reader>
Result<TiffFile> load(const Reader& reader, const LoadOptions& options) noexcept {
    if (!reader.is_valid()) {
        return Err(Error::Code::IOError, "Source is not open");
    }

    ByteCursor<Reader> cursor(reader);

    auto header_result = read_header(cursor);
    if (header_result.is_error()) {
        return header_result.error();
    }

    const Header& header = header_result.value();
    auto directory_result = read_directory(cursor, header, options);
    if (directory_result.is_error()) {
        return directory_result.error();
    }

    return Ok(TiffFile{header, std::move(directory_result).value()});
}

inline Result<TiffFile> load(std::string_view path, const LoadOptions& options) noexcept {
    StreamFileReader reader;
    auto open_result = reader.open(path);
    if (open_result.is_error()) {
        return Err(Error::Code::IOError, open_result.error().message);
    }

    return load(reader, options);
}

} // namespace tiffprobe
