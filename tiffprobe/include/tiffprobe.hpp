#pragma once

// Umbrella header: everything needed to decode a TIFF header and its first directory

#include "tiffprobe/types/result.hpp"
#include "tiffprobe/types/tag_codes.hpp"
#include "tiffprobe/types.hpp"
#include "tiffprobe/registry.hpp"
#include "tiffprobe/value.hpp"
#include "tiffprobe/reader_base.hpp"
#include "tiffprobe/readers/reader_buffer.hpp"
#include "tiffprobe/readers/reader_stream.hpp"
#include "tiffprobe/cursor.hpp"
#include "tiffprobe/header.hpp"
#include "tiffprobe/directory.hpp"
#include "tiffprobe/tiff_file.hpp"
#include "tiffprobe/values.hpp"
