#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace tiffprobe_bench {

/// Endianness for TIFF files
enum class Endianness { Little, Big };

/// Synthetic file configuration
struct FileConfig {
    uint32_t width = 64;
    uint32_t height = 64;
    std::size_t text_tags = 0;  ///< Number of out-of-line ASCII tags (0..8)
    Endianness endianness = Endianness::Little;

    std::string name() const;
};

/// Build a valid single-strip, 8-bit grayscale Classic TIFF in memory.
/// Entries are sorted by tag code so that libtiff reads the file without warnings.
std::vector<std::byte> make_classic_tiff(const FileConfig& config);

/// Number of directory entries make_classic_tiff() writes for a configuration
std::size_t entry_count(const FileConfig& config);

/// Manages temporary files for benchmarks
class TempFileManager {
public:
    TempFileManager();
    ~TempFileManager();

    /// Get path for a temporary TIFF file
    std::filesystem::path get_temp_path(const std::string& name);

    /// Write bytes to a new temporary file
    std::filesystem::path write_temp_file(const std::string& name, std::span<const std::byte> data);

    /// Clean up all temporary files
    void cleanup_all();

private:
    std::filesystem::path temp_dir_;
    std::vector<std::filesystem::path> temp_files_;
};

} // namespace tiffprobe_bench
