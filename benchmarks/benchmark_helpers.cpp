#include "benchmark_helpers.hpp"
#include "../tests/test_helpers.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <fstream>
#include <string_view>
#include <utility>

namespace tiffprobe_bench {

namespace {

struct EntrySpec {
    uint16_t tag;
    uint16_t type;
    uint32_t count;
    uint32_t value;        ///< Inline value (already left-justified by the writer) or offset
    bool inline_short;     ///< Value is a single SHORT to left-justify
};

constexpr std::array<std::pair<uint16_t, std::string_view>, 8> text_tag_table = {{
    {270, "Synthetic benchmark image"},
    {271, "tiffprobe"},
    {272, "Benchmark model"},
    {305, "tiffprobe benchmark generator"},
    {306, "2024:01:01 00:00:00"},
    {315, "Benchmark author"},
    {316, "localhost"},
    {33432, "Public domain"},
}};

} // namespace

std::string FileConfig::name() const {
    return std::to_string(width) + "x" + std::to_string(height) + "_text" + std::to_string(text_tags) +
           (endianness == Endianness::Big ? "_BE" : "_LE");
}

std::size_t entry_count(const FileConfig& config) {
    return 9 + std::min(config.text_tags, text_tag_table.size());
}

std::vector<std::byte> make_classic_tiff(const FileConfig& config) {
    test_helpers::TiffBytes writer(config.endianness == Endianness::Big ? std::endian::big : std::endian::little);
    const uint32_t strip_size = config.width * config.height;
    const std::size_t text_tags = std::min(config.text_tags, text_tag_table.size());

    // Directory offset patched once the directory position is known
    writer.header(0);

    // Pixel data: a horizontal gradient
    const uint32_t strip_offset = static_cast<uint32_t>(writer.size());
    std::vector<std::byte> pixels(strip_size);
    for (uint32_t y = 0; y < config.height; ++y) {
        for (uint32_t x = 0; x < config.width; ++x) {
            pixels[static_cast<std::size_t>(y) * config.width + x] = static_cast<std::byte>(x & 0xFF);
        }
    }
    writer.append(pixels);

    std::vector<EntrySpec> entries = {
        {256, 4, 1, config.width, false},
        {257, 4, 1, config.height, false},
        {258, 3, 1, 8, true},
        {259, 3, 1, 1, true},
        {262, 3, 1, 1, true},
        {273, 4, 1, strip_offset, false},
        {277, 3, 1, 1, true},
        {278, 4, 1, config.height, false},
        {279, 4, 1, strip_size, false},
    };

    for (std::size_t i = 0; i < text_tags; ++i) {
        const auto& [tag, text] = text_tag_table[i];
        writer.pad_to_word();
        const uint32_t offset = static_cast<uint32_t>(writer.size());
        writer.text(text).u8(0);
        entries.push_back({tag, 2, static_cast<uint32_t>(text.size() + 1), offset, false});
    }

    std::sort(entries.begin(), entries.end(),
              [](const EntrySpec& a, const EntrySpec& b) { return a.tag < b.tag; });

    writer.pad_to_word();
    const uint32_t directory_offset = static_cast<uint32_t>(writer.size());
    writer.u16(static_cast<uint16_t>(entries.size()));
    for (const auto& entry : entries) {
        if (entry.inline_short) {
            writer.u16(entry.tag).u16(entry.type).u32(entry.count).u16(static_cast<uint16_t>(entry.value)).u16(0);
        } else {
            writer.entry(entry.tag, entry.type, entry.count, entry.value);
        }
    }
    writer.u32(0);
    writer.patch_u32(4, directory_offset);

    return writer.take();
}

// ============================================================================
// TempFileManager
// ============================================================================

TempFileManager::TempFileManager() {
    temp_dir_ = std::filesystem::temp_directory_path() / "tiffprobe_benchmarks";
    std::filesystem::create_directories(temp_dir_);
}

TempFileManager::~TempFileManager() {
    cleanup_all();
}

std::filesystem::path TempFileManager::get_temp_path(const std::string& name) {
    auto path = temp_dir_ / (name + ".tif");
    temp_files_.push_back(path);
    return path;
}

std::filesystem::path TempFileManager::write_temp_file(const std::string& name, std::span<const std::byte> data) {
    auto path = get_temp_path(name);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return path;
}

void TempFileManager::cleanup_all() {
    for (const auto& path : temp_files_) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
    temp_files_.clear();

    std::error_code ec;
    std::filesystem::remove(temp_dir_, ec);
}

} // namespace tiffprobe_bench
