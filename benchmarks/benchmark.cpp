#include <benchmark/benchmark.h>
#include <filesystem>
#include <vector>

#include "benchmark_helpers.hpp"

#include "../tiffprobe/include/tiffprobe/readers/reader_buffer.hpp"
#include "../tiffprobe/include/tiffprobe/readers/reader_stream.hpp"
#include "../tiffprobe/include/tiffprobe/tiff_file.hpp"
#include "../tiffprobe/include/tiffprobe/values.hpp"
#ifdef HAVE_LIBTIFF
#include <tiffio.h>
#endif

namespace fs = std::filesystem;

using namespace tiffprobe;
using namespace tiffprobe_bench;

// ============================================================================
// Header and directory decoding - in memory
// ============================================================================

static void BM_Load_Buffer(benchmark::State& state) {
    // Parameters: text tags, endianness
    FileConfig config;
    config.text_tags = static_cast<std::size_t>(state.range(0));
    config.endianness = static_cast<Endianness>(state.range(1));
    auto bytes = make_classic_tiff(config);
    BufferViewReader reader(bytes);

    for (auto _ : state) {
        auto result = load(reader);
        if (!result) {
            state.SkipWithError(("Failed to load " + result.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(result.value().directory.entries.data());
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(entry_count(config)));
}

static void BM_Load_Buffer_Lenient(benchmark::State& state) {
    FileConfig config;
    config.text_tags = static_cast<std::size_t>(state.range(0));
    config.endianness = static_cast<Endianness>(state.range(1));
    auto bytes = make_classic_tiff(config);
    BufferViewReader reader(bytes);
    const LoadOptions options{ValidationPolicy::Lenient};

    for (auto _ : state) {
        auto result = load(reader, options);
        if (!result) {
            state.SkipWithError(("Failed to load " + result.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(result.value().directory.entries.data());
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(entry_count(config)));
}

// ============================================================================
// Header and directory decoding - from file
// ============================================================================

static void BM_Load_File(benchmark::State& state) {
    FileConfig config;
    config.text_tags = static_cast<std::size_t>(state.range(0));
    config.endianness = static_cast<Endianness>(state.range(1));

    TempFileManager temp_mgr;
    auto filepath = temp_mgr.write_temp_file("load_file_" + config.name(), make_classic_tiff(config));

    for (auto _ : state) {
        auto result = load(filepath.string());
        if (!result) {
            state.SkipWithError(("Failed to load " + result.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(result.value().header.directory_offset);
    }

    state.SetItemsProcessed(state.iterations());
}

#ifdef HAVE_LIBTIFF
static void BM_LibTIFF_ReadDirectory(benchmark::State& state) {
    FileConfig config;
    config.text_tags = static_cast<std::size_t>(state.range(0));
    config.endianness = static_cast<Endianness>(state.range(1));

    TempFileManager temp_mgr;
    auto filepath = temp_mgr.write_temp_file("libtiff_read_directory_" + config.name(), make_classic_tiff(config));

    for (auto _ : state) {
        TIFF* tif = TIFFOpen(filepath.string().c_str(), "r");
        if (!tif) {
            state.SkipWithError("Failed to open TIFF file");
            return;
        }

        uint32_t w, h;
        uint16_t comp;
        TIFFGetField(tif, TIFFTAG_IMAGEWIDTH, &w);
        TIFFGetField(tif, TIFFTAG_IMAGELENGTH, &h);
        TIFFGetField(tif, TIFFTAG_COMPRESSION, &comp);

        benchmark::DoNotOptimize(w);
        benchmark::DoNotOptimize(h);

        TIFFClose(tif);
    }

    state.SetItemsProcessed(state.iterations());
}
#endif // HAVE_LIBTIFF

// ============================================================================
// Value materialization
// ============================================================================

static void BM_ReadEntryValues(benchmark::State& state) {
    FileConfig config;
    config.text_tags = 8;
    config.endianness = static_cast<Endianness>(state.range(0));
    auto bytes = make_classic_tiff(config);
    BufferViewReader reader(bytes);

    auto loaded = load(reader);
    if (!loaded) {
        state.SkipWithError(("Failed to load " + loaded.error().message).c_str());
        return;
    }
    const TiffFile& file = loaded.value();

    for (auto _ : state) {
        for (const auto& entry : file.directory.entries) {
            auto values = read_entry_values(reader, file.header.byte_order, entry);
            if (!values) {
                state.SkipWithError(("Failed to read values " + values.error().message).c_str());
                return;
            }
            benchmark::DoNotOptimize(values.value().data());
        }
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(file.directory.entries.size()));
}

// Params: text tags, endianness (0 = little, 1 = big)
BENCHMARK(BM_Load_Buffer)
    ->Args({0, 0})
    ->Args({0, 1})
    ->Args({8, 0})
    ->Args({8, 1})
    ->Name("TiffProbe/Load/Buffer")
    ->Unit(benchmark::kNanosecond);

BENCHMARK(BM_Load_Buffer_Lenient)
    ->Args({8, 0})
    ->Args({8, 1})
    ->Name("TiffProbe/Load/BufferLenient")
    ->Unit(benchmark::kNanosecond);

BENCHMARK(BM_Load_File)
    ->Args({0, 0})
    ->Args({8, 1})
    ->Name("TiffProbe/Load/File")
    ->Unit(benchmark::kMicrosecond);

#ifdef HAVE_LIBTIFF
BENCHMARK(BM_LibTIFF_ReadDirectory)
    ->Args({0, 0})
    ->Args({8, 1})
    ->Name("LibTIFF/Load/File")
    ->Unit(benchmark::kMicrosecond);
#endif // HAVE_LIBTIFF

BENCHMARK(BM_ReadEntryValues)
    ->Arg(0)
    ->Arg(1)
    ->Name("TiffProbe/Values/AllEntries")
    ->Unit(benchmark::kNanosecond);

BENCHMARK_MAIN();
