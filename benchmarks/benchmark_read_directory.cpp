// Standalone benchmark decoding the header and first directory of every TIFF
// file in a directory, with tiffprobe or (when available) libtiff

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <numeric>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "../tiffprobe/include/tiffprobe/tiff_file.hpp"
#include "../tiffprobe/include/tiffprobe/types/result.hpp"

#ifdef HAVE_LIBTIFF
#include <tiffio.h>
#endif

namespace fs = std::filesystem;
using namespace tiffprobe;

namespace {

enum class Backend { TiffProbe, LibTIFF };

struct Options {
    fs::path directory;
    Backend backend = Backend::TiffProbe;
    LoadOptions load_options;
};

/// Outcome of decoding one file
struct FileOutcome {
    bool ok = false;
    /// Entries kept in the directory; libtiff does not expose this
    std::optional<std::size_t> entries;
    /// Diagnostics recorded under the lenient policy
    std::size_t diagnostics = 0;
};

// ============================================================================
// Per-file timings
// ============================================================================

class Timings {
public:
    void record(double ms, const FileOutcome& outcome) {
        samples_ms_.push_back(ms);
        if (outcome.entries) {
            entries_ += *outcome.entries;
            counted_ = true;
        }
        diagnostics_ += outcome.diagnostics;
    }

    [[nodiscard]] std::size_t count() const noexcept { return samples_ms_.size(); }

    [[nodiscard]] double total() const {
        return std::accumulate(samples_ms_.begin(), samples_ms_.end(), 0.0);
    }

    [[nodiscard]] double mean() const {
        return samples_ms_.empty() ? 0.0 : total() / static_cast<double>(samples_ms_.size());
    }

    [[nodiscard]] double median() const {
        if (samples_ms_.empty()) return 0.0;
        std::vector<double> sorted = samples_ms_;
        std::sort(sorted.begin(), sorted.end());
        const std::size_t mid = sorted.size() / 2;
        return sorted.size() % 2 == 0 ? (sorted[mid - 1] + sorted[mid]) / 2.0 : sorted[mid];
    }

    [[nodiscard]] double stddev() const {
        if (samples_ms_.size() < 2) return 0.0;
        const double m = mean();
        double sum_sq = 0.0;
        for (double t : samples_ms_) {
            sum_sq += (t - m) * (t - m);
        }
        return std::sqrt(sum_sq / static_cast<double>(samples_ms_.size() - 1));
    }

    void report(const char* backend_name) const {
        std::cout << "\n=== " << backend_name << " ===\n";
        std::cout << "Files decoded:   " << count() << "\n";
        if (counted_) {
            std::cout << "Entries kept:    " << entries_ << "\n";
            std::cout << "Diagnostics:     " << diagnostics_ << "\n";
        }
        std::cout << "Total time:      " << total() << " ms\n";
        std::cout << "Mean per file:   " << mean() << " ms\n";
        std::cout << "Median per file: " << median() << " ms\n";
        std::cout << "Stddev:          " << stddev() << " ms\n";
    }

private:
    std::vector<double> samples_ms_;
    std::size_t entries_ = 0;
    std::size_t diagnostics_ = 0;
    bool counted_ = false;
};

// ============================================================================
// Backends
// ============================================================================

FileOutcome decode_with_tiffprobe(const fs::path& path, const LoadOptions& options) {
    auto result = load(path.string(), options);
    if (!result) {
        std::cerr << "\n  " << error_code_name(result.error().code) << ": " << result.error().message;
        return {};
    }
    const Directory& directory = result.value().directory;
    return FileOutcome{true, directory.entries.size(), directory.diagnostics.size()};
}

#ifdef HAVE_LIBTIFF
// TIFFOpen reads the header and the first directory
FileOutcome decode_with_libtiff(const fs::path& path) {
    TIFF* tif = TIFFOpen(path.string().c_str(), "r");
    if (!tif) {
        return {};
    }
    TIFFClose(tif);
    return FileOutcome{true, std::nullopt, 0};
}
#endif

FileOutcome decode(const fs::path& path, const Options& options) {
#ifdef HAVE_LIBTIFF
    if (options.backend == Backend::LibTIFF) {
        return decode_with_libtiff(path);
    }
#endif
    return decode_with_tiffprobe(path, options.load_options);
}

// ============================================================================
// Command line
// ============================================================================

void print_usage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " <directory> <tiffprobe|libtiff> [--lenient]\n";
    std::cout << "  Times header and first-directory decoding for every .tif/.tiff file.\n";
    std::cout << "  --lenient  skip entries with unknown tag or type codes (tiffprobe only)\n";
}

std::optional<Options> parse_arguments(int argc, char** argv) {
    if (argc < 3 || argc > 4) {
        return std::nullopt;
    }

    Options options;
    options.directory = argv[1];

    const std::string backend = argv[2];
    if (backend == "libtiff") {
#ifdef HAVE_LIBTIFF
        options.backend = Backend::LibTIFF;
#else
        std::cerr << "This build has no libtiff support\n";
        return std::nullopt;
#endif
    } else if (backend != "tiffprobe") {
        std::cerr << "Unknown backend: " << backend << "\n";
        return std::nullopt;
    }

    if (argc == 4) {
        if (std::string(argv[3]) != "--lenient") {
            return std::nullopt;
        }
        options.load_options.policy = ValidationPolicy::Lenient;
    }
    return options;
}

std::vector<fs::path> collect_tiff_files(const fs::path& directory) {
    std::vector<fs::path> files;
    for (const auto& item : fs::directory_iterator(directory)) {
        if (!item.is_regular_file()) continue;
        std::string ext = item.path().extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (ext == ".tif" || ext == ".tiff") {
            files.push_back(item.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace

int main(int argc, char** argv) {
    auto options = parse_arguments(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return 1;
    }

    std::error_code ec;
    if (!fs::is_directory(options->directory, ec)) {
        std::cerr << "Not a directory: " << options->directory.string() << "\n";
        return 1;
    }

    const std::vector<fs::path> files = collect_tiff_files(options->directory);
    if (files.empty()) {
        std::cerr << "No TIFF files found in: " << options->directory.string() << "\n";
        return 1;
    }
    std::cout << "Decoding " << files.size() << " files\n";

    Timings timings;
    std::size_t failures = 0;
    for (const auto& path : files) {
        std::cout << path.filename().string() << ": " << std::flush;

        const auto start = std::chrono::steady_clock::now();
        const FileOutcome outcome = decode(path, *options);
        const auto end = std::chrono::steady_clock::now();
        const double elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();

        if (outcome.ok) {
            timings.record(elapsed_ms, outcome);
            std::cout << elapsed_ms << " ms\n";
        } else {
            ++failures;
            std::cout << "\n  failed\n";
        }
    }

    std::cout << "\nDecoded " << timings.count() << "/" << files.size() << ", failed " << failures << "\n";
    if (timings.count() > 0) {
        timings.report(options->backend == Backend::LibTIFF ? "libtiff" : "tiffprobe");
    }
    return failures > 0 ? 1 : 0;
}
