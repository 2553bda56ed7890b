// Print the header and first directory of a TIFF file
//
// Usage: tiffinfo <file> [--lenient] [--values]

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "../tiffprobe/include/tiffprobe.hpp"

using namespace tiffprobe;

namespace {

constexpr std::size_t max_printed_values = 16;

std::string format_value(const ScalarValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        std::ostringstream out;
        if constexpr (std::is_same_v<T, AsciiValue>) {
            out << '"' << v.value << '"';
        } else if constexpr (std::is_same_v<T, RationalValue> || std::is_same_v<T, SRationalValue>) {
            out << v.value.numerator << "/" << v.value.denominator;
        } else if constexpr (sizeof(v.value) == 1) {
            // Avoid printing 8-bit values as characters
            out << static_cast<int>(v.value);
        } else {
            out << v.value;
        }
        return out.str();
    }, value);
}

// "1 (None)" for an enumerated value of Compression, SampleFormat, ...
std::string format_tag_value(TagCode tag, const ScalarValue& value) {
    std::string text = format_value(value);
    std::optional<std::string_view> label;
    if (const auto* s = std::get_if<ShortValue>(&value)) {
        label = registry::value_name(tag, s->value);
    } else if (const auto* l = std::get_if<LongValue>(&value)) {
        label = registry::value_name(tag, l->value);
    }
    if (label) {
        text += " (";
        text += *label;
        text += ")";
    }
    return text;
}

std::string format_values(TagCode tag, const std::vector<ScalarValue>& values) {
    if (values.size() == 1) {
        return format_tag_value(tag, values[0]);
    }
    std::string text;
    for (std::size_t i = 0; i < values.size() && i < max_printed_values; ++i) {
        if (i > 0) {
            text += ", ";
        }
        text += format_value(values[i]);
    }
    if (values.size() > max_printed_values) {
        text += ", ... (" + std::to_string(values.size()) + " values)";
    }
    return text;
}

void print_header(const Header& header) {
    std::cout << "byte_order: " << (header.byte_order == ByteOrder::BigEndian ? "MM (big-endian)" : "II (little-endian)") << "\n";
    std::cout << "magic:      " << tiff_magic_number << "\n";
    std::cout << "ifd_offset: " << header.directory_offset << "\n";
}

void print_usage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " <file> [--lenient] [--values]\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --lenient  : Skip entries with unknown tag or type codes instead of failing\n";
    std::cout << "  --values   : Read and print all values of every entry\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string path;
    LoadOptions options;
    bool print_all_values = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--lenient") {
            options.policy = ValidationPolicy::Lenient;
        } else if (arg == "--values") {
            print_all_values = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (path.empty()) {
            path = arg;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    // Keep the reader open for --values
    StreamFileReader reader;
    auto open_result = reader.open(path);
    if (open_result.is_error()) {
        std::cerr << "IOError: " << open_result.error().message << "\n";
        return 1;
    }

    auto result = load(reader, options);
    if (result.is_error()) {
        const Error& error = result.error();
        std::cerr << error_code_name(error.code) << ": " << error.message << "\n";
        return 1;
    }

    const TiffFile& file = result.value();
    std::cout << "Read tiff " << path << "\n";
    print_header(file.header);
    std::cout << "entries:    " << file.directory.entry_count << "\n";

    for (const auto& entry : file.directory.entries) {
        std::cout << "IFD[" << entry.index << "] "
                  << registry::tag_name(entry.tag) << " "
                  << registry::type_name(entry.declared_type) << " "
                  << entry.declared_count << " "
                  << "0x" << std::hex << std::setw(8) << std::setfill('0') << entry.raw_field
                  << std::dec << std::setfill(' ');

        if (print_all_values) {
            auto values = read_entry_values(reader, file.header.byte_order, entry);
            if (values) {
                std::cout << " = " << format_values(entry.tag, values.value());
            } else {
                std::cout << " (" << error_code_name(values.error().code) << ": " << values.error().message << ")";
            }
        } else if (entry.resolved_value) {
            std::cout << " = " << format_tag_value(entry.tag, *entry.resolved_value);
        }
        std::cout << "\n";
    }

    if (!file.directory.diagnostics.empty()) {
        std::cout << "diagnostics:\n";
        for (const auto& diagnostic : file.directory.diagnostics) {
            std::cout << "  " << error_code_name(diagnostic.code) << ": " << diagnostic.message << "\n";
        }
    }

    return 0;
}
