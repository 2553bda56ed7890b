#include <gtest/gtest.h>
#include <bit>
#include <cstring>
#include <vector>

#include "../tiffprobe/include/tiffprobe/directory.hpp"
#include "../tiffprobe/include/tiffprobe/readers/reader_buffer.hpp"
#include "../tiffprobe/include/tiffprobe/tiff_file.hpp"
#include "test_helpers.hpp"

using namespace tiffprobe;
using test_helpers::TiffBytes;

namespace {

constexpr uint16_t kByte = 1;
constexpr uint16_t kAscii = 2;
constexpr uint16_t kShort = 3;
constexpr uint16_t kLong = 4;
constexpr uint16_t kRational = 5;
constexpr uint16_t kSByte = 6;
constexpr uint16_t kUndefined = 7;
constexpr uint16_t kSShort = 8;
constexpr uint16_t kSLong = 9;
constexpr uint16_t kSRational = 10;
constexpr uint16_t kFloat = 11;
constexpr uint16_t kDouble = 12;

Result<TiffFile> load_bytes(const TiffBytes& bytes, ValidationPolicy policy = ValidationPolicy::Strict) {
    BufferViewReader reader(bytes.span());
    return load(reader, LoadOptions{policy});
}

} // namespace

// ============================================================================
// Directory structure
// ============================================================================

TEST(Directory, TwoEntriesInReadOrder) {
    TiffBytes bytes;
    bytes.header(8).u16(2)
         .entry(256, kShort, 1, 100)
         .entry(257, kLong, 1, 200)
         .u32(0);

    auto result = load_bytes(bytes);
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    const Directory& dir = result.value().directory;

    EXPECT_EQ(dir.entry_count, 2u);
    ASSERT_EQ(dir.entries.size(), 2u);
    EXPECT_TRUE(dir.diagnostics.empty());

    EXPECT_EQ(dir.entries[0].index, 0u);
    EXPECT_EQ(dir.entries[0].tag, TagCode::ImageWidth);
    EXPECT_EQ(dir.entries[0].declared_type, TiffDataType::Short);
    EXPECT_EQ(dir.entries[0].declared_count, 1u);
    ASSERT_TRUE(dir.entries[0].resolved_value.has_value());
    EXPECT_EQ(*dir.entries[0].resolved_value, ScalarValue{ShortValue{100}});

    EXPECT_EQ(dir.entries[1].index, 1u);
    EXPECT_EQ(dir.entries[1].tag, TagCode::ImageLength);
    ASSERT_TRUE(dir.entries[1].resolved_value.has_value());
    EXPECT_EQ(*dir.entries[1].resolved_value, ScalarValue{LongValue{200}});
}

TEST(Directory, EmptyDirectory) {
    TiffBytes bytes;
    bytes.header(8).u16(0);

    auto result = load_bytes(bytes);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().directory.entry_count, 0u);
    EXPECT_TRUE(result.value().directory.entries.empty());
}

TEST(Directory, DirectoryAfterData) {
    // Directory placed at the end of the file, after a block of unrelated bytes
    TiffBytes bytes(std::endian::big);
    bytes.header(16).u32(0xDEADBEEF).u32(0xCAFEBABE)
         .u16(1)
         .entry(259, kShort, 1, 0x00050000);

    auto result = load_bytes(bytes);
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    const Directory& dir = result.value().directory;
    ASSERT_EQ(dir.entries.size(), 1u);
    EXPECT_EQ(dir.entries[0].tag, TagCode::Compression);
    EXPECT_EQ(*dir.entries[0].resolved_value, ScalarValue{ShortValue{5}});
}

TEST(Directory, FindByTag) {
    TiffBytes bytes;
    bytes.header(8).u16(2)
         .entry(256, kShort, 1, 640)
         .entry(257, kShort, 1, 480);

    auto result = load_bytes(bytes);
    ASSERT_TRUE(result.is_ok());
    const Directory& dir = result.value().directory;

    const Entry* length = dir.find(TagCode::ImageLength);
    ASSERT_NE(length, nullptr);
    EXPECT_EQ(length->index, 1u);
    EXPECT_EQ(dir.find(TagCode::Compression), nullptr);
}

// ============================================================================
// Validation warnings
// ============================================================================

TEST(Directory, TypeMismatchIsNonFatal) {
    TiffBytes bytes;
    bytes.header(8).u16(2)
         .entry(256, kShort, 1, 64)
         .entry(259, kLong, 1, 1);

    auto result = load_bytes(bytes);
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    const Directory& dir = result.value().directory;

    ASSERT_EQ(dir.entries.size(), 2u);
    EXPECT_EQ(dir.entries[1].tag, TagCode::Compression);
    EXPECT_EQ(dir.entries[1].declared_type, TiffDataType::Long);
    ASSERT_TRUE(dir.entries[1].resolved_value.has_value());
    EXPECT_EQ(*dir.entries[1].resolved_value, ScalarValue{LongValue{1}});

    ASSERT_EQ(dir.diagnostics.size(), 1u);
    EXPECT_EQ(dir.diagnostics[0].code, Error::Code::TypeMismatch);
    EXPECT_EQ(dir.diagnostics[0].entry_index, 1u);
    EXPECT_EQ(dir.diagnostics[0].raw_tag, 259u);
    EXPECT_EQ(dir.diagnostics[0].raw_type, kLong);
}

TEST(Directory, ShortOrLongTagsAcceptBoth) {
    TiffBytes bytes;
    bytes.header(8).u16(4)
         .entry(256, kLong, 1, 70000)
         .entry(257, kShort, 1, 10)
         .entry(278, kLong, 1, 10)
         .entry(279, kShort, 1, 700);

    auto result = load_bytes(bytes);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().directory.diagnostics.empty());
    EXPECT_EQ(*result.value().directory.entries[0].resolved_value, ScalarValue{LongValue{70000}});
}

TEST(Directory, CountMismatchIsNonFatal) {
    TiffBytes bytes;
    bytes.header(8).u16(1)
         .entry_slot(274, kShort, 2, {1, 0, 1, 0});

    auto result = load_bytes(bytes);
    ASSERT_TRUE(result.is_ok());
    const Directory& dir = result.value().directory;

    ASSERT_EQ(dir.entries.size(), 1u);
    EXPECT_FALSE(dir.entries[0].resolved_value.has_value());
    ASSERT_EQ(dir.diagnostics.size(), 1u);
    EXPECT_EQ(dir.diagnostics[0].code, Error::Code::CountMismatch);
    EXPECT_EQ(dir.diagnostics[0].entry_index, 0u);
}

TEST(Directory, TypeAndCountMismatchOnSameEntry) {
    TiffBytes bytes;
    bytes.header(8).u16(1)
         .entry(262, kByte, 3, 0);

    auto result = load_bytes(bytes);
    ASSERT_TRUE(result.is_ok());
    const auto& diagnostics = result.value().directory.diagnostics;
    ASSERT_EQ(diagnostics.size(), 2u);
    EXPECT_EQ(diagnostics[0].code, Error::Code::TypeMismatch);
    EXPECT_EQ(diagnostics[1].code, Error::Code::CountMismatch);
}

TEST(Directory, VariableCountTagsAcceptAnyCount) {
    TiffBytes bytes;
    bytes.header(8).u16(1)
         .entry(258, kShort, 3, 100);

    auto result = load_bytes(bytes);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().directory.diagnostics.empty());
}

// ============================================================================
// Inline materialization
// ============================================================================

TEST(Directory, BigEndianShortIsLeftJustified) {
    TiffBytes bytes(std::endian::big);
    bytes.header(8).u16(1)
         .entry(259, kShort, 1, 0x00010000);

    auto result = load_bytes(bytes);
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    const Entry& entry = result.value().directory.entries.at(0);

    EXPECT_EQ(entry.raw_field, 0x00010000u);
    ASSERT_TRUE(entry.resolved_value.has_value());
    EXPECT_EQ(*entry.resolved_value, ScalarValue{ShortValue{1}});
}

TEST(Directory, LittleEndianShortIsLeftJustified) {
    TiffBytes bytes;
    bytes.header(8).u16(1)
         .entry_slot(259, kShort, 1, {0x01, 0x00, 0xFF, 0xFF});

    auto result = load_bytes(bytes);
    ASSERT_TRUE(result.is_ok());
    const Entry& entry = result.value().directory.entries.at(0);

    EXPECT_EQ(entry.raw_field, 0xFFFF0001u);
    EXPECT_EQ(*entry.resolved_value, ScalarValue{ShortValue{1}});
}

TEST(Directory, BigEndianByteIsFirstByteOfSlot) {
    TiffBytes bytes(std::endian::big);
    bytes.header(8).u16(1)
         .entry_slot(33423, kByte, 1, {0x07, 0x00, 0x00, 0x00});

    auto result = load_bytes(bytes);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(*result.value().directory.entries.at(0).resolved_value, ScalarValue{ByteValue{7}});
}

TEST(Directory, SignedAndFloatScalars) {
    for (std::endian endian : {std::endian::little, std::endian::big}) {
        TiffBytes bytes(endian);
        // SShort -2 left-justified: the stream order u16 followed by two pad bytes
        bytes.header(8).u16(2);
        bytes.u16(33423).u16(kSShort).u32(1).u16(0xFFFE).u16(0);
        bytes.entry(33423, kFloat, 1, std::bit_cast<uint32_t>(1.5f));

        auto result = load_bytes(bytes);
        ASSERT_TRUE(result.is_ok());
        const auto& entries = result.value().directory.entries;
        ASSERT_EQ(entries.size(), 2u);
        EXPECT_EQ(*entries[0].resolved_value, ScalarValue{SShortValue{-2}});
        EXPECT_EQ(*entries[1].resolved_value, ScalarValue{FloatValue{1.5f}});
    }
}

TEST(Directory, SByteScalar) {
    for (std::endian endian : {std::endian::little, std::endian::big}) {
        TiffBytes bytes(endian);
        bytes.header(8).u16(1)
             .entry_slot(33423, kSByte, 1, {0xFB, 0x00, 0x00, 0x00});

        auto result = load_bytes(bytes);
        ASSERT_TRUE(result.is_ok());
        const Entry& entry = result.value().directory.entries.at(0);
        ASSERT_TRUE(entry.resolved_value.has_value());
        EXPECT_EQ(*entry.resolved_value, ScalarValue{SByteValue{-5}});
    }
}

TEST(Directory, SLongScalar) {
    for (std::endian endian : {std::endian::little, std::endian::big}) {
        TiffBytes bytes(endian);
        bytes.header(8).u16(1)
             .entry(33423, kSLong, 1, static_cast<uint32_t>(-70000));

        auto result = load_bytes(bytes);
        ASSERT_TRUE(result.is_ok());
        const Entry& entry = result.value().directory.entries.at(0);
        EXPECT_EQ(entry.raw_field, static_cast<uint32_t>(-70000));
        ASSERT_TRUE(entry.resolved_value.has_value());
        EXPECT_EQ(*entry.resolved_value, ScalarValue{SLongValue{-70000}});
    }
}

TEST(Directory, SingleDoubleIsNotResolved) {
    TiffBytes bytes;
    bytes.header(8).u16(1)
         .entry(33423, kDouble, 1, 26)
         .u32(0)
         .f64(2.5);

    auto result = load_bytes(bytes);
    ASSERT_TRUE(result.is_ok());
    const Entry& entry = result.value().directory.entries.at(0);
    EXPECT_FALSE(entry.resolved_value.has_value());
    EXPECT_FALSE(entry.is_inline());
    EXPECT_EQ(entry.raw_field, 26u);
}

TEST(Directory, SingleUndefinedIsNotResolved) {
    TiffBytes bytes(std::endian::big);
    bytes.header(8).u16(1)
         .entry_slot(33423, kUndefined, 1, {0x2A, 0x00, 0x00, 0x00});

    auto result = load_bytes(bytes);
    ASSERT_TRUE(result.is_ok());
    const Entry& entry = result.value().directory.entries.at(0);
    EXPECT_TRUE(entry.is_inline());
    EXPECT_FALSE(entry.resolved_value.has_value());
    EXPECT_EQ(entry.raw_field, 0x2A000000u);
}

TEST(Directory, SingleSRationalIsNotResolved) {
    TiffBytes bytes;
    bytes.header(8).u16(1)
         .entry(33423, kSRational, 1, 26)
         .u32(0)
         .u32(static_cast<uint32_t>(-1)).u32(3);

    auto result = load_bytes(bytes);
    ASSERT_TRUE(result.is_ok());
    const Entry& entry = result.value().directory.entries.at(0);
    EXPECT_FALSE(entry.resolved_value.has_value());
    EXPECT_FALSE(entry.is_inline());
}

TEST(Directory, OffsetOnlyTypesAreNotResolved) {
    TiffBytes bytes;
    bytes.header(8).u16(3)
         .entry(282, kRational, 1, 50)
         .entry(305, kAscii, 4, 0x00636261)
         .entry(258, kShort, 2, 0x00080008)
         .u32(0)
         .u32(72).u32(1);

    auto result = load_bytes(bytes);
    ASSERT_TRUE(result.is_ok());
    const auto& entries = result.value().directory.entries;
    ASSERT_EQ(entries.size(), 3u);

    EXPECT_FALSE(entries[0].resolved_value.has_value());
    EXPECT_EQ(entries[0].raw_field, 50u);
    EXPECT_FALSE(entries[0].is_inline());

    EXPECT_FALSE(entries[1].resolved_value.has_value());
    EXPECT_TRUE(entries[1].is_inline());

    EXPECT_FALSE(entries[2].resolved_value.has_value());
    EXPECT_TRUE(entries[2].is_inline());
}

TEST(Directory, DecodeEntryFromRawRecord) {
    RawEntry<std::endian::big> raw;
    const std::array<uint8_t, 12> record = {0x01, 0x00, 0x00, 0x03, 0x00, 0x00, 0x00, 0x01, 0x02, 0x00, 0x00, 0x00};
    std::memcpy(&raw, record.data(), sizeof(raw));

    std::vector<Diagnostic> diagnostics;
    auto result = decode_entry<std::endian::big>(raw, 5, diagnostics);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().index, 5u);
    EXPECT_EQ(result.value().tag, TagCode::ImageWidth);
    EXPECT_EQ(result.value().raw_field, 0x02000000u);
    EXPECT_EQ(*result.value().resolved_value, ScalarValue{ShortValue{512}});
    EXPECT_TRUE(diagnostics.empty());
}

// ============================================================================
// Unknown codes and policy
// ============================================================================

TEST(Directory, UnknownTagAbortsInStrictMode) {
    TiffBytes bytes;
    bytes.header(8).u16(2)
         .entry(256, kShort, 1, 64)
         .entry(50000, kShort, 1, 1);

    auto result = load_bytes(bytes);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, Error::Code::UnknownTag);
    EXPECT_EQ(result.error().raw_value, 50000u);
}

TEST(Directory, UnknownTypeAbortsInStrictMode) {
    TiffBytes bytes;
    bytes.header(8).u16(1)
         .entry(256, 13, 1, 64);

    auto result = load_bytes(bytes);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, Error::Code::UnknownTagType);
    EXPECT_EQ(result.error().raw_value, 13u);
}

TEST(Directory, UnknownTagIsCheckedBeforeType) {
    TiffBytes bytes;
    bytes.header(8).u16(1)
         .entry(50000, 0, 1, 0);

    auto result = load_bytes(bytes);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, Error::Code::UnknownTag);
}

TEST(Directory, LenientModeSkipsUnknownEntries) {
    TiffBytes bytes;
    bytes.header(8).u16(4)
         .entry(256, kShort, 1, 64)
         .entry(50000, kShort, 1, 1)
         .entry(259, 0, 1, 1)
         .entry(257, kShort, 1, 32);

    auto result = load_bytes(bytes, ValidationPolicy::Lenient);
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    const Directory& dir = result.value().directory;

    EXPECT_EQ(dir.entry_count, 4u);
    ASSERT_EQ(dir.entries.size(), 2u);
    EXPECT_EQ(dir.entries[0].index, 0u);
    EXPECT_EQ(dir.entries[1].index, 3u);
    EXPECT_EQ(dir.entries[1].tag, TagCode::ImageLength);

    ASSERT_EQ(dir.diagnostics.size(), 2u);
    EXPECT_EQ(dir.diagnostics[0].code, Error::Code::UnknownTag);
    EXPECT_EQ(dir.diagnostics[0].entry_index, 1u);
    EXPECT_EQ(dir.diagnostics[0].raw_tag, 50000u);
    EXPECT_EQ(dir.diagnostics[1].code, Error::Code::UnknownTagType);
    EXPECT_EQ(dir.diagnostics[1].entry_index, 2u);
    EXPECT_EQ(dir.diagnostics[1].raw_type, 0u);
}

// ============================================================================
// Truncation and bad offsets
// ============================================================================

TEST(Directory, TruncatedEntryFailsInBothModes) {
    TiffBytes bytes;
    bytes.header(8).u16(2)
         .entry(256, kShort, 1, 64)
         .entry(257, kShort, 1, 64);
    bytes.truncate(bytes.size() - 5);

    for (auto policy : {ValidationPolicy::Strict, ValidationPolicy::Lenient}) {
        auto result = load_bytes(bytes, policy);
        ASSERT_TRUE(result.is_error());
        EXPECT_EQ(result.error().code, Error::Code::IOError);
    }
}

TEST(Directory, TruncatedEntryCountFails) {
    TiffBytes bytes;
    bytes.header(8).u8(1);

    auto result = load_bytes(bytes);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, Error::Code::IOError);
}

TEST(Directory, OffsetPastEndOfFileFails) {
    TiffBytes bytes;
    bytes.header(1000).u16(0);

    auto result = load_bytes(bytes);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, Error::Code::IOError);
}

TEST(Directory, OffsetAtEndOfFileFails) {
    TiffBytes bytes;
    bytes.header(8);

    auto result = load_bytes(bytes);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, Error::Code::IOError);
}
