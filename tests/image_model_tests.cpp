/**
 * @file image_model_tests.cpp
 * @brief Word addressed image operations: input dispatch, binary and text
 * renderings, editing, header codecs and merging
 */

#include "errors.hpp"
#include "image_model.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace hexmill;

namespace {
std::string text(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}
} // namespace

// ============================================================================
// Construction and queries
// ============================================================================

TEST(ImageModelTests, WordSizeMustBeWholeBytes) {
    try {
        ImageModel image(7);
        FAIL() << "Expected RangeError";
    } catch (const RangeError& e) {
        EXPECT_STREQ(e.what(), "word size must be a multiple of 8 bits, but got 7 bits");
    }

    EXPECT_THROW(ImageModel(0), RangeError);
    EXPECT_NO_THROW(ImageModel(24));
}

TEST(ImageModelTests, AddressesAreInWords) {
    auto image = imageWith({{0x10, fromHex("01020304")}, {0x20, fromHex("0506")}}, 16);

    EXPECT_EQ(image.word_size_bytes(), 2u);
    EXPECT_EQ(image.segments()[0].minimum_address(), 0x20u);
    EXPECT_EQ(image.minimum_address(), 0x10u);
    EXPECT_EQ(image.maximum_address(), 0x21u);
    EXPECT_EQ(image.size(), 3u);
}

TEST(ImageModelTests, EmptyImageBounds) {
    ImageModel image;

    EXPECT_TRUE(image.empty());
    EXPECT_EQ(image.size(), 0u);
    EXPECT_THROW(image.minimum_address(), EmptyStoreError);
    EXPECT_THROW(image.maximum_address(), EmptyStoreError);
}

// ============================================================================
// Input
// ============================================================================

TEST(ImageModelTests, AddDetectsFormat) {
    ImageModel srec;
    srec.add(Samples::SREC_16);
    EXPECT_EQ(srec.execution_start_address(), 0x1234u);
    EXPECT_EQ(srec.segments().size(), 2u);

    ImageModel ihex;
    ihex.add(Samples::IHEX_32);
    EXPECT_EQ(ihex.maximum_address(), 0x12344u);

    ImageModel tiTxt;
    tiTxt.add(std::string_view("@0100\n01 02\nq\n"));
    EXPECT_EQ(tiTxt.minimum_address(), 0x100u);

    ImageModel vmem;
    vmem.add(std::string_view("@10 01 02\n"));
    EXPECT_EQ(vmem.minimum_address(), 0x10u);
}

TEST(ImageModelTests, DetectFormat) {
    EXPECT_TRUE(std::holds_alternative<format::Srec>(format::detect_format(Samples::SREC_16)));
    EXPECT_TRUE(std::holds_alternative<format::Ihex>(format::detect_format(Samples::IHEX_32)));
    EXPECT_TRUE(std::holds_alternative<format::TiTxt>(format::detect_format("\n@0100\n01\nq\n\n")));
    EXPECT_TRUE(std::holds_alternative<format::VerilogVmem>(format::detect_format("// x\n0102 0304\n")));
    EXPECT_TRUE(std::holds_alternative<format::Elf>(
        format::detect_format(std::vector<uint8_t>{0x7f, 'E', 'L', 'F', 1, 1})));

    EXPECT_THROW(format::detect_format("hello world"), UnsupportedFileFormatError);
    EXPECT_THROW(format::detect_format(" \n\n"), UnsupportedFileFormatError);
}

TEST(ImageModelTests, FormatNames) {
    EXPECT_EQ(format::name(format::Input{format::Srec{}}), "srec");
    EXPECT_EQ(format::name(format::Input{format::Elf{}}), "elf");
    EXPECT_EQ(format::name(format::Output{format::VerilogVmem{}}), "verilog_vmem");
    EXPECT_EQ(format::name(format::Output{format::Array{}}), "array");
}

TEST(ImageModelTests, AddWithExplicitFormat) {
    ImageModel image(16);
    const auto data = fromHex("0102");

    image.add(format::Binary{4}, data);

    EXPECT_EQ(image.minimum_address(), 4u);
    EXPECT_EQ(image.segments()[0].minimum_address(), 8u);
}

TEST(ImageModelTests, AddBinaryOverlapNeedsOverwrite) {
    auto image = imageWith({{0, toBytes("abcd")}});

    EXPECT_THROW(image.add_binary(toBytes("xy"), 2), AddDataError);

    image.add_binary(toBytes("xy"), 2, true);
    expectBytes(image.as_binary(), toBytes("abxy"));
}

// ============================================================================
// Binary and array output
// ============================================================================

TEST(ImageModelTests, ExcludeThenBinaryWithPadding) {
    auto image = imageWith({{10, toBytes("1234")}});

    image.exclude(11, 13);

    expectBytes(image.as_binary(std::nullopt, std::nullopt, std::vector<uint8_t>{0x00}),
                fromHex("31000034"));
}

TEST(ImageModelTests, BinaryWindow) {
    auto image = imageWith({{2, toBytes("abcd")}, {8, toBytes("ef")}});

    expectBytes(image.as_binary(), toBytes("abcd\xff\xff" "ef"));
    expectBytes(image.as_binary(0), toBytes("\xff\xff" "abcd\xff\xff" "ef"));
    expectBytes(image.as_binary(3, 9), toBytes("bcd\xff\xff" "e"));
    expectBytes(image.as_binary(0, 7), toBytes("\xff\xff" "abcd\xff"));
    EXPECT_TRUE(image.as_binary(6, 6).empty());
    EXPECT_TRUE(image.as_binary(20).empty());
}

TEST(ImageModelTests, BinaryDoesNotPadPastLastWord) {
    auto image = imageWith({{2, toBytes("ab")}});

    expectBytes(image.as_binary(0, 12), toBytes("\xff\xff" "ab"));
}

TEST(ImageModelTests, BinaryPaddingIsOneWord) {
    auto image = imageWith({{0, fromHex("0102")}, {2, fromHex("0304")}}, 16);

    expectBytes(image.as_binary(std::nullopt, std::nullopt, fromHex("abcd")), fromHex("0102abcd0304"));

    try {
        image.as_binary(std::nullopt, std::nullopt, fromHex("ab"));
        FAIL() << "Expected RangeError";
    } catch (const RangeError& e) {
        EXPECT_STREQ(e.what(), "padding must be 2 byte(s), but got 1");
    }
}

TEST(ImageModelTests, EmptyImageBinary) {
    ImageModel image;

    EXPECT_TRUE(image.as_binary().empty());
    EXPECT_EQ(image.as_array(), "");
}

TEST(ImageModelTests, ArrayOfWords) {
    EXPECT_EQ(imageWith({{0, fromHex("0102ab")}}).as_array(), "0x01, 0x02, 0xab");

    auto words = imageWith({{1, fromHex("0102abcd")}}, 16);
    EXPECT_EQ(words.as_array(), "0x0102, 0xabcd");
    EXPECT_EQ(words.as_array(0, fromHex("0000"), ","), "0x0000,0x0102,0xabcd");
}

// ============================================================================
// Hexdump
// ============================================================================

TEST(ImageModelTests, HexdumpFullAndPartialLines) {
    auto image = imageWith({{0, toBytes("0123456789abcdefXY")}});

    EXPECT_EQ(image.as_hexdump(), lines({
        "00000000  30 31 32 33 34 35 36 37  38 39 61 62 63 64 65 66  |0123456789abcdef|",
        "00000010  58 59                                             |XY              |",
    }));
}

TEST(ImageModelTests, HexdumpMarksSkippedLines) {
    auto image = imageWith({{0, fromHex("6100")}, {0x40, toBytes("b")}});

    EXPECT_EQ(image.as_hexdump(), lines({
        "00000000  61 00                                             |a.              |",
        "...",
        "00000040  62                                                |b               |",
    }));
}

TEST(ImageModelTests, HexdumpUnalignedStart) {
    auto image = imageWith({{0x13, toBytes("ab")}});

    EXPECT_EQ(image.as_hexdump(),
              "00000010           61 62                                    |   ab           |\n");
}

TEST(ImageModelTests, HexdumpWordAddresses) {
    auto image = imageWith({{0x10, fromHex("01020304")}}, 16);

    EXPECT_EQ(image.as_hexdump(),
              "00000010  01 02 03 04                                       |....            |\n");
}

TEST(ImageModelTests, HexdumpEdgeCases) {
    EXPECT_EQ(ImageModel().as_hexdump(), "\n");

    auto wide = imageWith({{0, std::vector<uint8_t>(32, 0)}}, 256);
    EXPECT_THROW(wide.as_hexdump(), RangeError);
}

// ============================================================================
// Encoding
// ============================================================================

TEST(ImageModelTests, EncodeDispatchesOnFormat) {
    auto image = imageWith({{0, toBytes("ab")}, {4, toBytes("c")}});

    EXPECT_EQ(text(image.encode(format::Array{})), "0x61, 0x62, 0xff, 0xff, 0x63\n");
    expectBytes(image.encode(format::Binary{0, 1, 5, fromHex("00")}), fromHex("62000063"));
    EXPECT_EQ(text(image.encode(format::TiTxt{})), image.as_ti_txt());
    EXPECT_EQ(text(image.encode(format::Ihex{16, 16})), image.as_ihex(16, 16));
    EXPECT_EQ(text(image.encode(format::Hexdump{})), image.as_hexdump());
}

TEST(ImageModelTests, RoundTripsWith16BitWords) {
    auto image = imageWith({{0x100, fromHex("0102030405060708")}, {0x200, fromHex("aabb")}}, 16);
    image.set_execution_start_address(0x100);

    ImageModel srec(16);
    srec.add_srec(image.as_srec());
    EXPECT_EQ(srec.segments(), image.segments());
    EXPECT_EQ(srec.execution_start_address(), 0x100u);

    ImageModel ihex(16);
    ihex.add_ihex(image.as_ihex());
    EXPECT_EQ(ihex.segments(), image.segments());

    ImageModel tiTxt(16);
    tiTxt.add_ti_txt(image.as_ti_txt());
    EXPECT_EQ(tiTxt.segments(), image.segments());

    ImageModel vmem(16);
    vmem.add_verilog_vmem(image.as_verilog_vmem());
    EXPECT_EQ(vmem.segments(), image.segments());
}

// ============================================================================
// Editing
// ============================================================================

TEST(ImageModelTests, FillAllGaps) {
    auto image = imageWith({{0, toBytes("ab")}, {4, toBytes("cd")}, {20, toBytes("ef")}});

    image.fill();

    ASSERT_EQ(image.segments().size(), 1u);
    expectBytes(image.as_binary(0, 6), toBytes("ab\xff\xff" "cd"));
    EXPECT_EQ(image.size(), 22u);
}

TEST(ImageModelTests, FillSmallGapsOnly) {
    auto image = imageWith({{0, toBytes("ab")}, {4, toBytes("cd")}, {20, toBytes("ef")}});

    image.fill(fromHex("00"), 2);

    ASSERT_EQ(image.segments().size(), 2u);
    expectBytes(image.as_binary(0, 6), toBytes(std::string_view("ab\0\0cd", 6)));
    EXPECT_EQ(image.segments()[1].minimum_address(), 20u);
}

TEST(ImageModelTests, FillWithWords) {
    auto image = imageWith({{0, fromHex("0102")}, {3, fromHex("0304")}}, 16);

    image.fill(fromHex("abcd"));

    expectBytes(image.as_binary(), fromHex("0102abcdabcd0304"));
    EXPECT_THROW(image.fill(fromHex("ab")), RangeError);
}

TEST(ImageModelTests, ExcludeEdgeCases) {
    auto image = imageWith({{0, toBytes("abcdef")}});

    try {
        image.exclude(5, 3);
        FAIL() << "Expected RangeError";
    } catch (const RangeError& e) {
        EXPECT_STREQ(e.what(), "bad address range");
    }

    image.exclude(2, 4);
    const auto once = image.segments();
    image.exclude(2, 4);
    image.exclude(100, 200);
    EXPECT_EQ(image.segments(), once);
    EXPECT_EQ(image.segments().size(), 2u);
}

TEST(ImageModelTests, ExcludeInWords) {
    auto image = imageWith({{0, fromHex("0102030405060708")}}, 16);

    image.exclude(1, 3);

    ASSERT_EQ(image.segments().size(), 2u);
    EXPECT_EQ(image.segments()[1].minimum_address(), 6u);
    expectBytes(image.segments()[1].data(), fromHex("0708"));
}

TEST(ImageModelTests, Crop) {
    auto image = imageWith({{0, toBytes("0123456789")}, {20, toBytes("xy")}});

    image.crop(2, 5);

    ASSERT_EQ(image.segments().size(), 1u);
    EXPECT_EQ(image.minimum_address(), 2u);
    expectBytes(image.segments()[0].data(), toBytes("234"));

    EXPECT_THROW(image.crop(5, 2), RangeError);

    ImageModel empty;
    EXPECT_NO_THROW(empty.crop(0, 10));
}

TEST(ImageModelTests, RangesBeyondByteAddressSpace) {
    auto image = imageWith({{0, fromHex("0102030405060708")}}, 16);
    const auto before = image.segments();

    image.crop(0, (1ull << 63) + 1);
    EXPECT_EQ(image.segments(), before);

    image.exclude(1ull << 63, (1ull << 63) + 2);
    EXPECT_EQ(image.segments(), before);

    image.crop(1, ~0ull);
    ASSERT_EQ(image.segments().size(), 1u);
    EXPECT_EQ(image.segments()[0].minimum_address(), 2u);
    expectBytes(image.segments()[0].data(), fromHex("030405060708"));
}

TEST(ImageModelTests, WordAccess) {
    auto image = imageWith({{0, fromHex("01020304")}}, 16);

    EXPECT_EQ(image.word(1), 0x0304u);

    try {
        image.word(2);
        FAIL() << "Expected RangeError";
    } catch (const RangeError& e) {
        EXPECT_STREQ(e.what(), "word at address 0x00000002 is not mapped");
    }

    image.set_word(2, 0xbeef);
    EXPECT_EQ(image.word(2), 0xbeefu);
    EXPECT_EQ(image.segments().size(), 1u);

    image.set_word(0, 0xffff);
    EXPECT_EQ(image.word(0), 0xffffu);

    EXPECT_THROW(image.set_word(0, 0x10000), RangeError);
    EXPECT_THROW(image.set_words(0, fromHex("010203")), RangeError);

    image.set_words(1, fromHex("aaaabbbb"));
    expectBytes(image.as_binary(), fromHex("ffffaaaabbbb"));
}

TEST(ImageModelTests, MergeImages) {
    auto image = imageWith({{0, toBytes("ab")}});
    auto other = imageWith({{0x10, toBytes("cd")}});
    other.set_execution_start_address(0x10);

    image += other;

    ASSERT_EQ(image.segments().size(), 2u);
    EXPECT_EQ(image.segments()[1].minimum_address(), 0x10u);
    EXPECT_EQ(image.execution_start_address(), 0x10u);

    auto overlapping = imageWith({{1, toBytes("XY")}});
    EXPECT_THROW(image.merge(overlapping), AddDataError);

    image.merge(overlapping, true);
    expectBytes(image.segments()[0].data(), toBytes("aXY"));
}

// ============================================================================
// Header
// ============================================================================

TEST(ImageModelTests, Utf8Header) {
    ImageModel image;
    EXPECT_FALSE(image.header_text().has_value());

    image.set_header_text("caf\xc3\xa9");
    EXPECT_EQ(image.header_text(), "caf\xc3\xa9");
    expectBytes(*image.header(), fromHex("636166c3a9"));

    image.set_header(fromHex("ff"));
    EXPECT_THROW(image.header_text(), ParseError);

    image.set_header(fromHex("c080"));
    EXPECT_THROW(image.header_text(), ParseError);

    image.clear_header();
    EXPECT_FALSE(image.header().has_value());
}

TEST(ImageModelTests, RawHeaderIsEscaped) {
    ImageModel image(8, HeaderCodec::NONE);
    EXPECT_EQ(image.header_codec(), HeaderCodec::NONE);

    image.set_header(fromHex("68005cff"));
    EXPECT_EQ(image.header_text(), "h\\x00\\x5c\\xff");

    image.set_header_text("a\\x01b\\x");
    expectBytes(*image.header(), fromHex("6101625c78"));
}

TEST(ImageModelTests, HeaderRoundTripsThroughSrec) {
    ImageModel image;
    image.add_srec(Samples::SREC_16);

    EXPECT_EQ(image.header_text(), "hello");
    EXPECT_EQ(image.as_srec(32, 16), Samples::SREC_16);
}

TEST(ImageModelTests, VmemCarriesHeaderComment) {
    auto image = imageWith({{0, fromHex("01")}});
    image.set_header_text("hello");

    EXPECT_EQ(image.as_verilog_vmem(), lines({"/* hello */", "@00000000 01"}));
}

TEST(ImageModelTests, VmemHeaderWithCommentTerminatorReadsBack) {
    auto image = imageWith({{0, fromHex("0102")}});
    image.set_header_text("v1 */ 77");

    ImageModel reread;
    reread.add_verilog_vmem(image.as_verilog_vmem());

    EXPECT_EQ(reread.segments(), image.segments());
}
