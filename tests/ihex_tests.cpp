#include "errors.hpp"
#include "ihex.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace hexmill;

namespace {
std::string writeByteAt(uint64_t address, unsigned addressLengthBits) {
    SegmentStore store;
    store.add(Segment(address, fromHex("01")));
    return ihex::write(store, {}, 32, addressLengthBits);
}

std::string rangeErrorOf(uint64_t address, unsigned addressLengthBits) {
    try {
        writeByteAt(address, addressLengthBits);
    } catch (const RangeError& e) {
        return e.what();
    }
    ADD_FAILURE() << "No RangeError for address 0x" << std::hex << address;
    return "";
}
} // namespace

// ============================================================================
// Reading
// ============================================================================

TEST(IhexTests, ReadsExtendedLinearAddress) {
    SegmentStore store;
    ImageAttributes attributes;

    ihex::read(Samples::IHEX_32, store, attributes, false);

    ASSERT_EQ(store.size(), 2u);
    EXPECT_EQ(store.at(0).minimum_address(), 0u);
    expectBytes(store.at(0).data(), fromHex("01020304"));
    EXPECT_EQ(store.at(1).minimum_address(), 0x12340u);
    expectBytes(store.at(1).data(), fromHex("aabbccdd"));
}

TEST(IhexTests, ReadsExtendedSegmentAddress) {
    SegmentStore store;
    ImageAttributes attributes;

    ihex::read(lines({":020000021000EC", ":0100000055AA", ":00000001FF"}), store, attributes, false);

    ASSERT_EQ(store.size(), 1u);
    EXPECT_EQ(store.at(0).minimum_address(), 0x10000u);
}

TEST(IhexTests, StartSegmentAddressKeepsRawValue) {
    SegmentStore store;
    ImageAttributes attributes;

    ihex::read(lines({":0400000302030405EB", ":00000001FF"}), store, attributes, false);

    EXPECT_EQ(attributes.execution_start_address, 0x02030405u);
}

TEST(IhexTests, StartLinearAddress) {
    SegmentStore store;
    ImageAttributes attributes;

    ihex::read(":0400000500001234B1\n", store, attributes, false);

    EXPECT_EQ(attributes.execution_start_address, 0x1234u);
}

TEST(IhexTests, EndOfFileStopsParsing) {
    SegmentStore store;
    ImageAttributes attributes;

    ihex::read(lines({":0100000055AA", ":00000001FF", "garbage"}), store, attributes, false);

    EXPECT_EQ(store.size(), 1u);
}

TEST(IhexTests, UnknownRecordType) {
    SegmentStore store;
    ImageAttributes attributes;

    try {
        ihex::read(":00000006FA\n", store, attributes, false);
        FAIL() << "Expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_STREQ(e.what(), "expected type 0..5 in record :00000006FA, but got 6");
    }
}

TEST(IhexTests, ExtendedAddressRecordSize) {
    SegmentStore store;
    ImageAttributes attributes;

    EXPECT_THROW(ihex::read(":0100000401FA\n", store, attributes, false), ParseError);
}

TEST(IhexTests, WordAddressesAreScaled) {
    SegmentStore store(2);
    ImageAttributes attributes;

    ihex::read(":020010000102EB\n", store, attributes, false);

    EXPECT_EQ(store.at(0).minimum_address(), 0x20u);
    EXPECT_EQ(ihex::write(store, attributes), lines({":020010000102EB", ":00000001FF"}));
}

// ============================================================================
// Writing
// ============================================================================

TEST(IhexTests, RoundTrip32BitAddresses) {
    SegmentStore store;
    ImageAttributes attributes;
    ihex::read(Samples::IHEX_32, store, attributes, false);

    EXPECT_EQ(ihex::write(store, attributes, 32, 32), Samples::IHEX_32);
}

TEST(IhexTests, Writes24BitAddresses) {
    SegmentStore store;
    store.add(Segment(0x12340, fromHex("aabbccdd")));
    ImageAttributes attributes;
    attributes.execution_start_address = 0x02030405;

    EXPECT_EQ(ihex::write(store, attributes, 32, 24), lines({
        ":020000021000EC",
        ":04234000AABBCCDD8B",
        ":0400000302030405EB",
        ":00000001FF",
    }));
}

TEST(IhexTests, Writes16BitAddressesWithoutStartAddress) {
    SegmentStore store;
    store.add(Segment(0x10, fromHex("0102")));
    ImageAttributes attributes;
    attributes.execution_start_address = 0x1234;

    EXPECT_EQ(ihex::write(store, attributes, 32, 16), lines({":020010000102EB", ":00000001FF"}));
}

TEST(IhexTests, StartLinearAddressRecord) {
    SegmentStore store;
    ImageAttributes attributes;
    attributes.execution_start_address = 0x1234;

    EXPECT_EQ(ihex::write(store, attributes), lines({":0400000500001234B1", ":00000001FF"}));
}

TEST(IhexTests, RecordsDoNotCross64KBoundary) {
    SegmentStore store;
    store.add(Segment(0xfffe, fromHex("01020304")));

    EXPECT_EQ(ihex::write(store, {}, 32, 32), lines({
        ":02FFFE000102FE",
        ":020000040001F9",
        ":020000000304F7",
        ":00000001FF",
    }));
}

TEST(IhexTests, RecordSize) {
    SegmentStore store;
    store.add(Segment(0, fromHex("0102030405060708090a")));

    const auto output = ihex::write(store, {}, 8, 32);

    EXPECT_EQ(output.substr(0, output.find('\n')), ":080000000102030405060708D4");
}

TEST(IhexTests, LastByteOf32BitSpace) {
    SegmentStore store;
    store.add(Segment(0xffffffff, fromHex("5a")));

    const auto records = ihex::write(store, {}, 32, 32);
    EXPECT_EQ(records, lines({":02000004FFFFFC", ":01FFFF005AA7", ":00000001FF"}));

    SegmentStore reread;
    ImageAttributes attributes;
    ihex::read(records, reread, attributes, false);
    ASSERT_EQ(reread.size(), 1u);
    EXPECT_EQ(reread.at(0).minimum_address(), 0xffffffffu);

    EXPECT_EQ(rangeErrorOf(0xffffffff, 16),
              "cannot address more than 64 kB in I8HEX files (16 bits addresses)");
}

TEST(IhexTests, AddressCeilings) {
    EXPECT_NO_THROW(writeByteAt(0xffff, 16));
    EXPECT_EQ(rangeErrorOf(0x10000, 16),
              "cannot address more than 64 kB in I8HEX files (16 bits addresses)");

    EXPECT_EQ(writeByteAt(0x10ffef, 24), lines({":02000002FFFFFE", ":01FFFF000100", ":00000001FF"}));
    EXPECT_EQ(rangeErrorOf(0x10fff0, 24),
              "cannot address more than 1 MB in I16HEX files (20 bits addresses)");

    EXPECT_EQ(rangeErrorOf(0x100000000, 32),
              "cannot address more than 4 GB in I32HEX files (32 bits addresses)");
}

TEST(IhexTests, BadAddressLength) {
    SegmentStore store;

    try {
        ihex::write(store, {}, 32, 20);
        FAIL() << "Expected RangeError";
    } catch (const RangeError& e) {
        EXPECT_STREQ(e.what(), "expected address length 16, 24 or 32, but got 20");
    }
}
