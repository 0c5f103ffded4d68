/**
 * @file records.hpp
 * @brief Wire constants of the supported record formats
 *
 * Motorola S-Record, Intel HEX and TI-TXT field layouts, record types and
 * limits. Only single-expression inline helpers live here; the codecs are in
 * record_codec.hpp.
 */

#ifndef HEXMILL_RECORDS_HPP
#define HEXMILL_RECORDS_HPP

#include <cstddef>
#include <cstdint>

// =============================================================================
// MOTOROLA S-RECORD
// Layout: 'S' type count address data checksum
// =============================================================================

namespace hexmill::srec {

/**
 * @brief First character of every record
 */
constexpr char START_CODE = 'S';

/**
 * @brief Shortest possible record: "S" type, 2 hex count, 2 hex checksum
 */
constexpr size_t MINIMUM_RECORD_LENGTH = 6;

/**
 * @brief Record types, stored as the ASCII type digit
 *
 * 0 header, 1/2/3 data with 16/24/32-bit addresses, 5/6 record count with
 * 16/24-bit count, 7/8/9 start address with 32/24/16-bit address.
 */
enum class RecordType : char {
    HEADER = '0',
    DATA_16 = '1',
    DATA_24 = '2',
    DATA_32 = '3',
    COUNT_16 = '5',
    COUNT_24 = '6',
    START_32 = '7',
    START_24 = '8',
    START_16 = '9',
};

/**
 * @brief Width of the address field in bytes for a type digit, 0 if unknown
 *
 * Type groups {0,1,5,9} / {2,6,8} / {3,7} carry 2 / 3 / 4 address bytes.
 */
constexpr size_t address_width(char type) {
    switch (type) {
        case '0': case '1': case '5': case '9': return 2;
        case '2': case '6': case '8': return 3;
        case '3': case '7': return 4;
        default: return 0;
    }
}

/**
 * @brief The byte count field is one byte, covering address, data and checksum
 */
constexpr size_t MAXIMUM_COUNT = 0xff;

constexpr uint32_t MAXIMUM_COUNT_16 = 0xffff;
constexpr uint32_t MAXIMUM_COUNT_24 = 0xffffff;

} // namespace hexmill::srec

// =============================================================================
// INTEL HEX
// Layout: ':' count address(16) type data checksum
// =============================================================================

namespace hexmill::ihex {

constexpr char START_CODE = ':';

/**
 * @brief Shortest possible record: ":" 2 count, 4 address, 2 type, 2 checksum
 */
constexpr size_t MINIMUM_RECORD_LENGTH = 11;

enum class RecordType : uint8_t {
    DATA = 0x00,
    END_OF_FILE = 0x01,
    EXTENDED_SEGMENT_ADDRESS = 0x02,
    START_SEGMENT_ADDRESS = 0x03,
    EXTENDED_LINEAR_ADDRESS = 0x04,
    START_LINEAR_ADDRESS = 0x05,
};

constexpr size_t MAXIMUM_DATA_BYTES = 0xff;
constexpr uint32_t MAXIMUM_RECORD_ADDRESS = 0xffff;

/**
 * @brief Extended segment address register is multiplied by 16 (I16HEX)
 */
constexpr uint64_t SEGMENT_ADDRESS_SCALE = 16;

/**
 * @brief Extended linear address register supplies bits 16..31 (I32HEX)
 */
constexpr uint64_t LINEAR_ADDRESS_SCALE = 0x10000;

/**
 * @brief Highest address reachable per address-length mode
 *
 * I8HEX: 16-bit record address only.
 * I16HEX: segment register * 16 + 16-bit record address.
 * I32HEX: linear register << 16 + 16-bit record address.
 */
constexpr uint64_t MAXIMUM_ADDRESS_16 = 0xffff;
constexpr uint64_t MAXIMUM_ADDRESS_24 = 16 * 0xffff + 0xffff;
constexpr uint64_t MAXIMUM_ADDRESS_32 = 0xffffffff;

/**
 * @brief Bytes carried by 02/04 and 03/05 records
 */
constexpr size_t EXTENDED_ADDRESS_SIZE = 2;
constexpr size_t START_ADDRESS_SIZE = 4;

} // namespace hexmill::ihex

// =============================================================================
// TI-TXT
// Layout: "@ADDR" lines, data lines of hex bytes, "q" terminator
// =============================================================================

namespace hexmill::ti_txt {

constexpr char ADDRESS_MARKER = '@';
constexpr char TERMINATOR = 'q';

/**
 * @brief Full data line; a shorter line closes the current section
 */
constexpr size_t BYTES_PER_LINE = 16;

} // namespace hexmill::ti_txt

#endif // HEXMILL_RECORDS_HPP
