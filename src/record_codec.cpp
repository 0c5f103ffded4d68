#include "record_codec.hpp"
#include "errors.hpp"
#include "records.hpp"
#include <iomanip>
#include <sstream>

namespace hexmill {

namespace {

int hex_digit_value(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

uint32_t byte_sum(std::string_view hexstr)
{
    uint32_t sum = 0;

    for (uint8_t byte : unhexlify(hexstr)) {
        sum += byte;
    }

    return sum;
}

std::string checksum_message(uint8_t expected, std::string_view record, uint8_t actual)
{
    return "expected crc '" + hex_field(expected, 2) + "' in record "
        + std::string(record) + ", but got '" + hex_field(actual, 2) + "'";
}

} // namespace

std::string hexlify(std::span<const uint8_t> data)
{
    static constexpr char digits[] = "0123456789ABCDEF";
    std::string hex;
    hex.reserve(2 * data.size());

    for (uint8_t byte : data) {
        hex.push_back(digits[byte >> 4]);
        hex.push_back(digits[byte & 0x0f]);
    }

    return hex;
}

std::vector<uint8_t> unhexlify(std::string_view hex)
{
    if (hex.size() % 2 != 0) {
        throw ParseError("odd-length hex string '" + std::string(hex) + "'");
    }

    std::vector<uint8_t> data;
    data.reserve(hex.size() / 2);

    for (size_t i = 0; i < hex.size(); i += 2) {
        int high = hex_digit_value(hex[i]);
        int low = hex_digit_value(hex[i + 1]);

        if (high < 0 || low < 0) {
            throw ParseError("non-hexadecimal digit found in '" + std::string(hex) + "'");
        }

        data.push_back(static_cast<uint8_t>((high << 4) | low));
    }

    return data;
}

std::string hex_field(uint64_t value, size_t digits)
{
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0') << std::setw(static_cast<int>(digits)) << value;
    return oss.str();
}

uint8_t crc_srec(std::string_view hexstr)
{
    return static_cast<uint8_t>((byte_sum(hexstr) & 0xff) ^ 0xff);
}

uint8_t crc_ihex(std::string_view hexstr)
{
    return static_cast<uint8_t>((~(byte_sum(hexstr) & 0xff) + 1) & 0xff);
}

std::string pack_srec(char type, uint64_t address, std::span<const uint8_t> data)
{
    const size_t width = srec::address_width(type);

    if (width == 0) {
        throw UnsupportedTypeError(std::string("expected record type 0..3 or 5..9, but got '") + type + "'");
    }

    if (width < 8 && (address >> (8 * width)) != 0) {
        throw RangeError("address 0x" + hex_field(address, 2 * width) + " does not fit in "
                         + std::to_string(8 * width) + " bits");
    }

    const size_t count = data.size() + width + 1;

    if (count > srec::MAXIMUM_COUNT) {
        throw RangeError("too much data in one record: " + std::to_string(data.size()) + " bytes");
    }

    std::string line = hex_field(count, 2) + hex_field(address, 2 * width) + hexlify(data);

    return std::string(1, srec::START_CODE) + type + line + hex_field(crc_srec(line), 2);
}

SrecRecord unpack_srec(std::string_view record)
{
    if (record.size() < srec::MINIMUM_RECORD_LENGTH) {
        throw ParseError("record '" + std::string(record) + "' too short");
    }

    if (record[0] != srec::START_CODE) {
        throw ParseError("record '" + std::string(record) + "' not starting with an 'S'");
    }

    const char type = record[1];
    const size_t width = srec::address_width(type);

    if (width == 0) {
        throw UnsupportedTypeError(std::string("expected record type 0..3 or 5..9, but got '") + type + "'");
    }

    const auto value = unhexlify(record.substr(2));
    const size_t size = value[0];

    if (size != value.size() - 1) {
        throw ParseError("record '" + std::string(record) + "' has wrong size");
    }

    const uint8_t actual = value.back();
    const uint8_t expected = crc_srec(record.substr(2, record.size() - 4));

    if (actual != expected) {
        throw ChecksumError(checksum_message(expected, record, actual), expected, actual);
    }

    // Count byte, address and checksum at the very least.
    if (value.size() < width + 2) {
        throw ParseError("record '" + std::string(record) + "' has wrong size");
    }

    uint64_t address = 0;

    for (size_t i = 1; i <= width; ++i) {
        address = (address << 8) | value[i];
    }

    return SrecRecord{type, address, std::vector<uint8_t>(value.begin() + 1 + width, value.end() - 1)};
}

std::string pack_ihex(uint8_t type, uint32_t address, std::span<const uint8_t> data)
{
    if (type > static_cast<uint8_t>(ihex::RecordType::START_LINEAR_ADDRESS)) {
        throw UnsupportedTypeError("expected record type 0..5, but got " + std::to_string(type));
    }

    if (data.size() > ihex::MAXIMUM_DATA_BYTES) {
        throw RangeError("too much data in one record: " + std::to_string(data.size()) + " bytes");
    }

    if (address > ihex::MAXIMUM_RECORD_ADDRESS) {
        throw RangeError("record address 0x" + hex_field(address, 8) + " does not fit in 16 bits");
    }

    std::string line = hex_field(data.size(), 2) + hex_field(address, 4) + hex_field(type, 2) + hexlify(data);

    return std::string(1, ihex::START_CODE) + line + hex_field(crc_ihex(line), 2);
}

IhexRecord unpack_ihex(std::string_view record)
{
    if (record.size() < ihex::MINIMUM_RECORD_LENGTH) {
        throw ParseError("record '" + std::string(record) + "' too short");
    }

    if (record[0] != ihex::START_CODE) {
        throw ParseError("record '" + std::string(record) + "' not starting with a ':'");
    }

    const auto value = unhexlify(record.substr(1));
    const size_t size = value[0];

    if (size != value.size() - 5) {
        throw ParseError("record '" + std::string(record) + "' has wrong size");
    }

    const uint32_t address = (static_cast<uint32_t>(value[1]) << 8) | value[2];
    const uint8_t type = value[3];
    const uint8_t actual = value.back();
    const uint8_t expected = crc_ihex(record.substr(1, record.size() - 3));

    if (actual != expected) {
        throw ChecksumError(checksum_message(expected, record, actual), expected, actual);
    }

    return IhexRecord{type, address, std::vector<uint8_t>(value.begin() + 4, value.end() - 1)};
}

} // namespace hexmill
