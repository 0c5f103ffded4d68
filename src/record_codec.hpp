#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hexmill {

// --- Hex helpers ---

// Uppercase hex, two digits per byte.
std::string hexlify(std::span<const uint8_t> data);

// Throws ParseError on odd length or non hex digits.
std::vector<uint8_t> unhexlify(std::string_view hex);

// `value` as exactly `digits` uppercase hex digits.
std::string hex_field(uint64_t value, size_t digits);

// --- Checksums ---

// One's complement of the byte sum of the hex string.
uint8_t crc_srec(std::string_view hexstr);

// Two's complement of the byte sum of the hex string.
uint8_t crc_ihex(std::string_view hexstr);

// --- Records ---

struct SrecRecord {
    char type;
    uint64_t address;
    std::vector<uint8_t> data;
};

struct IhexRecord {
    uint8_t type;
    uint32_t address;
    std::vector<uint8_t> data;
};

std::string pack_srec(char type, uint64_t address, std::span<const uint8_t> data = {});
SrecRecord unpack_srec(std::string_view record);

std::string pack_ihex(uint8_t type, uint32_t address, std::span<const uint8_t> data = {});
IhexRecord unpack_ihex(std::string_view record);

} // namespace hexmill
