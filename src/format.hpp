#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hexmill::format {

// Record options only apply when writing.
struct Srec {
    size_t data_bytes = 32;
    unsigned address_length_bits = 32;
};

struct Ihex {
    size_t data_bytes = 32;
    unsigned address_length_bits = 32;
};

struct TiTxt {};
struct VerilogVmem {};
struct Elf {};
struct Hexdump {};

// `address` places the data when reading; the window and padding are used
// when writing.
struct Binary {
    uint64_t address = 0;
    std::optional<uint64_t> minimum;
    std::optional<uint64_t> maximum;
    std::optional<std::vector<uint8_t>> padding;
};

struct Array {
    std::optional<uint64_t> minimum;
    std::optional<std::vector<uint8_t>> padding;
    std::string separator = ", ";
};

using Input = std::variant<Srec, Ihex, TiTxt, VerilogVmem, Binary, Elf>;
using Output = std::variant<Srec, Ihex, TiTxt, VerilogVmem, Binary, Hexdump, Array>;

// Guess the format of a file's contents. Binary is never guessed.
// Throws UnsupportedFileFormatError when nothing matches.
Input detect_format(std::span<const uint8_t> data);
Input detect_format(std::string_view text);

std::string name(const Input& format);
std::string name(const Output& format);

} // namespace hexmill::format
