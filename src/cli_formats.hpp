#pragma once
#include "format.hpp"
#include "image_model.hpp"
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace hexmill::cli {

// Unsigned literal with an optional 0x, 0b or 0o prefix and `_` separators.
uint64_t parse_number(std::string_view text);

// "auto" (nullopt), "srec", "ihex", "ti_txt", "verilog_vmem", "elf" or
// "binary[,<address>]".
std::optional<format::Input> parse_input_format(std::string_view text);

// "srec[,<data bytes>[,<address bits>]]", "ihex[,...]", "ti_txt",
// "verilog_vmem", "binary[,<minimum>[,<maximum>]]", "hexdump" or "array".
format::Output parse_output_format(std::string_view text);

// "utf-8" or "none".
HeaderCodec parse_header_encoding(std::string_view text);

// One word of `word_size_bytes` big endian bytes.
std::vector<uint8_t> word_bytes(uint64_t value, size_t word_size_bytes);

// Output format writing back what `input` reads. ELF cannot be written.
format::Output output_for(const format::Input& input);

} // namespace hexmill::cli
