#pragma once
#include "segment_store.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace hexmill::verilog_vmem {

// Word addresses in the file are scaled by the detected word width, so the
// store receives byte addresses.
void read(std::string_view text, SegmentStore& store, bool overwrite);

// `header` is written as a leading block comment when given.
std::string write(const SegmentStore& store, std::optional<std::string_view> header = std::nullopt);

// True when the text tokenizes to at least one word and nothing but
// "@address" markers and hex words.
bool looks_like(std::string_view text);

} // namespace hexmill::verilog_vmem
