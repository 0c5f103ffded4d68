#pragma once
#include "image_model.hpp"
#include <cstdint>
#include <string>

namespace hexmill {

// Header, execution start address and one line per data range.
std::string info(const ImageModel& image);

// Two line overview of the address space: the bounds, then one column per
// slice of at most 80 slices. '=' fully mapped, '-' partially, ' ' empty.
std::string layout(const ImageModel& image);

// "1 byte", "124 bytes", "1.5 KiB", "2 MiB".
std::string format_size(uint64_t bytes);

} // namespace hexmill
