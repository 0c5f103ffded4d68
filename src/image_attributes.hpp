#pragma once
#include <cstdint>
#include <optional>
#include <vector>

namespace hexmill {

// Everything an image carries besides its data segments.
struct ImageAttributes {
    std::optional<std::vector<uint8_t>> header;
    std::optional<uint64_t> execution_start_address; // in words
};

} // namespace hexmill
