#pragma once
#include "image_attributes.hpp"
#include "segment_store.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace hexmill::srec {

// Feed Motorola S-Records into the store. Data record addresses are word
// addresses and are scaled by the store's word size.
void read(std::string_view records, SegmentStore& store, ImageAttributes& attributes, bool overwrite);

// Header, data records of `address_length_bits` (16, 24 or 32) wide addresses
// holding at most `number_of_data_bytes` each, record count and start address.
std::string write(const SegmentStore& store,
                  const ImageAttributes& attributes,
                  size_t number_of_data_bytes = 32,
                  unsigned address_length_bits = 32);

} // namespace hexmill::srec
