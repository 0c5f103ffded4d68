#pragma once
#include "image_attributes.hpp"
#include "segment_store.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace hexmill::ihex {

// Feed Intel HEX records into the store, tracking the extended segment and
// extended linear address registers. Parsing stops at the end of file record.
void read(std::string_view records, SegmentStore& store, ImageAttributes& attributes, bool overwrite);

// Encode the store as I8HEX (16), I16HEX (24) or I32HEX (32) records.
std::string write(const SegmentStore& store,
                  const ImageAttributes& attributes,
                  size_t number_of_data_bytes = 32,
                  unsigned address_length_bits = 32);

} // namespace hexmill::ihex
