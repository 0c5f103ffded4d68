#pragma once
#include "segment_store.hpp"
#include <string>
#include <string_view>

namespace hexmill::ti_txt {

// TI-TXT addresses are byte addresses regardless of the store's word size.
void read(std::string_view text, SegmentStore& store, bool overwrite);
std::string write(const SegmentStore& store);

} // namespace hexmill::ti_txt
