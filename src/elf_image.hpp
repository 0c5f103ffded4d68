#pragma once
#include "image_attributes.hpp"
#include "segment_store.hpp"
#include <cstdint>
#include <span>

namespace hexmill::elf {

bool is_elf(std::span<const uint8_t> image);

// Load the allocated, non-empty sections of an ELF file at their physical
// (load) addresses:
//
//   physical = p_paddr + (sh_addr - p_vaddr)
//
// using the first PT_LOAD segment whose memory range holds the section.
// Sections outside every PT_LOAD are skipped. The entry point becomes the
// execution start address. Files LIEF cannot parse throw ParseError.
void read(std::span<const uint8_t> image, SegmentStore& store, ImageAttributes& attributes, bool overwrite);

} // namespace hexmill::elf
