#pragma once
#include "segment.hpp"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace hexmill {

/**
 * @brief Ordered, disjoint collection of segments.
 *
 * Invariant: segments are sorted by address and for every neighbouring pair
 * `list[i].maximum_address() < list[i + 1].minimum_address()`. Touching or
 * overlapping data is always merged into one segment.
 *
 * The store is byte addressed. The word size is only used to express
 * chunk sizes and chunk addresses in words.
 */
class SegmentStore
{
public:
    explicit SegmentStore(size_t word_size_bytes = 1);

    // Insert a segment, merging it with adjacent and (when overwrite is set)
    // overlapping data. Without overwrite, overlapping data throws
    // AddDataError and leaves the store unchanged.
    void add(Segment segment, bool overwrite = false);

    // Remove [minimum_address, maximum_address), splitting segments as needed.
    void remove(uint64_t minimum_address, uint64_t maximum_address);

    // Chunks of at most `size` words, addresses in words.
    ChunkRange chunks(size_t size = 32, size_t alignment = 1) const;

    // Same walk in bytes, addresses in bytes.
    ChunkRange byte_chunks(size_t size, size_t alignment = 1) const;

    const std::vector<Segment>& segments() const { return list_; }
    const Segment& at(size_t index) const;
    size_t size() const { return list_.size(); }
    bool empty() const { return list_.empty(); }
    size_t word_size_bytes() const { return word_size_bytes_; }

    // Bounds of the stored bytes. Throw EmptyStoreError on an empty store.
    uint64_t minimum_address() const;
    uint64_t maximum_address() const;

    std::string to_string() const;

private:
    friend class SegmentStoreTest;

    static constexpr size_t npos = std::numeric_limits<size_t>::max();

    // Index of the first segment whose maximum address is >= address.
    size_t first_reaching(uint64_t address) const;
    bool overlaps(uint64_t minimum_address, uint64_t maximum_address) const;
    void merge_forward(size_t index);

    std::vector<Segment> list_;
    size_t current_ = npos; // last touched segment
    size_t word_size_bytes_;
    uint64_t generation_ = 0;
};

} // namespace hexmill
