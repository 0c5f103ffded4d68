#pragma once
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace hexmill {

class ChunkRange;

/**
 * @brief One contiguous run of bytes covering [minimum_address, maximum_address).
 *
 * Addresses are byte addresses. The data buffer always holds exactly
 * maximum_address - minimum_address bytes.
 */
class Segment
{
public:
    Segment(uint64_t minimum_address, std::vector<uint8_t> data);

    uint64_t minimum_address() const { return minimum_address_; }
    uint64_t maximum_address() const { return maximum_address_; }
    const std::vector<uint8_t>& data() const { return data_; }
    size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    // Grow the segment with data adjacent to it, or splice overlapping data
    // over it when overwrite is set. Throws AddDataError otherwise.
    void add_data(uint64_t minimum_address,
                  uint64_t maximum_address,
                  std::span<const uint8_t> data,
                  bool overwrite);

    // Remove [minimum_address, maximum_address) from the segment. Returns the
    // right hand part when the removed range splits the segment in two. A
    // range not intersecting the segment leaves it untouched.
    std::optional<Segment> remove_data(uint64_t minimum_address, uint64_t maximum_address);

    ChunkRange chunks(size_t size = 32, size_t alignment = 1, size_t word_size_bytes = 1) const;

    std::string to_string() const;

    bool operator==(const Segment& other) const = default;

private:
    uint64_t minimum_address_;
    uint64_t maximum_address_;
    std::vector<uint8_t> data_;
};

struct Chunk {
    uint64_t address;               // in the unit the range was created with
    std::span<const uint8_t> data;  // view into the owning segment
};

/**
 * @brief Lazy, restartable walk over fixed size pieces of a list of segments.
 *
 * Every chunk is at most `size` bytes. The first chunk of a segment is cut
 * short when the segment does not start on an `alignment` boundary, so all
 * following chunks start on one. Sizes and alignments are in bytes here;
 * callers working in words scale them first.
 */
class ChunkRange
{
public:
    class iterator
    {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Chunk;
        using difference_type = std::ptrdiff_t;
        using pointer = const Chunk*;
        using reference = const Chunk&;

        iterator() = default;

        reference operator*() const;
        pointer operator->() const { return &**this; }
        iterator& operator++();
        iterator operator++(int);

        bool operator==(const iterator& other) const {
            return segment_ == other.segment_ && offset_ == other.offset_;
        }

    private:
        friend class ChunkRange;
        iterator(const ChunkRange* range, size_t segment);

        void load();
        void check_unmodified() const;

        const ChunkRange* range_ = nullptr;
        size_t segment_ = 0;
        size_t offset_ = 0;
        Chunk current_{};
    };

    // `generation`, when given, is the owner's modification counter. Using an
    // iterator after it changed throws.
    ChunkRange(std::span<const Segment> segments,
               size_t size_bytes,
               size_t alignment_bytes,
               size_t unit_bytes,
               const uint64_t* generation = nullptr);

    iterator begin() const { return iterator(this, 0); }
    iterator end() const { return iterator(this, segments_.size()); }

    std::vector<Chunk> to_vector() const { return {begin(), end()}; }

private:
    std::span<const Segment> segments_;
    size_t size_bytes_;
    size_t alignment_bytes_;
    size_t unit_bytes_;
    const uint64_t* generation_;
    uint64_t expected_generation_;
};

// Shared argument check for every chunks() entry point.
void check_chunk_arguments(size_t size, size_t alignment);

} // namespace hexmill
