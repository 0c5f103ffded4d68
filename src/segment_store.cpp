#include "segment_store.hpp"
#include "errors.hpp"
#include <algorithm>
#include <sstream>

namespace hexmill {

SegmentStore::SegmentStore(size_t word_size_bytes)
    : word_size_bytes_(word_size_bytes)
{
    if (word_size_bytes_ == 0) {
        throw RangeError("word size must be at least one byte");
    }
}

size_t SegmentStore::first_reaching(uint64_t address) const
{
    auto it = std::lower_bound(list_.begin(), list_.end(), address,
                               [](const Segment& segment, uint64_t value) {
                                   return segment.maximum_address() < value;
                               });
    return static_cast<size_t>(it - list_.begin());
}

bool SegmentStore::overlaps(uint64_t minimum_address, uint64_t maximum_address) const
{
    // Only the first segment ending after minimum_address can overlap.
    auto it = std::upper_bound(list_.begin(), list_.end(), minimum_address,
                               [](uint64_t value, const Segment& segment) {
                                   return value < segment.maximum_address();
                               });
    return it != list_.end() && it->minimum_address() < maximum_address;
}

void SegmentStore::add(Segment segment, bool overwrite)
{
    if (segment.empty()) {
        return;
    }

    if (!overwrite && overlaps(segment.minimum_address(), segment.maximum_address())) {
        throw AddDataError("data added to a segment must be adjacent to or overlapping with the "
                           "original segment data, unless overwrite is allowed");
    }

    ++generation_;

    if (list_.empty()) {
        list_.push_back(std::move(segment));
        current_ = 0;
        return;
    }

    size_t index;

    if (current_ < list_.size()
        && segment.minimum_address() == list_[current_].maximum_address()) {
        // Fast path for records arriving in address order.
        index = current_;
        list_[index].add_data(segment.minimum_address(), segment.maximum_address(),
                              segment.data(), overwrite);
    } else {
        index = first_reaching(segment.minimum_address());

        if (index == list_.size()) {
            list_.push_back(std::move(segment));
        } else if (segment.maximum_address() < list_[index].minimum_address()) {
            list_.insert(list_.begin() + static_cast<std::ptrdiff_t>(index), std::move(segment));
        } else {
            list_[index].add_data(segment.minimum_address(), segment.maximum_address(),
                                  segment.data(), overwrite);
        }
    }

    merge_forward(index);
    current_ = index;
}

void SegmentStore::merge_forward(size_t index)
{
    // Each iteration consumes one neighbour; the loop ends at the first one
    // that is not (fully) covered.
    while (index + 1 < list_.size()) {
        Segment& grown = list_[index];
        const Segment& next = list_[index + 1];
        const auto next_it = list_.begin() + static_cast<std::ptrdiff_t>(index + 1);

        if (grown.maximum_address() >= next.maximum_address()) {
            list_.erase(next_it);
        } else if (grown.maximum_address() >= next.minimum_address()) {
            const auto skip = static_cast<size_t>(grown.maximum_address() - next.minimum_address());
            grown.add_data(grown.maximum_address(), next.maximum_address(),
                           std::span<const uint8_t>(next.data()).subspan(skip), false);
            list_.erase(next_it);
            break;
        } else {
            break;
        }
    }
}

void SegmentStore::remove(uint64_t minimum_address, uint64_t maximum_address)
{
    if (minimum_address >= maximum_address || list_.empty()) {
        return;
    }

    ++generation_;
    current_ = npos;

    auto it = std::upper_bound(list_.begin(), list_.end(), minimum_address,
                               [](uint64_t value, const Segment& segment) {
                                   return value < segment.maximum_address();
                               });

    while (it != list_.end() && it->minimum_address() < maximum_address) {
        auto split = it->remove_data(minimum_address, maximum_address);

        if (it->empty()) {
            it = list_.erase(it);
        } else {
            ++it;
        }

        if (split) {
            it = list_.insert(it, std::move(*split));
            ++it;
        }
    }
}

ChunkRange SegmentStore::chunks(size_t size, size_t alignment) const
{
    check_chunk_arguments(size, alignment);

    return ChunkRange(list_,
                      size * word_size_bytes_,
                      alignment * word_size_bytes_,
                      word_size_bytes_,
                      &generation_);
}

ChunkRange SegmentStore::byte_chunks(size_t size, size_t alignment) const
{
    check_chunk_arguments(size, alignment);

    return ChunkRange(list_, size, alignment, 1, &generation_);
}

const Segment& SegmentStore::at(size_t index) const
{
    if (index >= list_.size()) {
        throw RangeError("segment does not exist");
    }

    return list_[index];
}

uint64_t SegmentStore::minimum_address() const
{
    if (list_.empty()) {
        throw EmptyStoreError();
    }

    return list_.front().minimum_address();
}

uint64_t SegmentStore::maximum_address() const
{
    if (list_.empty()) {
        throw EmptyStoreError();
    }

    return list_.back().maximum_address();
}

std::string SegmentStore::to_string() const
{
    std::ostringstream oss;

    for (size_t i = 0; i < list_.size(); ++i) {
        if (i > 0) oss << "\n";
        oss << list_[i].to_string();
    }

    return oss.str();
}

} // namespace hexmill
