#include "segment.hpp"
#include "errors.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace hexmill {

Segment::Segment(uint64_t minimum_address, std::vector<uint8_t> data)
    : minimum_address_(minimum_address),
      maximum_address_(minimum_address + data.size()),
      data_(std::move(data))
{
}

void Segment::add_data(uint64_t minimum_address,
                       uint64_t maximum_address,
                       std::span<const uint8_t> data,
                       bool overwrite)
{
    if (maximum_address < minimum_address || maximum_address - minimum_address != data.size()) {
        throw RangeError("data length does not match the address range");
    }

    if (minimum_address == maximum_address_) {
        data_.insert(data_.end(), data.begin(), data.end());
        maximum_address_ = maximum_address;
    } else if (maximum_address == minimum_address_) {
        data_.insert(data_.begin(), data.begin(), data.end());
        minimum_address_ = minimum_address;
    } else if (overwrite
               && minimum_address < maximum_address_
               && maximum_address > minimum_address_) {
        // Grow on either side first, then copy the new data over the
        // (now fully covering) buffer.
        if (minimum_address < minimum_address_) {
            const auto prefix = static_cast<size_t>(minimum_address_ - minimum_address);
            data_.insert(data_.begin(), data.begin(), data.begin() + prefix);
            minimum_address_ = minimum_address;
        }

        if (maximum_address > maximum_address_) {
            const auto suffix = static_cast<size_t>(maximum_address - maximum_address_);
            data_.insert(data_.end(), data.end() - suffix, data.end());
            maximum_address_ = maximum_address;
        }

        std::copy(data.begin(), data.end(),
                  data_.begin() + static_cast<std::ptrdiff_t>(minimum_address - minimum_address_));
    } else {
        throw AddDataError(
            "data added to a segment must be adjacent to or overlapping with the original segment data");
    }
}

std::optional<Segment> Segment::remove_data(uint64_t minimum_address, uint64_t maximum_address)
{
    if (minimum_address >= maximum_address
        || minimum_address >= maximum_address_
        || maximum_address <= minimum_address_) {
        return std::nullopt;
    }

    minimum_address = std::max(minimum_address, minimum_address_);
    maximum_address = std::min(maximum_address, maximum_address_);

    const auto left_size = static_cast<size_t>(minimum_address - minimum_address_);
    const auto right_offset = static_cast<size_t>(maximum_address - minimum_address_);
    const bool keeps_left = left_size > 0;
    const bool keeps_right = maximum_address < maximum_address_;

    if (keeps_left && keeps_right) {
        std::vector<uint8_t> right(data_.begin() + static_cast<std::ptrdiff_t>(right_offset), data_.end());
        data_.resize(left_size);
        maximum_address_ = minimum_address;

        return Segment(maximum_address, std::move(right));
    }

    if (keeps_left) {
        data_.resize(left_size);
        maximum_address_ = minimum_address;
    } else if (keeps_right) {
        data_.erase(data_.begin(), data_.begin() + static_cast<std::ptrdiff_t>(right_offset));
        minimum_address_ = maximum_address;
    } else {
        data_.clear();
        maximum_address_ = minimum_address_;
    }

    return std::nullopt;
}

ChunkRange Segment::chunks(size_t size, size_t alignment, size_t word_size_bytes) const
{
    check_chunk_arguments(size, alignment);

    return ChunkRange(std::span<const Segment>(this, 1),
                      size * word_size_bytes,
                      alignment * word_size_bytes,
                      word_size_bytes);
}

std::string Segment::to_string() const
{
    std::ostringstream oss;
    oss << "[0x" << std::hex << minimum_address_ << " .. 0x" << maximum_address_ << "]: ";
    oss << std::setfill('0');

    for (uint8_t byte : data_) {
        oss << std::setw(2) << static_cast<int>(byte);
    }

    return oss.str();
}

void check_chunk_arguments(size_t size, size_t alignment)
{
    if (size == 0 || alignment == 0) {
        throw RangeError("chunk size and alignment must be greater than zero");
    }

    if (size % alignment != 0) {
        throw RangeError("size " + std::to_string(size)
                         + " is not a multiple of alignment " + std::to_string(alignment));
    }
}

// --- ChunkRange ---

ChunkRange::ChunkRange(std::span<const Segment> segments,
                       size_t size_bytes,
                       size_t alignment_bytes,
                       size_t unit_bytes,
                       const uint64_t* generation)
    : segments_(segments),
      size_bytes_(size_bytes),
      alignment_bytes_(alignment_bytes),
      unit_bytes_(unit_bytes),
      generation_(generation),
      expected_generation_(generation ? *generation : 0)
{
}

ChunkRange::iterator::iterator(const ChunkRange* range, size_t segment)
    : range_(range), segment_(segment)
{
    load();
}

void ChunkRange::iterator::check_unmodified() const
{
    if (range_ && range_->generation_ && *range_->generation_ != range_->expected_generation_) {
        throw Error("segment store modified during iteration");
    }
}

void ChunkRange::iterator::load()
{
    const auto& segments = range_->segments_;

    while (segment_ < segments.size() && offset_ >= segments[segment_].size()) {
        ++segment_;
        offset_ = 0;
    }

    if (segment_ >= segments.size()) {
        segment_ = segments.size();
        offset_ = 0;
        current_ = Chunk{};
        return;
    }

    const Segment& segment = segments[segment_];
    const uint64_t address = segment.minimum_address() + offset_;
    const size_t misalignment = static_cast<size_t>(address % range_->alignment_bytes_);
    size_t length = misalignment != 0 ? range_->alignment_bytes_ - misalignment : range_->size_bytes_;
    length = std::min(length, segment.size() - offset_);

    current_ = Chunk{address / range_->unit_bytes_,
                     std::span<const uint8_t>(segment.data().data() + offset_, length)};
}

ChunkRange::iterator::reference ChunkRange::iterator::operator*() const
{
    check_unmodified();
    return current_;
}

ChunkRange::iterator& ChunkRange::iterator::operator++()
{
    check_unmodified();
    offset_ += current_.data.size();
    load();
    return *this;
}

ChunkRange::iterator ChunkRange::iterator::operator++(int)
{
    iterator previous = *this;
    ++*this;
    return previous;
}

} // namespace hexmill
