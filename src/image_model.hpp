#pragma once
#include "format.hpp"
#include "image_attributes.hpp"
#include "segment_store.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hexmill {

// How header bytes are presented as text.
enum class HeaderCodec
{
    NONE, // raw bytes, non printable ones shown as \xNN
    UTF8,
};

/**
 * @brief A memory image: data segments plus header and start address.
 *
 * Every address taken or returned here is a word address; the underlying
 * store is byte addressed and the conversion happens at this boundary.
 * segments() exposes the store directly and is therefore byte addressed.
 */
class ImageModel
{
public:
    explicit ImageModel(size_t word_size_bits = 8, HeaderCodec header_codec = HeaderCodec::UTF8);

    // --- Input ---

    // Auto-detects the format, see format::detect_format().
    void add(std::span<const uint8_t> data, bool overwrite = false);
    void add(std::string_view text, bool overwrite = false);
    void add(const format::Input& format, std::span<const uint8_t> data, bool overwrite = false);

    void add_srec(std::string_view records, bool overwrite = false);
    void add_ihex(std::string_view records, bool overwrite = false);
    void add_ti_txt(std::string_view text, bool overwrite = false);
    void add_verilog_vmem(std::string_view text, bool overwrite = false);
    void add_binary(std::span<const uint8_t> data, uint64_t address = 0, bool overwrite = false);
    void add_elf(std::span<const uint8_t> data, bool overwrite = false);

    // --- Output ---

    std::string as_srec(size_t number_of_data_bytes = 32, unsigned address_length_bits = 32) const;
    std::string as_ihex(size_t number_of_data_bytes = 32, unsigned address_length_bits = 32) const;
    std::string as_ti_txt() const;
    std::string as_verilog_vmem() const;

    // Flat image of [minimum, maximum), gaps filled with `padding` (one word,
    // 0xff bytes by default). Nothing is padded after the last stored word.
    std::vector<uint8_t> as_binary(std::optional<uint64_t> minimum = std::nullopt,
                                   std::optional<uint64_t> maximum = std::nullopt,
                                   std::optional<std::vector<uint8_t>> padding = std::nullopt) const;

    // as_binary() rendered as a list of 0x.. words.
    std::string as_array(std::optional<uint64_t> minimum = std::nullopt,
                         std::optional<std::vector<uint8_t>> padding = std::nullopt,
                         std::string_view separator = ", ") const;

    std::string as_hexdump() const;

    std::vector<uint8_t> encode(const format::Output& format) const;

    // --- Editing ---

    // Fill every gap of at most `max_words` words (all gaps when unset) with
    // `value`, one word of 0xff bytes by default.
    void fill(std::optional<std::vector<uint8_t>> value = std::nullopt,
              std::optional<uint64_t> max_words = std::nullopt);

    // Remove [minimum, maximum).
    void exclude(uint64_t minimum, uint64_t maximum);

    // Keep only [minimum, maximum).
    void crop(uint64_t minimum, uint64_t maximum);

    // Big endian value of the word at `address`. Throws RangeError when the
    // word is not fully mapped.
    uint64_t word(uint64_t address) const;
    void set_word(uint64_t address, uint64_t value);
    void set_words(uint64_t address, std::span<const uint8_t> data);

    // Re-encodes `other` as S-Records and reads them into this image.
    void merge(const ImageModel& other, bool overwrite = false);
    ImageModel& operator+=(const ImageModel& other);

    // --- Header and execution start address ---

    const std::optional<std::vector<uint8_t>>& header() const { return attributes_.header; }
    void set_header(std::vector<uint8_t> header) { attributes_.header = std::move(header); }
    void clear_header() { attributes_.header.reset(); }
    HeaderCodec header_codec() const { return header_codec_; }

    // Header decoded with the image's codec. Throws ParseError for a UTF-8
    // codec and bytes that are not valid UTF-8.
    std::optional<std::string> header_text() const;
    void set_header_text(std::string_view text);

    std::optional<uint64_t> execution_start_address() const { return attributes_.execution_start_address; }
    void set_execution_start_address(std::optional<uint64_t> address) { attributes_.execution_start_address = address; }

    // --- Queries ---

    // Throw EmptyStoreError on an empty image.
    uint64_t minimum_address() const;
    uint64_t maximum_address() const;

    // Number of stored words.
    uint64_t size() const;
    bool empty() const { return store_.empty(); }
    const std::vector<Segment>& segments() const { return store_.segments(); }
    const SegmentStore& store() const { return store_; }
    size_t word_size_bits() const { return word_size_bits_; }
    size_t word_size_bytes() const { return store_.word_size_bytes(); }

private:
    size_t word_size_bits_;
    HeaderCodec header_codec_;
    SegmentStore store_;
    ImageAttributes attributes_;

    std::vector<uint8_t> padding_word(const std::optional<std::vector<uint8_t>>& padding) const;
};

} // namespace hexmill
