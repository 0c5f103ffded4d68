#include "image_model.hpp"
#include "elf_image.hpp"
#include "errors.hpp"
#include "ihex.hpp"
#include "record_codec.hpp"
#include "srec.hpp"
#include "ti_txt.hpp"
#include "verilog_vmem.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <limits>
#include <sstream>
#include <type_traits>

namespace hexmill {

namespace {

size_t checked_word_size_bytes(size_t word_size_bits)
{
    if (word_size_bits == 0 || word_size_bits % 8 != 0) {
        throw RangeError("word size must be a multiple of 8 bits, but got "
                         + std::to_string(word_size_bits) + " bits");
    }

    return word_size_bits / 8;
}

// Word address to byte address, clamped to the top of the address space.
uint64_t byte_address(uint64_t word_address, size_t word_size_bytes)
{
    if (word_address > std::numeric_limits<uint64_t>::max() / word_size_bytes) {
        return std::numeric_limits<uint64_t>::max();
    }

    return word_address * word_size_bytes;
}

std::string_view as_text(std::span<const uint8_t> data)
{
    return std::string_view(reinterpret_cast<const char*>(data.data()), data.size());
}

std::vector<uint8_t> as_bytes(std::string_view text)
{
    return std::vector<uint8_t>(text.begin(), text.end());
}

bool is_valid_utf8(std::span<const uint8_t> data)
{
    size_t i = 0;

    while (i < data.size()) {
        const uint8_t lead = data[i];
        size_t continuation;
        uint32_t code_point;

        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xe0) == 0xc0) {
            continuation = 1;
            code_point = lead & 0x1f;
        } else if ((lead & 0xf0) == 0xe0) {
            continuation = 2;
            code_point = lead & 0x0f;
        } else if ((lead & 0xf8) == 0xf0) {
            continuation = 3;
            code_point = lead & 0x07;
        } else {
            return false;
        }

        if (data.size() - i <= continuation) {
            return false;
        }

        for (size_t j = 1; j <= continuation; ++j) {
            if ((data[i + j] & 0xc0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (data[i + j] & 0x3f);
        }

        // Overlong forms, surrogates and values past U+10FFFF.
        static constexpr uint32_t minimum[] = {0, 0x80, 0x800, 0x10000};
        if (code_point < minimum[continuation]
            || (code_point >= 0xd800 && code_point <= 0xdfff)
            || code_point > 0x10ffff) {
            return false;
        }

        i += continuation + 1;
    }

    return true;
}

// Printable ASCII other than the backslash is kept, everything else becomes
// \xNN so that unescape_header() restores the exact bytes.
std::string escape_header(std::span<const uint8_t> data)
{
    std::ostringstream out;
    out << std::hex << std::setfill('0');

    for (uint8_t byte : data) {
        if (byte >= 0x20 && byte < 0x7f && byte != '\\') {
            out << static_cast<char>(byte);
        } else {
            out << "\\x" << std::setw(2) << static_cast<unsigned>(byte);
        }
    }

    return out.str();
}

std::vector<uint8_t> unescape_header(std::string_view text)
{
    std::vector<uint8_t> bytes;

    for (size_t i = 0; i < text.size(); ++i) {
        if (text.substr(i).starts_with("\\x") && i + 4 <= text.size()
            && std::isxdigit(static_cast<unsigned char>(text[i + 2]))
            && std::isxdigit(static_cast<unsigned char>(text[i + 3]))) {
            bytes.push_back(unhexlify(text.substr(i + 2, 2)).front());
            i += 3;
        } else {
            bytes.push_back(static_cast<uint8_t>(text[i]));
        }
    }

    return bytes;
}

} // namespace

ImageModel::ImageModel(size_t word_size_bits, HeaderCodec header_codec)
    : word_size_bits_(word_size_bits),
      header_codec_(header_codec),
      store_(checked_word_size_bytes(word_size_bits))
{
}

// =============================================================================
// Input
// =============================================================================

void ImageModel::add(std::span<const uint8_t> data, bool overwrite)
{
    add(format::detect_format(data), data, overwrite);
}

void ImageModel::add(std::string_view text, bool overwrite)
{
    add(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()), overwrite);
}

void ImageModel::add(const format::Input& format, std::span<const uint8_t> data, bool overwrite)
{
    std::visit([&](const auto& input) {
        using T = std::decay_t<decltype(input)>;

        if constexpr (std::is_same_v<T, format::Srec>) {
            add_srec(as_text(data), overwrite);
        } else if constexpr (std::is_same_v<T, format::Ihex>) {
            add_ihex(as_text(data), overwrite);
        } else if constexpr (std::is_same_v<T, format::TiTxt>) {
            add_ti_txt(as_text(data), overwrite);
        } else if constexpr (std::is_same_v<T, format::VerilogVmem>) {
            add_verilog_vmem(as_text(data), overwrite);
        } else if constexpr (std::is_same_v<T, format::Binary>) {
            add_binary(data, input.address, overwrite);
        } else {
            add_elf(data, overwrite);
        }
    }, format);
}

void ImageModel::add_srec(std::string_view records, bool overwrite)
{
    srec::read(records, store_, attributes_, overwrite);
}

void ImageModel::add_ihex(std::string_view records, bool overwrite)
{
    ihex::read(records, store_, attributes_, overwrite);
}

void ImageModel::add_ti_txt(std::string_view text, bool overwrite)
{
    ti_txt::read(text, store_, overwrite);
}

void ImageModel::add_verilog_vmem(std::string_view text, bool overwrite)
{
    verilog_vmem::read(text, store_, overwrite);
}

void ImageModel::add_binary(std::span<const uint8_t> data, uint64_t address, bool overwrite)
{
    store_.add(Segment(address * word_size_bytes(), std::vector<uint8_t>(data.begin(), data.end())), overwrite);
}

void ImageModel::add_elf(std::span<const uint8_t> data, bool overwrite)
{
    elf::read(data, store_, attributes_, overwrite);
}

// =============================================================================
// Output
// =============================================================================

std::string ImageModel::as_srec(size_t number_of_data_bytes, unsigned address_length_bits) const
{
    return srec::write(store_, attributes_, number_of_data_bytes, address_length_bits);
}

std::string ImageModel::as_ihex(size_t number_of_data_bytes, unsigned address_length_bits) const
{
    return ihex::write(store_, attributes_, number_of_data_bytes, address_length_bits);
}

std::string ImageModel::as_ti_txt() const
{
    return ti_txt::write(store_);
}

std::string ImageModel::as_verilog_vmem() const
{
    auto header = header_text();

    if (header) {
        return verilog_vmem::write(store_, *header);
    }

    return verilog_vmem::write(store_);
}

std::vector<uint8_t> ImageModel::padding_word(const std::optional<std::vector<uint8_t>>& padding) const
{
    if (!padding) {
        return std::vector<uint8_t>(word_size_bytes(), 0xff);
    }

    if (padding->size() != word_size_bytes()) {
        throw RangeError("padding must be " + std::to_string(word_size_bytes())
                         + " byte(s), but got " + std::to_string(padding->size()));
    }

    return *padding;
}

std::vector<uint8_t> ImageModel::as_binary(std::optional<uint64_t> minimum,
                                           std::optional<uint64_t> maximum,
                                           std::optional<std::vector<uint8_t>> padding) const
{
    const auto padding_bytes = padding_word(padding);

    if (store_.empty()) {
        return {};
    }

    const size_t word_size = word_size_bytes();
    uint64_t current = minimum.value_or(minimum_address());
    const uint64_t end = maximum.value_or(maximum_address());
    std::vector<uint8_t> binary;

    if (current >= end) {
        return binary;
    }

    auto pad = [&](uint64_t words) {
        for (uint64_t i = 0; i < words; ++i) {
            binary.insert(binary.end(), padding_bytes.begin(), padding_bytes.end());
        }
    };

    for (const Segment& segment : store_.segments()) {
        uint64_t address = segment.minimum_address() / word_size;
        std::span<const uint8_t> data(segment.data());
        uint64_t length = data.size() / word_size;

        // Discard data below the window.
        if (address < current) {
            if (address + length <= current) {
                continue;
            }

            data = data.subspan((current - address) * word_size);
            length = data.size() / word_size;
            address = current;
        }

        // Discard data above the window.
        if (address + length > end) {
            if (address < end) {
                data = data.first((end - address) * word_size);
                length = data.size() / word_size;
            } else {
                pad(end - current);
                break;
            }
        }

        pad(address - current);
        binary.insert(binary.end(), data.begin(), data.end());
        current = address + length;
    }

    return binary;
}

std::string ImageModel::as_array(std::optional<uint64_t> minimum,
                                 std::optional<std::vector<uint8_t>> padding,
                                 std::string_view separator) const
{
    const auto binary = as_binary(minimum, std::nullopt, std::move(padding));
    const size_t word_size = word_size_bytes();
    std::ostringstream out;
    out << std::hex << std::setfill('0');

    for (size_t offset = 0; offset < binary.size(); offset += word_size) {
        uint64_t value = 0;

        for (size_t i = offset; i < std::min(offset + word_size, binary.size()); ++i) {
            value = (value << 8) | binary[i];
        }

        if (offset != 0) {
            out << separator;
        }

        out << "0x" << std::setw(static_cast<int>(2 * word_size)) << value;
    }

    return out.str();
}

namespace {

constexpr size_t HEXDUMP_LINE_BYTES = 16;

std::string hexdump_line(uint64_t address, const std::vector<std::optional<uint8_t>>& bytes)
{
    std::ostringstream out;
    out << std::hex << std::setfill('0') << std::setw(8) << address << "  ";

    // Two groups of eight columns.
    for (size_t i = 0; i < HEXDUMP_LINE_BYTES; ++i) {
        if (i == HEXDUMP_LINE_BYTES / 2) {
            out << "  ";
        } else if (i != 0) {
            out << ' ';
        }

        if (bytes[i]) {
            out << std::setw(2) << static_cast<unsigned>(*bytes[i]);
        } else {
            out << "  ";
        }
    }

    out << "  |";

    for (const auto& byte : bytes) {
        if (!byte) {
            out << ' ';
        } else if (*byte == ' ' || (*byte > 0x20 && *byte < 0x7f)) {
            out << static_cast<char>(*byte);
        } else {
            out << '.';
        }
    }

    out << "|\n";

    return out.str();
}

} // namespace

std::string ImageModel::as_hexdump() const
{
    if (store_.empty()) {
        return "\n";
    }

    const size_t word_size = word_size_bytes();

    if (word_size > HEXDUMP_LINE_BYTES) {
        throw RangeError("hexdump supports word sizes up to 128 bits");
    }

    const uint64_t line_words = HEXDUMP_LINE_BYTES / word_size;
    std::string output;
    std::optional<uint64_t> line_address;
    std::vector<std::optional<uint8_t>> line_bytes(HEXDUMP_LINE_BYTES);

    for (const Chunk& chunk : store_.chunks(line_words, line_words)) {
        const uint64_t address = chunk.address - chunk.address % line_words;

        if (line_address != address) {
            if (line_address) {
                output += hexdump_line(*line_address, line_bytes);

                if (address > *line_address + line_words) {
                    output += "...\n";
                }
            }

            line_address = address;
            std::fill(line_bytes.begin(), line_bytes.end(), std::nullopt);
        }

        const size_t offset = (chunk.address - address) * word_size;

        for (size_t i = 0; i < chunk.data.size() && offset + i < HEXDUMP_LINE_BYTES; ++i) {
            line_bytes[offset + i] = chunk.data[i];
        }
    }

    output += hexdump_line(*line_address, line_bytes);

    return output;
}

std::vector<uint8_t> ImageModel::encode(const format::Output& format) const
{
    return std::visit([&](const auto& output) -> std::vector<uint8_t> {
        using T = std::decay_t<decltype(output)>;

        if constexpr (std::is_same_v<T, format::Srec>) {
            return as_bytes(as_srec(output.data_bytes, output.address_length_bits));
        } else if constexpr (std::is_same_v<T, format::Ihex>) {
            return as_bytes(as_ihex(output.data_bytes, output.address_length_bits));
        } else if constexpr (std::is_same_v<T, format::TiTxt>) {
            return as_bytes(as_ti_txt());
        } else if constexpr (std::is_same_v<T, format::VerilogVmem>) {
            return as_bytes(as_verilog_vmem());
        } else if constexpr (std::is_same_v<T, format::Binary>) {
            return as_binary(output.minimum, output.maximum, output.padding);
        } else if constexpr (std::is_same_v<T, format::Hexdump>) {
            return as_bytes(as_hexdump());
        } else {
            return as_bytes(as_array(output.minimum, output.padding, output.separator) + "\n");
        }
    }, format);
}

// =============================================================================
// Editing
// =============================================================================

void ImageModel::fill(std::optional<std::vector<uint8_t>> value, std::optional<uint64_t> max_words)
{
    const auto filler_word = padding_word(value);
    const size_t word_size = word_size_bytes();
    std::vector<Segment> fillers;

    // Collect every gap first; adding fillers while walking would merge them
    // into the segments being walked.
    const auto& segments = store_.segments();

    for (size_t i = 1; i < segments.size(); ++i) {
        const uint64_t gap_start = segments[i - 1].maximum_address();
        const uint64_t gap_words = (segments[i].minimum_address() - gap_start) / word_size;

        if (gap_words == 0 || (max_words && gap_words > *max_words)) {
            continue;
        }

        std::vector<uint8_t> data;
        data.reserve(gap_words * word_size);

        for (uint64_t j = 0; j < gap_words; ++j) {
            data.insert(data.end(), filler_word.begin(), filler_word.end());
        }

        fillers.emplace_back(gap_start, std::move(data));
    }

    for (auto& filler : fillers) {
        store_.add(std::move(filler));
    }
}

void ImageModel::exclude(uint64_t minimum, uint64_t maximum)
{
    if (maximum < minimum) {
        throw RangeError("bad address range");
    }

    store_.remove(byte_address(minimum, word_size_bytes()), byte_address(maximum, word_size_bytes()));
}

void ImageModel::crop(uint64_t minimum, uint64_t maximum)
{
    if (maximum < minimum) {
        throw RangeError("bad address range");
    }

    if (store_.empty()) {
        return;
    }

    const uint64_t store_maximum = store_.maximum_address();
    store_.remove(0, byte_address(minimum, word_size_bytes()));
    store_.remove(byte_address(maximum, word_size_bytes()), store_maximum);
}

uint64_t ImageModel::word(uint64_t address) const
{
    const size_t word_size = word_size_bytes();
    const uint64_t first = address * word_size;
    const auto& segments = store_.segments();

    auto it = std::upper_bound(segments.begin(), segments.end(), first,
                               [](uint64_t value, const Segment& segment) {
                                   return value < segment.maximum_address();
                               });

    if (it == segments.end() || it->minimum_address() > first || it->maximum_address() < first + word_size) {
        throw RangeError("word at address 0x" + hex_field(address, 8) + " is not mapped");
    }

    uint64_t value = 0;
    const size_t offset = first - it->minimum_address();

    for (size_t i = 0; i < word_size; ++i) {
        value = (value << 8) | it->data()[offset + i];
    }

    return value;
}

void ImageModel::set_word(uint64_t address, uint64_t value)
{
    const size_t word_size = word_size_bytes();

    if (word_size < 8 && (value >> (8 * word_size)) != 0) {
        throw RangeError("value 0x" + hex_field(value, 2) + " does not fit in a "
                         + std::to_string(word_size_bits_) + " bits word");
    }

    std::vector<uint8_t> bytes(word_size, 0);

    for (size_t i = 0; i < word_size && i < 8; ++i) {
        bytes[word_size - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
    }

    store_.add(Segment(address * word_size, std::move(bytes)), true);
}

void ImageModel::set_words(uint64_t address, std::span<const uint8_t> data)
{
    if (data.size() % word_size_bytes() != 0) {
        throw RangeError("data size " + std::to_string(data.size())
                         + " is not a multiple of the word size");
    }

    store_.add(Segment(address * word_size_bytes(), std::vector<uint8_t>(data.begin(), data.end())), true);
}

void ImageModel::merge(const ImageModel& other, bool overwrite)
{
    add_srec(other.as_srec(), overwrite);
}

ImageModel& ImageModel::operator+=(const ImageModel& other)
{
    merge(other);
    return *this;
}

// =============================================================================
// Header and queries
// =============================================================================

std::optional<std::string> ImageModel::header_text() const
{
    if (!attributes_.header) {
        return std::nullopt;
    }

    const auto& bytes = *attributes_.header;

    if (header_codec_ == HeaderCodec::NONE) {
        return escape_header(bytes);
    }

    if (!is_valid_utf8(bytes)) {
        throw ParseError("header is not valid UTF-8");
    }

    return std::string(bytes.begin(), bytes.end());
}

void ImageModel::set_header_text(std::string_view text)
{
    if (header_codec_ == HeaderCodec::NONE) {
        attributes_.header = unescape_header(text);
    } else {
        attributes_.header = as_bytes(text);
    }
}

uint64_t ImageModel::minimum_address() const
{
    return store_.minimum_address() / word_size_bytes();
}

uint64_t ImageModel::maximum_address() const
{
    return store_.maximum_address() / word_size_bytes();
}

uint64_t ImageModel::size() const
{
    uint64_t bytes = 0;

    for (const Segment& segment : store_.segments()) {
        bytes += segment.size();
    }

    return bytes / word_size_bytes();
}

} // namespace hexmill
