#include "cli_formats.hpp"
#include "errors.hpp"
#include "string_utils.hpp"
#include <cctype>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace hexmill::cli {

uint64_t parse_number(std::string_view text)
{
    std::string_view sv = util::trim_view(text);
    int base = 10;
    std::size_t start = 0;

    if (sv.size() > 1 && sv[0] == '0')
    {
        char p = sv[1];
        if (p == 'x' || p == 'X')
        {
            base = 16;
            start = 2;
        }
        else if (p == 'b' || p == 'B')
        {
            base = 2;
            start = 2;
        }
        else if (p == 'o' || p == 'O')
        {
            base = 8;
            start = 2;
        }
    }

    std::string clean;
    clean.reserve(sv.size() - start);
    for (std::size_t i = start; i < sv.size(); ++i)
    {
        char c = sv[i];
        if (c != '_')
            clean.push_back(c);
    }

    // stoull accepts a sign and leading blanks, a literal does not.
    if (clean.empty() || !std::isalnum(static_cast<unsigned char>(clean.front())))
    {
        throw ParseError("invalid number '" + std::string(text) + "'");
    }

    std::size_t pos = 0;
    try
    {
        uint64_t value = std::stoull(clean, &pos, base);
        if (pos != clean.size())
            throw ParseError("invalid number '" + std::string(text) + "'");
        return value;
    }
    catch (const std::logic_error&)
    {
        throw ParseError("invalid number '" + std::string(text) + "'");
    }
}

namespace {

std::vector<std::string_view> fields_of(std::string_view text, size_t maximum_fields)
{
    auto fields = util::split(text, ',');

    if (fields.size() > maximum_fields) {
        throw ParseError("too many options in format '" + std::string(text) + "'");
    }

    return fields;
}

template <typename Records>
Records parse_record_options(const std::vector<std::string_view>& fields)
{
    Records records;

    if (fields.size() > 1) {
        records.data_bytes = parse_number(fields[1]);
    }

    if (fields.size() > 2) {
        records.address_length_bits = static_cast<unsigned>(parse_number(fields[2]));
    }

    return records;
}

} // namespace

std::optional<format::Input> parse_input_format(std::string_view text)
{
    auto fields = fields_of(text, 2);
    const std::string name = util::to_lower(util::trim_view(fields[0]));

    if (name == "binary") {
        format::Binary binary;
        if (fields.size() > 1) {
            binary.address = parse_number(fields[1]);
        }
        return binary;
    }

    if (fields.size() > 1) {
        throw ParseError("input format '" + name + "' takes no options");
    }

    if (name == "auto")         return std::nullopt;
    if (name == "srec")         return format::Srec{};
    if (name == "ihex")         return format::Ihex{};
    if (name == "ti_txt")       return format::TiTxt{};
    if (name == "verilog_vmem") return format::VerilogVmem{};
    if (name == "elf")          return format::Elf{};

    throw ParseError("unsupported input format '" + std::string(text) + "'");
}

format::Output parse_output_format(std::string_view text)
{
    auto fields = fields_of(text, 3);
    const std::string name = util::to_lower(util::trim_view(fields[0]));

    if (name == "srec") return parse_record_options<format::Srec>(fields);
    if (name == "ihex") return parse_record_options<format::Ihex>(fields);

    if (name == "binary") {
        format::Binary binary;
        if (fields.size() > 1 && !fields[1].empty()) {
            binary.minimum = parse_number(fields[1]);
        }
        if (fields.size() > 2 && !fields[2].empty()) {
            binary.maximum = parse_number(fields[2]);
        }
        return binary;
    }

    if (fields.size() > 1) {
        throw ParseError("output format '" + name + "' takes no options");
    }

    if (name == "ti_txt")       return format::TiTxt{};
    if (name == "verilog_vmem") return format::VerilogVmem{};
    if (name == "hexdump")      return format::Hexdump{};
    if (name == "array")        return format::Array{};

    throw ParseError("unsupported output format '" + std::string(text) + "'");
}

HeaderCodec parse_header_encoding(std::string_view text)
{
    const std::string name = util::to_lower(util::trim_view(text));

    if (name == "utf-8" || name == "utf8") return HeaderCodec::UTF8;
    if (name == "none")                    return HeaderCodec::NONE;

    throw ParseError("unsupported header encoding '" + std::string(text) + "'");
}

std::vector<uint8_t> word_bytes(uint64_t value, size_t word_size_bytes)
{
    if (word_size_bytes < 8 && (value >> (8 * word_size_bytes)) != 0) {
        throw RangeError("value " + std::to_string(value) + " does not fit in "
                         + std::to_string(word_size_bytes) + " byte(s)");
    }

    std::vector<uint8_t> bytes(word_size_bytes, 0);

    for (size_t i = 0; i < word_size_bytes && i < 8; ++i) {
        bytes[word_size_bytes - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
    }

    return bytes;
}

format::Output output_for(const format::Input& input)
{
    return std::visit([](const auto& alternative) -> format::Output {
        using T = std::decay_t<decltype(alternative)>;

        if constexpr (std::is_same_v<T, format::Elf>) {
            throw UnsupportedFileFormatError();
        } else if constexpr (std::is_same_v<T, format::Binary>) {
            return format::Binary{};
        } else {
            return alternative;
        }
    }, input);
}

} // namespace hexmill::cli
