#include "format.hpp"
#include "elf_image.hpp"
#include "errors.hpp"
#include "record_codec.hpp"
#include "records.hpp"
#include "string_utils.hpp"
#include "verilog_vmem.hpp"
#include <type_traits>

namespace hexmill::format {

namespace {

template <typename Unpack>
bool unpacks(Unpack&& unpack, std::string_view line)
{
    try {
        unpack(line);
        return true;
    } catch (const Error&) {
        return false;
    }
}

template <typename Format>
std::string format_name(const Format& format)
{
    return std::visit([](const auto& alternative) -> std::string {
        using T = std::decay_t<decltype(alternative)>;

        if constexpr (std::is_same_v<T, Srec>) return "srec";
        else if constexpr (std::is_same_v<T, Ihex>) return "ihex";
        else if constexpr (std::is_same_v<T, TiTxt>) return "ti_txt";
        else if constexpr (std::is_same_v<T, VerilogVmem>) return "verilog_vmem";
        else if constexpr (std::is_same_v<T, Binary>) return "binary";
        else if constexpr (std::is_same_v<T, Elf>) return "elf";
        else if constexpr (std::is_same_v<T, Hexdump>) return "hexdump";
        else return "array";
    }, format);
}

} // namespace

Input detect_format(std::span<const uint8_t> data)
{
    if (elf::is_elf(data)) {
        return Elf{};
    }

    return detect_format(std::string_view(reinterpret_cast<const char*>(data.data()), data.size()));
}

Input detect_format(std::string_view text)
{
    std::vector<std::string_view> lines;

    for (std::string_view line : util::split_lines(text)) {
        line = util::trim_view(line);
        if (!line.empty()) {
            lines.push_back(line);
        }
    }

    if (lines.empty()) {
        throw UnsupportedFileFormatError();
    }

    const std::string_view first = lines.front();

    if (unpacks(unpack_srec, first)) {
        return Srec{};
    }

    if (unpacks(unpack_ihex, first)) {
        return Ihex{};
    }

    if (first.front() == ti_txt::ADDRESS_MARKER
        && lines.back() == std::string_view(&ti_txt::TERMINATOR, 1)) {
        return TiTxt{};
    }

    if (verilog_vmem::looks_like(text)) {
        return VerilogVmem{};
    }

    throw UnsupportedFileFormatError();
}

std::string name(const Input& format)
{
    return format_name(format);
}

std::string name(const Output& format)
{
    return format_name(format);
}

} // namespace hexmill::format
