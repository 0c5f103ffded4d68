#include "ti_txt.hpp"
#include "errors.hpp"
#include "record_codec.hpp"
#include "records.hpp"
#include "string_utils.hpp"
#include <algorithm>
#include <charconv>
#include <iomanip>
#include <optional>
#include <sstream>

namespace hexmill::ti_txt {

namespace {

uint64_t parse_section_address(std::string_view digits)
{
    uint64_t value = 0;
    const char* first = digits.data();
    const char* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(first, last, value, 16);

    if (digits.empty() || ec != std::errc() || ptr != last) {
        throw ParseError("bad section address");
    }

    return value;
}

std::vector<uint8_t> parse_data_line(std::string_view line)
{
    std::string digits;
    digits.reserve(line.size());

    for (char ch : line) {
        if (ch != ' ') {
            digits += ch;
        }
    }

    try {
        return unhexlify(digits);
    } catch (const ParseError&) {
        throw ParseError("bad data");
    }
}

} // namespace

void read(std::string_view text, SegmentStore& store, bool overwrite)
{
    std::optional<uint64_t> address;
    bool eof_found = false;

    for (std::string_view line : util::split_lines(text)) {
        if (eof_found) {
            throw ParseError("bad file terminator");
        }

        line = util::trim_view(line);

        if (line.empty()) {
            throw ParseError("bad line length");
        }

        if (line.front() == TERMINATOR) {
            eof_found = true;
        } else if (line.front() == ADDRESS_MARKER) {
            address = parse_section_address(line.substr(1));
        } else {
            auto data = parse_data_line(line);
            const size_t size = data.size();

            if (size > BYTES_PER_LINE) {
                throw ParseError("bad line length");
            }

            if (!address) {
                throw ParseError("missing section address");
            }

            store.add(Segment(*address, std::move(data)), overwrite);

            // A short line ends the section.
            if (size == BYTES_PER_LINE) {
                *address += size;
            } else {
                address.reset();
            }
        }
    }

    if (!eof_found) {
        throw ParseError("missing file terminator");
    }
}

std::string write(const SegmentStore& store)
{
    std::ostringstream out;
    out << std::uppercase << std::hex << std::setfill('0');

    for (const Segment& segment : store.segments()) {
        out << ADDRESS_MARKER << std::setw(4) << segment.minimum_address() << '\n';

        const auto& data = segment.data();

        for (size_t offset = 0; offset < data.size(); offset += BYTES_PER_LINE) {
            const size_t end = std::min(offset + BYTES_PER_LINE, data.size());

            for (size_t i = offset; i < end; ++i) {
                if (i != offset) {
                    out << ' ';
                }
                out << std::setw(2) << static_cast<unsigned>(data[i]);
            }

            out << '\n';
        }
    }

    out << TERMINATOR << '\n';

    return out.str();
}

} // namespace hexmill::ti_txt
