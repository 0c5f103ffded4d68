#include "summary.hpp"
#include <algorithm>
#include <array>
#include <cstdio>
#include <sstream>

namespace hexmill {

namespace {

std::string format_address(const char* format, uint64_t address)
{
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), format, static_cast<unsigned long long>(address));
    return buffer;
}

// Number of words of [minimum, maximum) holding data.
uint64_t mapped_words(const ImageModel& image, uint64_t minimum, uint64_t maximum)
{
    const uint64_t word_size = image.word_size_bytes();
    uint64_t words = 0;

    for (const Segment& segment : image.segments()) {
        const uint64_t first = std::max(segment.minimum_address() / word_size, minimum);
        const uint64_t last = std::min(segment.maximum_address() / word_size, maximum);

        if (first < last) {
            words += last - first;
        }
    }

    return words;
}

} // namespace

std::string format_size(uint64_t bytes)
{
    static constexpr std::array<const char*, 4> units{"KiB", "MiB", "GiB", "TiB"};

    for (size_t i = units.size(); i-- > 0;) {
        const uint64_t divider = uint64_t{1} << (10 * (i + 1));

        if (bytes >= divider) {
            char buffer[32];
            std::snprintf(buffer, sizeof(buffer), "%.2f", static_cast<double>(bytes) / static_cast<double>(divider));
            std::string number(buffer);

            number.erase(number.find_last_not_of('0') + 1);
            if (number.back() == '.') {
                number.pop_back();
            }

            return number + " " + units[i];
        }
    }

    return std::to_string(bytes) + (bytes == 1 ? " byte" : " bytes");
}

std::string info(const ImageModel& image)
{
    std::ostringstream out;

    if (auto header = image.header_text()) {
        out << "Header:                  \"" << *header << "\"\n";
    }

    if (auto address = image.execution_start_address()) {
        out << "Execution start address: " << format_address("0x%08llx", *address) << '\n';
    }

    out << "Data ranges:\n\n";

    const uint64_t word_size = image.word_size_bytes();

    for (const Segment& segment : image.segments()) {
        const uint64_t minimum = segment.minimum_address() / word_size;
        const uint64_t maximum = minimum + segment.size() / word_size;

        out << "    " << format_address("0x%08llx", minimum)
            << " - " << format_address("0x%08llx", maximum)
            << " (" << format_size(segment.size()) << ")\n";
    }

    return out.str();
}

std::string layout(const ImageModel& image)
{
    if (image.empty()) {
        return "";
    }

    const uint64_t minimum = image.minimum_address();
    const uint64_t maximum = image.maximum_address();
    const uint64_t size = maximum - minimum;
    const uint64_t width = std::min<uint64_t>(80, size);

    if (width == 0) {
        return "";
    }

    const uint64_t slice = size / width;

    const std::string left = format_address("0x%llx", minimum);
    const std::string right = format_address("0x%llx", maximum);
    const uint64_t used = left.size() + right.size();

    std::string output = left + std::string(width > used ? width - used : 0, ' ') + right + "\n";
    uint64_t address = minimum;

    for (uint64_t i = 0; i < width; ++i) {
        const uint64_t end = (i < width - 1) ? address + slice : maximum;
        const uint64_t words = mapped_words(image, address, end);

        if (words == 0) {
            output += ' ';
        } else if (words != end - address) {
            output += '-';
        } else {
            output += '=';
        }

        address += slice;
    }

    return output + "\n";
}

} // namespace hexmill
