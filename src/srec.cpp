#include "srec.hpp"
#include "errors.hpp"
#include "record_codec.hpp"
#include "records.hpp"
#include "string_utils.hpp"

namespace hexmill::srec {

void read(std::string_view records, SegmentStore& store, ImageAttributes& attributes, bool overwrite)
{
    const size_t word_size_bytes = store.word_size_bytes();

    for (std::string_view line : util::split_lines(records)) {
        line = util::trim_view(line);

        if (line.empty()) {
            continue;
        }

        auto record = unpack_srec(line);

        switch (static_cast<RecordType>(record.type)) {
        case RecordType::HEADER:
            attributes.header = std::move(record.data);
            break;
        case RecordType::DATA_16:
        case RecordType::DATA_24:
        case RecordType::DATA_32:
            store.add(Segment(record.address * word_size_bytes, std::move(record.data)), overwrite);
            break;
        case RecordType::START_32:
        case RecordType::START_24:
        case RecordType::START_16:
            attributes.execution_start_address = record.address;
            break;
        case RecordType::COUNT_16:
        case RecordType::COUNT_24:
            break;
        }
    }
}

std::string write(const SegmentStore& store,
                  const ImageAttributes& attributes,
                  size_t number_of_data_bytes,
                  unsigned address_length_bits)
{
    const unsigned type_number = address_length_bits / 8 - 1;

    if (address_length_bits % 8 != 0 || type_number < 1 || type_number > 3) {
        throw RangeError("expected data record type 1..3, but got " + std::to_string(type_number));
    }

    const size_t word_size_bytes = store.word_size_bytes();
    const size_t number_of_data_words = number_of_data_bytes / word_size_bytes;

    if (number_of_data_words == 0) {
        throw RangeError("at least one word of data per record is required");
    }

    const char data_type = static_cast<char>('0' + type_number);
    const uint64_t maximum_address = (uint64_t{1} << address_length_bits) - 1;
    std::vector<std::string> lines;

    if (attributes.header) {
        lines.push_back(pack_srec(static_cast<char>(RecordType::HEADER), 0, *attributes.header));
    }

    size_t number_of_records = 0;

    for (const Chunk& chunk : store.chunks(number_of_data_words)) {
        const uint64_t last_address = chunk.address + (chunk.data.size() - 1) / word_size_bytes;

        if (last_address > maximum_address) {
            throw RangeError("cannot address more than 0x" + hex_field(maximum_address, 2)
                             + " in S" + std::string(1, data_type) + " records ("
                             + std::to_string(address_length_bits) + " bits addresses)");
        }

        lines.push_back(pack_srec(data_type, chunk.address, chunk.data));
        ++number_of_records;
    }

    if (number_of_records <= MAXIMUM_COUNT_16) {
        lines.push_back(pack_srec(static_cast<char>(RecordType::COUNT_16), number_of_records));
    } else if (number_of_records <= MAXIMUM_COUNT_24) {
        lines.push_back(pack_srec(static_cast<char>(RecordType::COUNT_24), number_of_records));
    } else {
        throw RangeError("too many records: " + std::to_string(number_of_records));
    }

    if (attributes.execution_start_address) {
        RecordType start_type = RecordType::START_32;

        if (data_type == static_cast<char>(RecordType::DATA_16)) {
            start_type = RecordType::START_16;
        } else if (data_type == static_cast<char>(RecordType::DATA_24)) {
            start_type = RecordType::START_24;
        }

        lines.push_back(pack_srec(static_cast<char>(start_type), *attributes.execution_start_address));
    }

    std::string output;

    for (const auto& line : lines) {
        output += line;
        output += '\n';
    }

    return output;
}

} // namespace hexmill::srec
