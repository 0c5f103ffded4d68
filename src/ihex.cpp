#include "ihex.hpp"
#include "errors.hpp"
#include "record_codec.hpp"
#include "records.hpp"
#include "string_utils.hpp"
#include <algorithm>
#include <array>

namespace hexmill::ihex {

namespace {

uint64_t big_endian_value(const std::vector<uint8_t>& data)
{
    uint64_t value = 0;

    for (uint8_t byte : data) {
        value = (value << 8) | byte;
    }

    return value;
}

void expect_size(const IhexRecord& record, size_t size, std::string_view line)
{
    if (record.data.size() != size) {
        throw ParseError("expected " + std::to_string(size) + " data bytes in record "
                         + std::string(line) + ", but got " + std::to_string(record.data.size()));
    }
}

/**
 * @brief Stateful record emitter
 *
 * Keeps the extended address register last written to the output and only
 * emits a new 02/04 record when a data record needs different upper bits.
 * Data arrives in ascending address order, so the register only grows.
 */
class RecordEmitter
{
    unsigned addressLengthBits;
    size_t wordSizeBytes;
    uint64_t extendedSegmentAddress = 0;
    uint64_t extendedLinearAddress = 0;
    std::string output;

    void emit(RecordType type, uint32_t address, std::span<const uint8_t> data = {}) {
        output += pack_ihex(static_cast<uint8_t>(type), address, data);
        output += '\n';
    }

    void emitRegister(RecordType type, uint64_t value) {
        const std::array<uint8_t, EXTENDED_ADDRESS_SIZE> bytes{
            static_cast<uint8_t>(value >> 8),
            static_cast<uint8_t>(value),
        };
        emit(type, 0, bytes);
    }

    uint64_t maximumAddress() const {
        switch (addressLengthBits) {
            case 16: return MAXIMUM_ADDRESS_16;
            case 24: return MAXIMUM_ADDRESS_24;
            default: return MAXIMUM_ADDRESS_32;
        }
    }

    std::string rangeMessage() const {
        switch (addressLengthBits) {
            case 16: return "cannot address more than 64 kB in I8HEX files (16 bits addresses)";
            case 24: return "cannot address more than 1 MB in I16HEX files (20 bits addresses)";
            default: return "cannot address more than 4 GB in I32HEX files (32 bits addresses)";
        }
    }

    // `data` never crosses a 64 K-word boundary here.
    void emitPiece(uint64_t address, std::span<const uint8_t> data) {
        switch (addressLengthBits) {
        case 16:
            emit(RecordType::DATA, static_cast<uint32_t>(address), data);
            break;
        case 24: {
            const uint64_t segment = std::min<uint64_t>(0x1000 * (address >> 16), 0xffff);

            if (segment != extendedSegmentAddress) {
                extendedSegmentAddress = segment;
                emitRegister(RecordType::EXTENDED_SEGMENT_ADDRESS, segment);
            }

            emit(RecordType::DATA, static_cast<uint32_t>(address - SEGMENT_ADDRESS_SCALE * segment), data);
            break;
        }
        default: {
            const uint64_t upper = address >> 16;

            if (upper != extendedLinearAddress) {
                extendedLinearAddress = upper;
                emitRegister(RecordType::EXTENDED_LINEAR_ADDRESS, upper);
            }

            emit(RecordType::DATA, static_cast<uint32_t>(address & 0xffff), data);
            break;
        }
        }
    }

public:
    RecordEmitter(unsigned address_length_bits, size_t word_size_bytes)
        : addressLengthBits(address_length_bits), wordSizeBytes(word_size_bytes) {}

    void emitData(uint64_t address, std::span<const uint8_t> data) {
        const uint64_t words = (data.size() + wordSizeBytes - 1) / wordSizeBytes;

        if (address + words - 1 > maximumAddress()) {
            throw RangeError(rangeMessage());
        }

        size_t offset = 0;

        while (offset < data.size()) {
            const uint64_t pieceAddress = address + offset / wordSizeBytes;
            const uint64_t blockEnd = (pieceAddress | 0xffff) + 1;
            const size_t pieceBytes = static_cast<size_t>(
                std::min<uint64_t>((blockEnd - pieceAddress) * wordSizeBytes, data.size() - offset));

            emitPiece(pieceAddress, data.subspan(offset, pieceBytes));
            offset += pieceBytes;
        }
    }

    void emitStartAddress(uint64_t address) {
        if (address > 0xffffffff) {
            throw RangeError("execution start address 0x" + hex_field(address, 8) + " does not fit in 32 bits");
        }

        const std::array<uint8_t, START_ADDRESS_SIZE> bytes{
            static_cast<uint8_t>(address >> 24),
            static_cast<uint8_t>(address >> 16),
            static_cast<uint8_t>(address >> 8),
            static_cast<uint8_t>(address),
        };

        if (addressLengthBits == 24) {
            emit(RecordType::START_SEGMENT_ADDRESS, 0, bytes);
        } else if (addressLengthBits == 32) {
            emit(RecordType::START_LINEAR_ADDRESS, 0, bytes);
        }
    }

    std::string finish() {
        emit(RecordType::END_OF_FILE, 0);
        return std::move(output);
    }
};

} // namespace

void read(std::string_view records, SegmentStore& store, ImageAttributes& attributes, bool overwrite)
{
    const size_t word_size_bytes = store.word_size_bytes();
    uint64_t extended_segment_address = 0;
    uint64_t extended_linear_address = 0;

    for (std::string_view line : util::split_lines(records)) {
        line = util::trim_view(line);

        if (line.empty()) {
            continue;
        }

        auto record = unpack_ihex(line);

        switch (static_cast<RecordType>(record.type)) {
        case RecordType::DATA: {
            const uint64_t address =
                (record.address + extended_segment_address + extended_linear_address) * word_size_bytes;
            store.add(Segment(address, std::move(record.data)), overwrite);
            break;
        }
        case RecordType::END_OF_FILE:
            return;
        case RecordType::EXTENDED_SEGMENT_ADDRESS:
            expect_size(record, EXTENDED_ADDRESS_SIZE, line);
            extended_segment_address = big_endian_value(record.data) * SEGMENT_ADDRESS_SCALE;
            break;
        case RecordType::EXTENDED_LINEAR_ADDRESS:
            expect_size(record, EXTENDED_ADDRESS_SIZE, line);
            extended_linear_address = big_endian_value(record.data) * LINEAR_ADDRESS_SCALE;
            break;
        case RecordType::START_SEGMENT_ADDRESS:
        case RecordType::START_LINEAR_ADDRESS:
            expect_size(record, START_ADDRESS_SIZE, line);
            attributes.execution_start_address = big_endian_value(record.data);
            break;
        default:
            throw ParseError("expected type 0..5 in record " + std::string(line)
                             + ", but got " + std::to_string(record.type));
        }
    }
}

std::string write(const SegmentStore& store,
                  const ImageAttributes& attributes,
                  size_t number_of_data_bytes,
                  unsigned address_length_bits)
{
    if (address_length_bits != 16 && address_length_bits != 24 && address_length_bits != 32) {
        throw RangeError("expected address length 16, 24 or 32, but got "
                         + std::to_string(address_length_bits));
    }

    const size_t word_size_bytes = store.word_size_bytes();
    const size_t number_of_data_words = std::min(number_of_data_bytes, MAXIMUM_DATA_BYTES) / word_size_bytes;

    if (number_of_data_words == 0) {
        throw RangeError("at least one word of data per record is required");
    }

    RecordEmitter emitter(address_length_bits, word_size_bytes);

    for (const Chunk& chunk : store.chunks(number_of_data_words)) {
        emitter.emitData(chunk.address, chunk.data);
    }

    if (attributes.execution_start_address) {
        emitter.emitStartAddress(*attributes.execution_start_address);
    }

    return emitter.finish();
}

} // namespace hexmill::ihex
