#include "elf_image.hpp"
#include "errors.hpp"
#include <LIEF/ELF.hpp>
#include <memory>
#include <optional>
#include <vector>

namespace hexmill::elf {

namespace {

std::optional<uint64_t> physical_address(const LIEF::ELF::Binary& binary, const LIEF::ELF::Section& section)
{
    for (const LIEF::ELF::Segment& segment : binary.segments()) {
        if (!segment.is_load() || section.virtual_address() < segment.virtual_address()) {
            continue;
        }

        const uint64_t offset = section.virtual_address() - segment.virtual_address();

        if (offset <= segment.virtual_size() && section.size() <= segment.virtual_size() - offset) {
            return segment.physical_address() + offset;
        }
    }

    return std::nullopt;
}

} // namespace

bool is_elf(std::span<const uint8_t> image)
{
    return LIEF::ELF::is_elf(std::vector<uint8_t>(image.begin(), image.end()));
}

void read(std::span<const uint8_t> image, SegmentStore& store, ImageAttributes& attributes, bool overwrite)
{
    std::vector<uint8_t> raw(image.begin(), image.end());

    if (!LIEF::ELF::is_elf(raw)) {
        throw ParseError("bad ELF magic");
    }

    std::unique_ptr<LIEF::ELF::Binary> binary = LIEF::ELF::Parser::parse(raw);
    if (!binary) {
        throw ParseError("failed to parse ELF file");
    }

    for (const LIEF::ELF::Section& section : binary->sections()) {
        if (!section.has(LIEF::ELF::Section::FLAGS::ALLOC)
            || section.type() == LIEF::ELF::Section::TYPE::NOBITS
            || section.size() == 0) {
            continue;
        }

        auto address = physical_address(*binary, section);
        if (!address) {
            continue;
        }

        auto content = section.content();
        store.add(Segment(*address, std::vector<uint8_t>(content.begin(), content.end())), overwrite);
    }

    attributes.execution_start_address = binary->entrypoint();
}

} // namespace hexmill::elf
