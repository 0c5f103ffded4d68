#include "verilog_vmem.hpp"
#include "errors.hpp"
#include "record_codec.hpp"
#include "vmem_lexer.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace hexmill::verilog_vmem {

namespace {

bool is_hex(std::string_view value)
{
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isxdigit(ch) != 0;
    });
}

// Breaks up every "*/" so the text cannot close the header comment early.
std::string comment_text(std::string_view text)
{
    std::string result(text);

    for (size_t position = result.find("*/"); position != std::string::npos;
         position = result.find("*/", position + 2)) {
        result.insert(position + 1, 1, ' ');
    }

    return result;
}

// Word width in bytes shared by every data word of the file.
size_t detect_word_width(const std::vector<vmem::Token>& tokens)
{
    size_t digits = 0;

    for (const auto& token : tokens) {
        if (token.type != vmem::Type::WORD) {
            continue;
        }

        const size_t length = token.value.size();

        if (length == 0 || length % 2 != 0) {
            throw ParseError("invalid word length");
        }

        if (digits == 0) {
            digits = length;
        } else if (digits != length) {
            throw ParseError("mixed word lengths " + std::to_string(digits)
                             + " and " + std::to_string(length));
        }
    }

    return digits / 2;
}

class Parser
{
    const std::vector<vmem::Token>& tokens;
    size_t position = 0;
    size_t wordWidth;
    SegmentStore& store;
    bool overwrite;

    uint64_t address = 0;         // word address of `pending`
    std::vector<uint8_t> pending; // consecutive words not yet stored

    const vmem::Token& current() const { return tokens[position]; }

    void flush() {
        if (pending.empty()) {
            return;
        }

        const uint64_t words = pending.size() / wordWidth;
        store.add(Segment(address * wordWidth, std::move(pending)), overwrite);
        pending.clear();
        address += words;
    }

    void parseAddress() {
        std::string_view digits = current().value;
        uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, 16);

        if (!is_hex(digits) || ec != std::errc() || ptr != digits.data() + digits.size()) {
            throw ParseError("bad address '@" + std::string(digits) + "'");
        }

        flush();
        address = value;
        position++;
    }

    void parseWord() {
        auto bytes = unhexlify(current().value);
        pending.insert(pending.end(), bytes.begin(), bytes.end());
        position++;
    }

public:
    Parser(const std::vector<vmem::Token>& toks, SegmentStore& target, bool overwrite_data)
        : tokens(toks), wordWidth(detect_word_width(toks)), store(target), overwrite(overwrite_data) {}

    void parse() {
        while (current().type != vmem::Type::END) {
            switch (current().type) {
                case vmem::Type::ADDRESS: parseAddress(); break;
                case vmem::Type::WORD:    parseWord(); break;
                default:
                    throw ParseError("unexpected token " + current().to_string());
            }
        }

        flush();
    }
};

} // namespace

void read(std::string_view text, SegmentStore& store, bool overwrite)
{
    const auto tokens = vmem::Lexer(text).tokenize();
    Parser(tokens, store, overwrite).parse();
}

std::string write(const SegmentStore& store, std::optional<std::string_view> header)
{
    const size_t word_size_bytes = store.word_size_bytes();
    const size_t words_per_line = std::max<size_t>(1, 32 / word_size_bytes);
    std::ostringstream out;

    if (header) {
        out << "/* " << comment_text(*header) << " */\n";
    }

    for (const Chunk& chunk : store.chunks(words_per_line)) {
        out << '@' << hex_field(chunk.address, 8);

        for (size_t offset = 0; offset < chunk.data.size(); offset += word_size_bytes) {
            out << ' ' << hexlify(chunk.data.subspan(offset, std::min(word_size_bytes, chunk.data.size() - offset)));
        }

        out << '\n';
    }

    return out.str();
}

bool looks_like(std::string_view text)
{
    std::vector<vmem::Token> tokens;

    try {
        tokens = vmem::Lexer(text).tokenize();
    } catch (const ParseError&) {
        return false;
    }

    bool has_word = false;

    for (const auto& token : tokens) {
        switch (token.type) {
            case vmem::Type::ADDRESS:
                if (!is_hex(token.value)) return false;
                break;
            case vmem::Type::WORD:
                if (!is_hex(token.value)) return false;
                has_word = true;
                break;
            case vmem::Type::STRING:
                return false;
            case vmem::Type::END:
                break;
        }
    }

    return has_word;
}

} // namespace hexmill::verilog_vmem
