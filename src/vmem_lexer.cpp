#include "vmem_lexer.hpp"
#include "errors.hpp"
#include <cctype>

namespace hexmill::vmem {

std::string Token::to_string() const {
    switch (type) {
        case Type::ADDRESS: return "ADDRESS(" + std::string(value) + ")";
        case Type::WORD:    return "WORD(" + std::string(value) + ")";
        case Type::STRING:  return "STRING(" + std::string(value) + ")";
        case Type::END:     return "END";
    }
    return "?";
}

bool Lexer::at_comment() const {
    std::string_view rest = source.substr(cursor);
    return rest.starts_with("//") || rest.starts_with("/*");
}

void Lexer::skip_whitespace_and_comments() {
    while (!is_eof()) {
        std::string_view rest = source.substr(cursor);

        if (std::isspace(static_cast<unsigned char>(peek()))) {
            advance();
        } else if (rest.starts_with("//")) {
            while (!is_eof() && peek() != '\n') advance();
        } else if (rest.starts_with("/*")) {
            size_t end = rest.find("*/", 2);
            if (end == std::string_view::npos) {
                throw ParseError("unterminated comment at offset " + std::to_string(cursor));
            }
            cursor += end + 2;
        } else {
            break;
        }
    }
}

void Lexer::scan_literal(std::vector<Token>& tokens) {
    const size_t start = cursor;
    const char quote = peek();
    advance(); // opening quote

    while (!is_eof() && peek() != quote) {
        if (peek() == '\\') advance();
        advance();
    }

    if (is_eof()) {
        throw ParseError("unterminated literal at offset " + std::to_string(start));
    }

    tokens.push_back({Type::STRING, source.substr(start + 1, cursor - start - 1)});
    advance(); // closing quote
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;

    while (true) {
        skip_whitespace_and_comments();
        if (is_eof()) break;

        char c = peek();

        if (c == '"' || c == '\'') {
            scan_literal(tokens);
            continue;
        }

        Type type = Type::WORD;
        if (c == '@') {
            type = Type::ADDRESS;
            advance();
        }

        size_t start = cursor;
        while (!is_eof()
               && !std::isspace(static_cast<unsigned char>(peek()))
               && peek() != '"' && peek() != '\''
               && !at_comment()) {
            advance();
        }

        tokens.push_back({type, source.substr(start, cursor - start)});
    }

    tokens.push_back({Type::END, ""});
    return tokens;
}

} // namespace hexmill::vmem
