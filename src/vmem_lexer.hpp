#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace hexmill::vmem {

enum class Type
{
    ADDRESS, // "@" followed by the address digits
    WORD,
    STRING,  // string or character literal, quotes stripped
    END = -1,
};

struct Token
{
    Type type;
    std::string_view value;
    std::string to_string() const;
};

class Lexer
{
    std::string_view source;
    size_t cursor = 0;

public:
    explicit Lexer(std::string_view src) : source(src) {}

    // Throws ParseError on an unterminated block comment or literal.
    std::vector<Token> tokenize();

private:
    void skip_whitespace_and_comments();
    bool at_comment() const;
    void scan_literal(std::vector<Token>& tokens);
    constexpr bool is_eof() const { return cursor >= source.length(); }
    constexpr char peek() const { return is_eof() ? '\0' : source[cursor]; }
    constexpr void advance() { cursor++; }
};

} // namespace hexmill::vmem
