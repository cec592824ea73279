#pragma once
#include "token.hpp"
#include <string>

// Turns Puffing source text into tokens. Throws PuffingError(LexerError) on
// characters or literals it cannot scan.
class Lexer {
public:
    explicit Lexer(std::string source);

    TokenList tokenize();

private:
    bool at_end() const { return pos_ >= src_.size(); }
    char peek(size_t ahead = 0) const;
    char advance();
    bool match(char expected);

    void skip_whitespace_and_comments();
    Token make(TokenType type, std::string text, int line, int column) const;
    Token scan_number(int line, int column);
    Token scan_string(char quote, int line, int column);
    Token scan_identifier(int line, int column);

    std::string src_;
    size_t pos_{0};
    int line_{1};
    int column_{1};
};
