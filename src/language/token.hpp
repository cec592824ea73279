#pragma once
#include <string>
#include <vector>

enum class TokenType {
    // literals
    NUMBER, STRING, IDENTIFIER,
    // keywords
    LET, FN, RETURN, IF, ELSE, WHILE, FOR, BREAK, CONTINUE, PRINT, TRUE, FALSE, NIL,
    // punctuation
    LPAREN, RPAREN, LBRACE, RBRACE, LBRACKET, RBRACKET, COMMA, SEMICOLON,
    // operators
    PLUS, MINUS, STAR, SLASH, PERCENT,
    ASSIGN, EQUAL, NOT_EQUAL, LESS, LESS_EQUAL, GREATER, GREATER_EQUAL,
    AND, OR, NOT,
    END_OF_FILE,
};

const char* token_type_name(TokenType type);

struct Token {
    TokenType type{TokenType::END_OF_FILE};
    std::string text;   // lexeme, or the unescaped contents for STRING
    double number{0.0}; // only meaningful for NUMBER
    int line{1};
    int column{1};
};

using TokenList = std::vector<Token>;
