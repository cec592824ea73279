#include "lexer.hpp"
#include "errors.hpp"
#include <cctype>
#include <cstdlib>
#include <unordered_map>
#include <utility>

const char* token_type_name(TokenType type) {
    switch (type) {
        case TokenType::NUMBER: return "NUMBER";
        case TokenType::STRING: return "STRING";
        case TokenType::IDENTIFIER: return "IDENTIFIER";
        case TokenType::LET: return "LET";
        case TokenType::FN: return "FN";
        case TokenType::RETURN: return "RETURN";
        case TokenType::IF: return "IF";
        case TokenType::ELSE: return "ELSE";
        case TokenType::WHILE: return "WHILE";
        case TokenType::FOR: return "FOR";
        case TokenType::BREAK: return "BREAK";
        case TokenType::CONTINUE: return "CONTINUE";
        case TokenType::PRINT: return "PRINT";
        case TokenType::TRUE: return "TRUE";
        case TokenType::FALSE: return "FALSE";
        case TokenType::NIL: return "NIL";
        case TokenType::LPAREN: return "LPAREN";
        case TokenType::RPAREN: return "RPAREN";
        case TokenType::LBRACE: return "LBRACE";
        case TokenType::RBRACE: return "RBRACE";
        case TokenType::LBRACKET: return "LBRACKET";
        case TokenType::RBRACKET: return "RBRACKET";
        case TokenType::COMMA: return "COMMA";
        case TokenType::SEMICOLON: return "SEMICOLON";
        case TokenType::PLUS: return "PLUS";
        case TokenType::MINUS: return "MINUS";
        case TokenType::STAR: return "STAR";
        case TokenType::SLASH: return "SLASH";
        case TokenType::PERCENT: return "PERCENT";
        case TokenType::ASSIGN: return "ASSIGN";
        case TokenType::EQUAL: return "EQUAL";
        case TokenType::NOT_EQUAL: return "NOT_EQUAL";
        case TokenType::LESS: return "LESS";
        case TokenType::LESS_EQUAL: return "LESS_EQUAL";
        case TokenType::GREATER: return "GREATER";
        case TokenType::GREATER_EQUAL: return "GREATER_EQUAL";
        case TokenType::AND: return "AND";
        case TokenType::OR: return "OR";
        case TokenType::NOT: return "NOT";
        case TokenType::END_OF_FILE: return "EOF";
    }
    return "UNKNOWN";
}

static const std::unordered_map<std::string, TokenType>& keywords() {
    static const std::unordered_map<std::string, TokenType> table = {
        {"let", TokenType::LET},       {"fn", TokenType::FN},
        {"return", TokenType::RETURN}, {"if", TokenType::IF},
        {"else", TokenType::ELSE},     {"while", TokenType::WHILE},
        {"for", TokenType::FOR},       {"break", TokenType::BREAK},
        {"continue", TokenType::CONTINUE},
        {"print", TokenType::PRINT},   {"true", TokenType::TRUE},
        {"false", TokenType::FALSE},   {"nil", TokenType::NIL},
    };
    return table;
}

Lexer::Lexer(std::string source) : src_(std::move(source)) {}

char Lexer::peek(size_t ahead) const {
    return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
}

char Lexer::advance() {
    char c = src_[pos_++];
    if (c == '\n') { ++line_; column_ = 1; }
    else ++column_;
    return c;
}

bool Lexer::match(char expected) {
    if (at_end() || src_[pos_] != expected) return false;
    advance();
    return true;
}

void Lexer::skip_whitespace_and_comments() {
    while (!at_end()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            advance();
        } else if (c == '/' && peek(1) == '/') {
            while (!at_end() && peek() != '\n') advance();
        } else {
            break;
        }
    }
}

Token Lexer::make(TokenType type, std::string text, int line, int column) const {
    Token t;
    t.type = type;
    t.text = std::move(text);
    t.line = line;
    t.column = column;
    return t;
}

TokenList Lexer::tokenize() {
    TokenList out;
    for (;;) {
        skip_whitespace_and_comments();
        int line = line_, column = column_;
        if (at_end()) {
            out.push_back(make(TokenType::END_OF_FILE, "", line, column));
            return out;
        }

        char c = advance();
        if (std::isdigit(static_cast<unsigned char>(c))) {
            out.push_back(scan_number(line, column));
            continue;
        }
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            out.push_back(scan_identifier(line, column));
            continue;
        }
        if (c == '"' || c == '\'') {
            out.push_back(scan_string(c, line, column));
            continue;
        }

        switch (c) {
            case '(': out.push_back(make(TokenType::LPAREN, "(", line, column)); break;
            case ')': out.push_back(make(TokenType::RPAREN, ")", line, column)); break;
            case '{': out.push_back(make(TokenType::LBRACE, "{", line, column)); break;
            case '}': out.push_back(make(TokenType::RBRACE, "}", line, column)); break;
            case '[': out.push_back(make(TokenType::LBRACKET, "[", line, column)); break;
            case ']': out.push_back(make(TokenType::RBRACKET, "]", line, column)); break;
            case ',': out.push_back(make(TokenType::COMMA, ",", line, column)); break;
            case ';': out.push_back(make(TokenType::SEMICOLON, ";", line, column)); break;
            case '+': out.push_back(make(TokenType::PLUS, "+", line, column)); break;
            case '-': out.push_back(make(TokenType::MINUS, "-", line, column)); break;
            case '*': out.push_back(make(TokenType::STAR, "*", line, column)); break;
            case '/': out.push_back(make(TokenType::SLASH, "/", line, column)); break;
            case '%': out.push_back(make(TokenType::PERCENT, "%", line, column)); break;
            case '=':
                if (match('=')) out.push_back(make(TokenType::EQUAL, "==", line, column));
                else out.push_back(make(TokenType::ASSIGN, "=", line, column));
                break;
            case '!':
                if (match('=')) out.push_back(make(TokenType::NOT_EQUAL, "!=", line, column));
                else out.push_back(make(TokenType::NOT, "!", line, column));
                break;
            case '<':
                if (match('=')) out.push_back(make(TokenType::LESS_EQUAL, "<=", line, column));
                else out.push_back(make(TokenType::LESS, "<", line, column));
                break;
            case '>':
                if (match('=')) out.push_back(make(TokenType::GREATER_EQUAL, ">=", line, column));
                else out.push_back(make(TokenType::GREATER, ">", line, column));
                break;
            case '&':
                if (!match('&')) throw PuffingError(ErrorKind::LexerError, "Unexpected character '&' (did you mean '&&'?)", line, column);
                out.push_back(make(TokenType::AND, "&&", line, column));
                break;
            case '|':
                if (!match('|')) throw PuffingError(ErrorKind::LexerError, "Unexpected character '|' (did you mean '||'?)", line, column);
                out.push_back(make(TokenType::OR, "||", line, column));
                break;
            default:
                throw PuffingError(ErrorKind::LexerError, std::string("Unexpected character '") + c + "'", line, column);
        }
    }
}

Token Lexer::scan_number(int line, int column) {
    size_t start = pos_ - 1;
    while (std::isdigit(static_cast<unsigned char>(peek()))) advance();
    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
        advance();
        while (std::isdigit(static_cast<unsigned char>(peek()))) advance();
    }
    if (std::isalpha(static_cast<unsigned char>(peek())) || peek() == '_') {
        throw PuffingError(ErrorKind::LexerError, "Invalid number literal '" + src_.substr(start, pos_ - start + 1) + "'", line, column);
    }
    Token t = make(TokenType::NUMBER, src_.substr(start, pos_ - start), line, column);
    t.number = std::strtod(t.text.c_str(), nullptr);
    return t;
}

Token Lexer::scan_string(char quote, int line, int column) {
    std::string value;
    for (;;) {
        if (at_end() || peek() == '\n') {
            throw PuffingError(ErrorKind::LexerError, "Unterminated string literal", line, column);
        }
        char c = advance();
        if (c == quote) break;
        if (c != '\\') { value.push_back(c); continue; }

        if (at_end()) throw PuffingError(ErrorKind::LexerError, "Unterminated string literal", line, column);
        int esc_line = line_, esc_column = column_ - 1;
        char e = advance();
        switch (e) {
            case 'n': value.push_back('\n'); break;
            case 't': value.push_back('\t'); break;
            case 'r': value.push_back('\r'); break;
            case '0': value.push_back('\0'); break;
            case '\\': value.push_back('\\'); break;
            case '"': value.push_back('"'); break;
            case '\'': value.push_back('\''); break;
            default:
                throw PuffingError(ErrorKind::LexerError, std::string("Invalid escape sequence '\\") + e + "'", esc_line, esc_column);
        }
    }
    return make(TokenType::STRING, std::move(value), line, column);
}

Token Lexer::scan_identifier(int line, int column) {
    size_t start = pos_ - 1;
    while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_') advance();
    std::string word = src_.substr(start, pos_ - start);
    auto it = keywords().find(word);
    return make(it != keywords().end() ? it->second : TokenType::IDENTIFIER, std::move(word), line, column);
}
