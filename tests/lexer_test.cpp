#include <gtest/gtest.h>
#include "language/errors.hpp"
#include "language/lexer.hpp"

static TokenList lex(const std::string& src) {
    Lexer lexer(src);
    return lexer.tokenize();
}

TEST(LexerTest, EmptySourceYieldsOnlyEof) {
    TokenList tokens = lex("");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, TokenType::END_OF_FILE);
    EXPECT_STREQ(token_type_name(tokens[0].type), "EOF");
}

TEST(LexerTest, PrintStatementTokens) {
    TokenList tokens = lex("print(\"hi\");");
    ASSERT_EQ(tokens.size(), 6u);
    EXPECT_EQ(tokens[0].type, TokenType::PRINT);
    EXPECT_EQ(tokens[1].type, TokenType::LPAREN);
    EXPECT_EQ(tokens[2].type, TokenType::STRING);
    EXPECT_EQ(tokens[2].text, "hi");
    EXPECT_EQ(tokens[3].type, TokenType::RPAREN);
    EXPECT_EQ(tokens[4].type, TokenType::SEMICOLON);
    EXPECT_EQ(tokens[5].type, TokenType::END_OF_FILE);
}

TEST(LexerTest, NumbersAndOperators) {
    TokenList tokens = lex("1 + 2.5 <= 3 != 4 && !x || y == z");
    std::vector<TokenType> expected = {
        TokenType::NUMBER, TokenType::PLUS, TokenType::NUMBER, TokenType::LESS_EQUAL,
        TokenType::NUMBER, TokenType::NOT_EQUAL, TokenType::NUMBER, TokenType::AND,
        TokenType::NOT, TokenType::IDENTIFIER, TokenType::OR, TokenType::IDENTIFIER,
        TokenType::EQUAL, TokenType::IDENTIFIER, TokenType::END_OF_FILE,
    };
    ASSERT_EQ(tokens.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(tokens[i].type, expected[i]) << "token " << i;
    }
    EXPECT_DOUBLE_EQ(tokens[2].number, 2.5);
}

TEST(LexerTest, KeywordsAreRecognised) {
    TokenList tokens = lex("let fn return if else while for break continue true false nil letter");
    EXPECT_EQ(tokens[0].type, TokenType::LET);
    EXPECT_EQ(tokens[1].type, TokenType::FN);
    EXPECT_EQ(tokens[9].type, TokenType::TRUE);
    EXPECT_EQ(tokens[11].type, TokenType::NIL);
    EXPECT_EQ(tokens[12].type, TokenType::IDENTIFIER);
    EXPECT_EQ(tokens[12].text, "letter");
}

TEST(LexerTest, CommentsAndLineTracking) {
    TokenList tokens = lex("// first line\nlet a = 1; // trailing\n  a;");
    ASSERT_GE(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].type, TokenType::LET);
    EXPECT_EQ(tokens[0].line, 2);
    EXPECT_EQ(tokens[0].column, 1);
    const Token& last_a = tokens[tokens.size() - 3];
    EXPECT_EQ(last_a.text, "a");
    EXPECT_EQ(last_a.line, 3);
    EXPECT_EQ(last_a.column, 3);
}

TEST(LexerTest, StringEscapes) {
    TokenList tokens = lex(R"('a\tb\n\'q\' \"d\"')");
    ASSERT_EQ(tokens[0].type, TokenType::STRING);
    EXPECT_EQ(tokens[0].text, "a\tb\n'q' \"d\"");
}

TEST(LexerTest, UnterminatedStringIsLexerError) {
    try {
        lex("print(\"oops);");
        FAIL() << "expected a LexerError";
    } catch (const PuffingError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::LexerError);
        EXPECT_EQ(e.message(), "Unterminated string literal");
        EXPECT_EQ(e.line(), 1);
        EXPECT_EQ(e.column(), 7);
        EXPECT_EQ(std::string(e.what()), "Unterminated string literal at line 1, column 7");
    }
}

TEST(LexerTest, StringCannotSpanLines) {
    EXPECT_THROW(lex("\"abc\ndef\""), PuffingError);
}

TEST(LexerTest, UnexpectedCharacters) {
    for (const char* src : {"let a = 1 @ 2;", "a & b", "a | b", "12abc", "\"\\q\""}) {
        try {
            lex(src);
            ADD_FAILURE() << "no error for: " << src;
        } catch (const PuffingError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::LexerError) << src;
        }
    }
}
