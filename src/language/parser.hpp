#pragma once
#include "ast.hpp"
#include <memory>

// Recursive-descent parser for Puffing. Throws PuffingError(ParserError).
class Parser {
public:
    // Nesting limit for expressions and blocks; keeps hostile input from
    // exhausting the native stack of whoever calls parse().
    static constexpr int kMaxNesting = 200;

    explicit Parser(const TokenList& tokens);

    std::unique_ptr<Program> parse();

private:
    struct NestingGuard {
        explicit NestingGuard(Parser& p);
        ~NestingGuard() { --p_.depth_; }
        Parser& p_;
    };

    // A left-associative chain grows the tree one level per operator without
    // recursing, so each fold is charged against the same limit until the
    // chain is complete.
    struct ChainGuard {
        explicit ChainGuard(Parser& p) : p_(p) {}
        ~ChainGuard() { p_.depth_ -= folds_; }
        void fold();
        Parser& p_;
        int folds_{0};
    };

    StmtPtr declaration();
    StmtPtr function_declaration();
    StmtPtr let_declaration();
    StmtPtr statement();
    StmtPtr print_statement();
    StmtPtr if_statement();
    StmtPtr while_statement();
    StmtPtr for_statement();
    StmtPtr return_statement();
    StmtPtr jump_statement(Stmt::Kind kind, const char* word);
    StmtPtr block();
    StmtPtr expression_statement();

    ExprPtr expression();
    ExprPtr assignment();
    ExprPtr logic_or();
    ExprPtr logic_and();
    ExprPtr equality();
    ExprPtr comparison();
    ExprPtr term();
    ExprPtr factor();
    ExprPtr unary();
    ExprPtr postfix();
    ExprPtr primary();
    std::vector<ExprPtr> arguments(TokenType closing);

    const Token& peek() const { return tokens_[pos_]; }
    const Token& previous() const { return tokens_[pos_ - 1]; }
    bool check(TokenType t) const { return peek().type == t; }
    bool at_end() const { return check(TokenType::END_OF_FILE); }
    const Token& advance();
    bool match(TokenType t);
    const Token& expect(TokenType t, const char* what);
    [[noreturn]] void fail(const Token& at, const std::string& message) const;

    const TokenList& tokens_;
    size_t pos_{0};
    int depth_{0};
    int loop_depth_{0};
    int function_depth_{0};
};
