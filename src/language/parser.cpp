#include "parser.hpp"
#include "errors.hpp"
#include <stdexcept>
#include <utility>

static std::string describe(const Token& t) {
    if (t.type == TokenType::END_OF_FILE) return "end of input";
    if (t.type == TokenType::STRING) return "string \"" + t.text + "\"";
    return "'" + t.text + "'";
}

Parser::NestingGuard::NestingGuard(Parser& p) : p_(p) {
    if (++p_.depth_ > kMaxNesting) {
        --p_.depth_;
        p_.fail(p_.peek(), "Program is nested too deeply");
    }
}

void Parser::ChainGuard::fold() {
    if (p_.depth_ + 1 > kMaxNesting) p_.fail(p_.peek(), "Program is nested too deeply");
    ++p_.depth_;
    ++folds_;
}

Parser::Parser(const TokenList& tokens) : tokens_(tokens) {
    if (tokens_.empty() || tokens_.back().type != TokenType::END_OF_FILE) {
        throw std::invalid_argument("token stream must end with EOF");
    }
}

std::unique_ptr<Program> Parser::parse() {
    auto program = std::make_unique<Program>();
    while (!at_end()) program->statements.push_back(declaration());
    return program;
}

// ------------------ token helpers ------------------

const Token& Parser::advance() {
    if (!at_end()) ++pos_;
    return previous();
}

bool Parser::match(TokenType t) {
    if (!check(t)) return false;
    advance();
    return true;
}

const Token& Parser::expect(TokenType t, const char* what) {
    if (check(t)) return advance();
    fail(peek(), std::string("Expected ") + what + ", found " + describe(peek()));
}

void Parser::fail(const Token& at, const std::string& message) const {
    throw PuffingError(ErrorKind::ParserError, message, at.line, at.column);
}

// ------------------ statements ------------------

StmtPtr Parser::declaration() {
    if (check(TokenType::FN)) return function_declaration();
    if (check(TokenType::LET)) return let_declaration();
    return statement();
}

StmtPtr Parser::function_declaration() {
    NestingGuard guard(*this);
    const Token& kw = advance();
    auto fn = std::make_unique<Stmt>(Stmt::Kind::Function, kw.line, kw.column);
    fn->name = expect(TokenType::IDENTIFIER, "function name after 'fn'").text;
    expect(TokenType::LPAREN, "'(' after function name");
    if (!check(TokenType::RPAREN)) {
        do {
            const Token& param = expect(TokenType::IDENTIFIER, "parameter name");
            for (const auto& existing : fn->params) {
                if (existing == param.text) fail(param, "Duplicate parameter '" + param.text + "'");
            }
            fn->params.push_back(param.text);
        } while (match(TokenType::COMMA));
    }
    expect(TokenType::RPAREN, "')' after parameters");
    if (!check(TokenType::LBRACE)) fail(peek(), "Expected '{' before function body, found " + describe(peek()));

    int saved_loops = loop_depth_;
    loop_depth_ = 0;
    ++function_depth_;
    StmtPtr body = block();
    --function_depth_;
    loop_depth_ = saved_loops;

    fn->body = std::move(body->body);
    return fn;
}

StmtPtr Parser::let_declaration() {
    const Token& kw = advance();
    auto let = std::make_unique<Stmt>(Stmt::Kind::Let, kw.line, kw.column);
    let->name = expect(TokenType::IDENTIFIER, "variable name after 'let'").text;
    if (match(TokenType::ASSIGN)) let->expr = expression();
    expect(TokenType::SEMICOLON, "';' after variable declaration");
    return let;
}

StmtPtr Parser::statement() {
    NestingGuard guard(*this);
    switch (peek().type) {
        case TokenType::PRINT: return print_statement();
        case TokenType::IF: return if_statement();
        case TokenType::WHILE: return while_statement();
        case TokenType::FOR: return for_statement();
        case TokenType::RETURN: return return_statement();
        case TokenType::BREAK: return jump_statement(Stmt::Kind::Break, "break");
        case TokenType::CONTINUE: return jump_statement(Stmt::Kind::Continue, "continue");
        case TokenType::LBRACE: return block();
        default: return expression_statement();
    }
}

StmtPtr Parser::print_statement() {
    const Token& kw = advance();
    auto print = std::make_unique<Stmt>(Stmt::Kind::Print, kw.line, kw.column);
    expect(TokenType::LPAREN, "'(' after 'print'");
    print->args = arguments(TokenType::RPAREN);
    expect(TokenType::SEMICOLON, "';' after print statement");
    return print;
}

StmtPtr Parser::if_statement() {
    const Token& kw = advance();
    auto s = std::make_unique<Stmt>(Stmt::Kind::If, kw.line, kw.column);
    expect(TokenType::LPAREN, "'(' after 'if'");
    s->expr = expression();
    expect(TokenType::RPAREN, "')' after if condition");
    s->then_branch = statement();
    if (match(TokenType::ELSE)) s->else_branch = statement();
    return s;
}

StmtPtr Parser::while_statement() {
    const Token& kw = advance();
    auto s = std::make_unique<Stmt>(Stmt::Kind::While, kw.line, kw.column);
    expect(TokenType::LPAREN, "'(' after 'while'");
    s->expr = expression();
    expect(TokenType::RPAREN, "')' after while condition");
    ++loop_depth_;
    s->then_branch = statement();
    --loop_depth_;
    return s;
}

StmtPtr Parser::for_statement() {
    const Token& kw = advance();
    auto s = std::make_unique<Stmt>(Stmt::Kind::For, kw.line, kw.column);
    expect(TokenType::LPAREN, "'(' after 'for'");
    if (match(TokenType::SEMICOLON)) {
        // no initializer
    } else if (check(TokenType::LET)) {
        s->init = let_declaration();
    } else {
        s->init = expression_statement();
    }
    if (!check(TokenType::SEMICOLON)) s->expr = expression();
    expect(TokenType::SEMICOLON, "';' after loop condition");
    if (!check(TokenType::RPAREN)) s->step = expression();
    expect(TokenType::RPAREN, "')' after for clauses");
    ++loop_depth_;
    s->then_branch = statement();
    --loop_depth_;
    return s;
}

StmtPtr Parser::return_statement() {
    const Token& kw = advance();
    if (function_depth_ == 0) fail(kw, "'return' outside of a function");
    auto s = std::make_unique<Stmt>(Stmt::Kind::Return, kw.line, kw.column);
    if (!check(TokenType::SEMICOLON)) s->expr = expression();
    expect(TokenType::SEMICOLON, "';' after return value");
    return s;
}

StmtPtr Parser::jump_statement(Stmt::Kind kind, const char* word) {
    const Token& kw = advance();
    if (loop_depth_ == 0) fail(kw, std::string("'") + word + "' outside of a loop");
    auto s = std::make_unique<Stmt>(kind, kw.line, kw.column);
    expect(TokenType::SEMICOLON, (std::string("';' after '") + word + "'").c_str());
    return s;
}

StmtPtr Parser::block() {
    const Token& open = expect(TokenType::LBRACE, "'{'");
    auto b = std::make_unique<Stmt>(Stmt::Kind::Block, open.line, open.column);
    while (!check(TokenType::RBRACE) && !at_end()) b->body.push_back(declaration());
    expect(TokenType::RBRACE, "'}' to close block");
    return b;
}

StmtPtr Parser::expression_statement() {
    const Token& first = peek();
    auto s = std::make_unique<Stmt>(Stmt::Kind::Expression, first.line, first.column);
    s->expr = expression();
    expect(TokenType::SEMICOLON, "';' after expression");
    return s;
}

// ------------------ expressions ------------------

ExprPtr Parser::expression() {
    NestingGuard guard(*this);
    return assignment();
}

ExprPtr Parser::assignment() {
    ExprPtr target = logic_or();
    if (!check(TokenType::ASSIGN)) return target;

    const Token& eq = advance();
    ExprPtr value = expression();
    if (target->kind == Expr::Kind::Variable) {
        auto a = std::make_unique<Expr>(Expr::Kind::Assign, target->line, target->column);
        a->name = std::move(target->name);
        a->right = std::move(value);
        return a;
    }
    if (target->kind == Expr::Kind::Index) {
        auto a = std::make_unique<Expr>(Expr::Kind::IndexAssign, target->line, target->column);
        a->left = std::move(target->left);
        a->right = std::move(target->right);
        a->args.push_back(std::move(value));
        return a;
    }
    fail(eq, "Invalid assignment target");
}

ExprPtr Parser::logic_or() {
    ExprPtr left = logic_and();
    ChainGuard chain(*this);
    while (check(TokenType::OR)) {
        chain.fold();
        const Token& op = advance();
        auto e = std::make_unique<Expr>(Expr::Kind::Logical, op.line, op.column);
        e->op = op.type;
        e->left = std::move(left);
        e->right = logic_and();
        left = std::move(e);
    }
    return left;
}

ExprPtr Parser::logic_and() {
    ExprPtr left = equality();
    ChainGuard chain(*this);
    while (check(TokenType::AND)) {
        chain.fold();
        const Token& op = advance();
        auto e = std::make_unique<Expr>(Expr::Kind::Logical, op.line, op.column);
        e->op = op.type;
        e->left = std::move(left);
        e->right = equality();
        left = std::move(e);
    }
    return left;
}

ExprPtr Parser::equality() {
    ExprPtr left = comparison();
    ChainGuard chain(*this);
    while (check(TokenType::EQUAL) || check(TokenType::NOT_EQUAL)) {
        chain.fold();
        const Token& op = advance();
        auto e = std::make_unique<Expr>(Expr::Kind::Binary, op.line, op.column);
        e->op = op.type;
        e->left = std::move(left);
        e->right = comparison();
        left = std::move(e);
    }
    return left;
}

ExprPtr Parser::comparison() {
    ExprPtr left = term();
    ChainGuard chain(*this);
    while (check(TokenType::LESS) || check(TokenType::LESS_EQUAL) ||
           check(TokenType::GREATER) || check(TokenType::GREATER_EQUAL)) {
        chain.fold();
        const Token& op = advance();
        auto e = std::make_unique<Expr>(Expr::Kind::Binary, op.line, op.column);
        e->op = op.type;
        e->left = std::move(left);
        e->right = term();
        left = std::move(e);
    }
    return left;
}

ExprPtr Parser::term() {
    ExprPtr left = factor();
    ChainGuard chain(*this);
    while (check(TokenType::PLUS) || check(TokenType::MINUS)) {
        chain.fold();
        const Token& op = advance();
        auto e = std::make_unique<Expr>(Expr::Kind::Binary, op.line, op.column);
        e->op = op.type;
        e->left = std::move(left);
        e->right = factor();
        left = std::move(e);
    }
    return left;
}

ExprPtr Parser::factor() {
    ExprPtr left = unary();
    ChainGuard chain(*this);
    while (check(TokenType::STAR) || check(TokenType::SLASH) || check(TokenType::PERCENT)) {
        chain.fold();
        const Token& op = advance();
        auto e = std::make_unique<Expr>(Expr::Kind::Binary, op.line, op.column);
        e->op = op.type;
        e->left = std::move(left);
        e->right = unary();
        left = std::move(e);
    }
    return left;
}

ExprPtr Parser::unary() {
    if (check(TokenType::NOT) || check(TokenType::MINUS)) {
        NestingGuard guard(*this);
        const Token& op = advance();
        auto e = std::make_unique<Expr>(Expr::Kind::Unary, op.line, op.column);
        e->op = op.type;
        e->right = unary();
        return e;
    }
    return postfix();
}

ExprPtr Parser::postfix() {
    ExprPtr e = primary();
    ChainGuard chain(*this);
    for (;;) {
        if (check(TokenType::LPAREN)) {
            chain.fold();
            const Token& open = advance();
            auto call = std::make_unique<Expr>(Expr::Kind::Call, open.line, open.column);
            call->left = std::move(e);
            call->args = arguments(TokenType::RPAREN);
            e = std::move(call);
        } else if (check(TokenType::LBRACKET)) {
            chain.fold();
            const Token& open = advance();
            auto idx = std::make_unique<Expr>(Expr::Kind::Index, open.line, open.column);
            idx->left = std::move(e);
            idx->right = expression();
            expect(TokenType::RBRACKET, "']' after index");
            e = std::move(idx);
        } else {
            return e;
        }
    }
}

ExprPtr Parser::primary() {
    const Token& t = peek();
    switch (t.type) {
        case TokenType::NUMBER: {
            advance();
            auto e = std::make_unique<Expr>(Expr::Kind::Number, t.line, t.column);
            e->number = t.number;
            return e;
        }
        case TokenType::STRING: {
            advance();
            auto e = std::make_unique<Expr>(Expr::Kind::String, t.line, t.column);
            e->name = t.text;
            return e;
        }
        case TokenType::TRUE:
        case TokenType::FALSE: {
            advance();
            auto e = std::make_unique<Expr>(Expr::Kind::Bool, t.line, t.column);
            e->boolean = t.type == TokenType::TRUE;
            return e;
        }
        case TokenType::NIL:
            advance();
            return std::make_unique<Expr>(Expr::Kind::Nil, t.line, t.column);
        case TokenType::IDENTIFIER: {
            advance();
            auto e = std::make_unique<Expr>(Expr::Kind::Variable, t.line, t.column);
            e->name = t.text;
            return e;
        }
        case TokenType::LPAREN: {
            advance();
            ExprPtr inner = expression();
            expect(TokenType::RPAREN, "')' after expression");
            return inner;
        }
        case TokenType::LBRACKET: {
            advance();
            auto list = std::make_unique<Expr>(Expr::Kind::List, t.line, t.column);
            list->args = arguments(TokenType::RBRACKET);
            return list;
        }
        default:
            fail(t, "Expected expression, found " + describe(t));
    }
}

// Parses a comma separated list up to and including `closing`.
std::vector<ExprPtr> Parser::arguments(TokenType closing) {
    std::vector<ExprPtr> args;
    if (!check(closing)) {
        do {
            args.push_back(expression());
        } while (match(TokenType::COMMA));
    }
    expect(closing, closing == TokenType::RPAREN ? "')' after arguments" : "']' after list elements");
    return args;
}
