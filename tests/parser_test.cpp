#include <gtest/gtest.h>
#include "language/errors.hpp"
#include "language/lexer.hpp"
#include "language/parser.hpp"
#include <stdexcept>

static std::unique_ptr<Program> parse(const std::string& src) {
    Lexer lexer(src);
    TokenList tokens = lexer.tokenize();
    Parser parser(tokens);
    return parser.parse();
}

static PuffingError parse_error(const std::string& src) {
    try {
        parse(src);
    } catch (const PuffingError& e) {
        return e;
    }
    ADD_FAILURE() << "parse succeeded for: " << src;
    return PuffingError(ErrorKind::UnexpectedError, "no error");
}

TEST(ParserTest, EmptyProgram) {
    auto program = parse("   // nothing here\n");
    EXPECT_TRUE(program->statements.empty());
}

TEST(ParserTest, StatementKinds) {
    auto program = parse(
        "let x = 1;\n"
        "fn f(a, b) { return a + b; }\n"
        "if (x > 0) { print(x); } else print(0);\n"
        "while (x < 3) { x = x + 1; }\n"
        "for (let i = 0; i < 2; i = i + 1) { continue; }\n");
    ASSERT_EQ(program->statements.size(), 5u);
    EXPECT_EQ(program->statements[0]->kind, Stmt::Kind::Let);
    EXPECT_EQ(program->statements[1]->kind, Stmt::Kind::Function);
    EXPECT_EQ(program->statements[1]->params.size(), 2u);
    EXPECT_EQ(program->statements[2]->kind, Stmt::Kind::If);
    EXPECT_NE(program->statements[2]->else_branch, nullptr);
    EXPECT_EQ(program->statements[3]->kind, Stmt::Kind::While);
    EXPECT_EQ(program->statements[4]->kind, Stmt::Kind::For);
    EXPECT_NE(program->statements[4]->init, nullptr);
    EXPECT_NE(program->statements[4]->step, nullptr);
}

TEST(ParserTest, PrecedenceMultiplicationBindsTighter) {
    auto program = parse("1 + 2 * 3;");
    const Expr& e = *program->statements[0]->expr;
    ASSERT_EQ(e.kind, Expr::Kind::Binary);
    EXPECT_EQ(e.op, TokenType::PLUS);
    ASSERT_EQ(e.right->kind, Expr::Kind::Binary);
    EXPECT_EQ(e.right->op, TokenType::STAR);
}

TEST(ParserTest, IndexAssignment) {
    auto program = parse("let xs = [1, 2]; xs[0] = 5;");
    const Expr& e = *program->statements[1]->expr;
    EXPECT_EQ(e.kind, Expr::Kind::IndexAssign);
    ASSERT_EQ(e.args.size(), 1u);
}

TEST(ParserTest, MissingSemicolon) {
    PuffingError e = parse_error("print(1)");
    EXPECT_EQ(e.kind(), ErrorKind::ParserError);
    EXPECT_EQ(e.message(), "Expected ';' after print statement, found end of input");
}

TEST(ParserTest, ReportsLocationOfOffendingToken) {
    PuffingError e = parse_error("let x = 1;\nlet = 2;");
    EXPECT_EQ(e.kind(), ErrorKind::ParserError);
    EXPECT_EQ(e.line(), 2);
    EXPECT_EQ(e.column(), 5);
}

TEST(ParserTest, ContextErrors) {
    EXPECT_EQ(parse_error("return 1;").message(), "'return' outside of a function");
    EXPECT_EQ(parse_error("break;").message(), "'break' outside of a loop");
    EXPECT_EQ(parse_error("fn f() { continue; }").message(), "'continue' outside of a loop");
    EXPECT_EQ(parse_error("1 = 2;").message(), "Invalid assignment target");
    EXPECT_EQ(parse_error("fn f(a, a) {}").message(), "Duplicate parameter 'a'");
}

TEST(ParserTest, LoopInsideFunctionAllowsBreak) {
    EXPECT_NO_THROW(parse("fn f() { while (true) { break; } return nil; }"));
}

TEST(ParserTest, DeepNestingIsRejected) {
    std::string src = "print(" + std::string(1000, '(') + "1" + std::string(1000, ')') + ");";
    PuffingError e = parse_error(src);
    EXPECT_EQ(e.kind(), ErrorKind::ParserError);
    EXPECT_EQ(e.message(), "Program is nested too deeply");
}

TEST(ParserTest, ModerateNestingIsAccepted) {
    std::string src = "print(" + std::string(50, '(') + "1" + std::string(50, ')') + ");";
    EXPECT_NO_THROW(parse(src));
}

TEST(ParserTest, LongOperatorChainIsRejected) {
    std::string src = "1";
    for (int i = 0; i < 300000; ++i) src += "+1";
    src += ";";
    PuffingError e = parse_error(src);
    EXPECT_EQ(e.kind(), ErrorKind::ParserError);
    EXPECT_EQ(e.message(), "Program is nested too deeply");
}

TEST(ParserTest, LongCallAndIndexChainsAreRejected) {
    std::string calls = "f";
    for (int i = 0; i < 300000; ++i) calls += "()";
    EXPECT_EQ(parse_error(calls + ";").message(), "Program is nested too deeply");

    std::string index = "xs";
    for (int i = 0; i < 300000; ++i) index += "[0]";
    EXPECT_EQ(parse_error(index + ";").message(), "Program is nested too deeply");
}

TEST(ParserTest, LongAssignmentChainIsRejected) {
    std::string src;
    for (int i = 0; i < 300000; ++i) src += "a = ";
    src += "1;";
    EXPECT_EQ(parse_error(src).message(), "Program is nested too deeply");
}

TEST(ParserTest, DeeplyNestedFunctionsAreRejected) {
    std::string src;
    for (int i = 0; i < 5000; ++i) src += "fn f() { ";
    for (int i = 0; i < 5000; ++i) src += "} ";
    EXPECT_EQ(parse_error(src).message(), "Program is nested too deeply");
}

TEST(ParserTest, OrdinaryChainsAreAccepted) {
    std::string src = "print(1";
    for (int i = 0; i < 50; ++i) src += " + 1 * 2 - 3";
    src += ", f()(1)[0], a && b || c);";
    EXPECT_NO_THROW(parse(src));
}

TEST(ParserTest, TokenStreamMustEndWithEof) {
    TokenList tokens;
    EXPECT_THROW(Parser{tokens}, std::invalid_argument);
}
