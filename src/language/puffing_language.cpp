#include "ilanguage.hpp"
#include "interpreter.hpp"
#include "lexer.hpp"
#include "parser.hpp"

TokenList PuffingLanguage::tokenize(const std::string& source) const {
    Lexer lexer(source);
    return lexer.tokenize();
}

std::unique_ptr<Program> PuffingLanguage::parse(const TokenList& tokens) const {
    Parser parser(tokens);
    return parser.parse();
}

void PuffingLanguage::run(const Program& program, RunContext& ctx) const {
    Interpreter interpreter(ctx);
    interpreter.run(program);
}
