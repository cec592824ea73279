#pragma once
#include "ast.hpp"
#include "run_context.hpp"
#include "token.hpp"
#include <memory>
#include <string>

// The three capabilities the execution harness needs from a language.
// Implementations report problems in the user's program by throwing
// PuffingError; anything else they throw is treated as an internal fault.
class ILanguage {
public:
    virtual ~ILanguage() = default;
    virtual TokenList tokenize(const std::string& source) const = 0;
    virtual std::unique_ptr<Program> parse(const TokenList& tokens) const = 0;
    virtual void run(const Program& program, RunContext& ctx) const = 0;
};

class PuffingLanguage : public ILanguage {
public:
    TokenList tokenize(const std::string& source) const override;
    std::unique_ptr<Program> parse(const TokenList& tokens) const override;
    void run(const Program& program, RunContext& ctx) const override;
};
