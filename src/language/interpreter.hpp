#pragma once
#include "ast.hpp"
#include "run_context.hpp"
#include "value.hpp"
#include <memory>
#include <string>
#include <vector>

// Tree-walking evaluator. Program output goes to ctx.output.stream only.
class Interpreter {
public:
    static constexpr int kMaxCallDepth = 200;
    // Cap on nested expression evaluation across all active calls; deep
    // expressions inside deep recursion would otherwise exhaust the native
    // stack before kMaxCallDepth is reached.
    static constexpr int kMaxEvalDepth = 3000;

    explicit Interpreter(RunContext& ctx);

    // Throws PuffingError for any problem in the user's program; the error's
    // trace() holds the call stack at the point it was raised.
    void run(const Program& program);

    RunContext& context() { return ctx_; }

private:
    enum class Flow { Normal, Break, Continue, Return };

    struct DepthGuard {
        DepthGuard(Interpreter& in, const Expr& at);
        ~DepthGuard() { --in_.depth_; }
        Interpreter& in_;
    };

    struct Frame {
        std::string function;
        int call_line;
    };

    void install_builtins();

    Flow execute(const Stmt& stmt, const std::shared_ptr<Environment>& env);
    Flow execute_block(const std::vector<StmtPtr>& body, const std::shared_ptr<Environment>& env);
    Value evaluate(const Expr& expr, const std::shared_ptr<Environment>& env);

    Value binary(const Expr& expr, const Value& left, const Value& right);
    Value call(const Expr& expr, const Value& callee, std::vector<Value>& args);
    Value index(const Expr& expr, const Value& target, const Value& key);
    void assign_index(const Expr& expr, const Value& target, const Value& key, Value value);

    std::string format_trace(int error_line) const;

    RunContext& ctx_;
    std::shared_ptr<Environment> globals_;
    std::vector<Frame> frames_;
    Value return_value_;
    int depth_{0};
    // Location of the expression evaluated most recently; used for errors
    // raised by value operations that do not know where they happened.
    int line_{0};
    int column_{0};
};
