#include "interpreter.hpp"
#include "errors.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <utility>

[[noreturn]] static void raise(ErrorKind kind, const std::string& message, const Expr& at) {
    throw PuffingError(kind, message, at.line, at.column);
}

static Value from_json(const nlohmann::json& j) {
    switch (j.type()) {
        case nlohmann::json::value_t::null: return Value();
        case nlohmann::json::value_t::boolean: return Value(j.get<bool>());
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float: return Value(j.get<double>());
        case nlohmann::json::value_t::string: return Value(j.get<std::string>());
        case nlohmann::json::value_t::array: {
            auto list = std::make_shared<std::vector<Value>>();
            for (const auto& item : j) list->push_back(from_json(item));
            return Value(list);
        }
        default: return Value(j.dump());
    }
}

static bool is_integral(double d) { return std::floor(d) == d && std::isfinite(d); }

Interpreter::DepthGuard::DepthGuard(Interpreter& in, const Expr& at) : in_(in) {
    if (in_.depth_ >= kMaxEvalDepth) {
        raise(ErrorKind::RecursionError, "Maximum recursion depth exceeded (expression nesting)", at);
    }
    ++in_.depth_;
    in_.line_ = at.line;
    in_.column_ = at.column;
}

Interpreter::Interpreter(RunContext& ctx)
    : ctx_(ctx), globals_(std::make_shared<Environment>()) {
    install_builtins();
}

void Interpreter::install_builtins() {
    auto define = [this](const std::string& name, int arity, Callable::Native fn) {
        auto c = std::make_shared<Callable>();
        c->name = name;
        c->arity = arity;
        c->native = std::move(fn);
        globals_->define(name, Value(c));
    };

    define("input", 0, [](Interpreter& in, std::vector<Value>&, int line, int column) -> Value {
        RunContext& ctx = in.context();
        if (ctx.next_input >= ctx.inputs.size()) {
            throw PuffingError(ErrorKind::InputError,
                               "No more input values (" + std::to_string(ctx.inputs.size()) + " provided)",
                               line, column);
        }
        return from_json(ctx.inputs[ctx.next_input++]);
    });

    define("len", 1, [](Interpreter&, std::vector<Value>& args, int line, int column) -> Value {
        const Value& v = args[0];
        if (v.is(Value::Type::String)) return Value(static_cast<double>(v.as_string().size()));
        if (v.is(Value::Type::List)) return Value(static_cast<double>(v.as_list()->size()));
        throw PuffingError(ErrorKind::TypeError, std::string("len() expects a string or list, got ") + v.type_name(), line, column);
    });

    define("str", 1, [](Interpreter&, std::vector<Value>& args, int, int) -> Value {
        return Value(args[0].to_display());
    });

    define("num", 1, [](Interpreter&, std::vector<Value>& args, int line, int column) -> Value {
        const Value& v = args[0];
        switch (v.type()) {
            case Value::Type::Number: return v;
            case Value::Type::Bool: return Value(v.as_bool() ? 1.0 : 0.0);
            case Value::Type::String: {
                const std::string& s = v.as_string();
                const char* begin = s.c_str();
                char* end = nullptr;
                double d = std::strtod(begin, &end);
                while (end && *end && std::isspace(static_cast<unsigned char>(*end))) ++end;
                if (s.empty() || end == begin || *end != '\0') {
                    throw PuffingError(ErrorKind::TypeError, "Cannot convert \"" + s + "\" to number", line, column);
                }
                return Value(d);
            }
            default:
                throw PuffingError(ErrorKind::TypeError, std::string("Cannot convert ") + v.type_name() + " to number", line, column);
        }
    });

    define("push", 2, [](Interpreter&, std::vector<Value>& args, int line, int column) -> Value {
        if (!args[0].is(Value::Type::List)) {
            throw PuffingError(ErrorKind::TypeError, std::string("push() expects a list, got ") + args[0].type_name(), line, column);
        }
        args[0].as_list()->push_back(args[1]);
        return args[0];
    });
}

void Interpreter::run(const Program& program) {
    frames_.clear();
    frames_.push_back({"<program>", 0});
    depth_ = 0;
    try {
        for (const auto& stmt : program.statements) execute(*stmt, globals_);
    } catch (PuffingError& e) {
        if (e.line() <= 0 && line_ > 0) {
            PuffingError located(e.kind(), e.message(), line_, column_);
            located.set_trace(format_trace(line_));
            frames_.clear();
            throw located;
        }
        if (e.trace().empty()) e.set_trace(format_trace(e.line()));
        frames_.clear();
        throw;
    }
    frames_.clear();
}

std::string Interpreter::format_trace(int error_line) const {
    std::ostringstream out;
    out << "Traceback (most recent call last):\n";
    for (size_t i = 0; i < frames_.size(); ++i) {
        int line = i + 1 < frames_.size() ? frames_[i + 1].call_line : error_line;
        out << "  line " << line << ", in " << frames_[i].function << "\n";
    }
    return out.str();
}

// ------------------ statements ------------------

Interpreter::Flow Interpreter::execute_block(const std::vector<StmtPtr>& body, const std::shared_ptr<Environment>& env) {
    for (const auto& stmt : body) {
        Flow f = execute(*stmt, env);
        if (f != Flow::Normal) return f;
    }
    return Flow::Normal;
}

Interpreter::Flow Interpreter::execute(const Stmt& stmt, const std::shared_ptr<Environment>& env) {
    switch (stmt.kind) {
        case Stmt::Kind::Expression:
            evaluate(*stmt.expr, env);
            return Flow::Normal;

        case Stmt::Kind::Print: {
            std::string line;
            for (size_t i = 0; i < stmt.args.size(); ++i) {
                if (i) line += ' ';
                line += evaluate(*stmt.args[i], env).to_display();
            }
            line += '\n';
            *ctx_.output.stream << line;
            return Flow::Normal;
        }

        case Stmt::Kind::Let:
            env->define(stmt.name, stmt.expr ? evaluate(*stmt.expr, env) : Value());
            return Flow::Normal;

        case Stmt::Kind::Block:
            return execute_block(stmt.body, std::make_shared<Environment>(env));

        case Stmt::Kind::If:
            if (evaluate(*stmt.expr, env).truthy()) return execute(*stmt.then_branch, env);
            if (stmt.else_branch) return execute(*stmt.else_branch, env);
            return Flow::Normal;

        case Stmt::Kind::While:
            while (evaluate(*stmt.expr, env).truthy()) {
                Flow f = execute(*stmt.then_branch, env);
                if (f == Flow::Break) break;
                if (f == Flow::Return) return f;
            }
            return Flow::Normal;

        case Stmt::Kind::For: {
            auto scope = std::make_shared<Environment>(env);
            if (stmt.init) execute(*stmt.init, scope);
            while (!stmt.expr || evaluate(*stmt.expr, scope).truthy()) {
                Flow f = execute(*stmt.then_branch, scope);
                if (f == Flow::Break) break;
                if (f == Flow::Return) return f;
                if (stmt.step) evaluate(*stmt.step, scope);
            }
            return Flow::Normal;
        }

        case Stmt::Kind::Function: {
            auto fn = std::make_shared<Callable>();
            fn->name = stmt.name;
            fn->arity = static_cast<int>(stmt.params.size());
            fn->declaration = &stmt;
            fn->closure = env;
            env->define(stmt.name, Value(fn));
            return Flow::Normal;
        }

        case Stmt::Kind::Return:
            return_value_ = stmt.expr ? evaluate(*stmt.expr, env) : Value();
            return Flow::Return;

        case Stmt::Kind::Break:
            return Flow::Break;

        case Stmt::Kind::Continue:
            return Flow::Continue;
    }
    return Flow::Normal;
}

// ------------------ expressions ------------------

Value Interpreter::evaluate(const Expr& expr, const std::shared_ptr<Environment>& env) {
    DepthGuard guard(*this, expr);
    switch (expr.kind) {
        case Expr::Kind::Number: return Value(expr.number);
        case Expr::Kind::String: return Value(expr.name);
        case Expr::Kind::Bool: return Value(expr.boolean);
        case Expr::Kind::Nil: return Value();

        case Expr::Kind::List: {
            auto list = std::make_shared<std::vector<Value>>();
            list->reserve(expr.args.size());
            for (const auto& item : expr.args) list->push_back(evaluate(*item, env));
            return Value(list);
        }

        case Expr::Kind::Variable: {
            Value* slot = env->find(expr.name);
            if (!slot) raise(ErrorKind::NameError, "Undefined variable '" + expr.name + "'", expr);
            return *slot;
        }

        case Expr::Kind::Assign: {
            Value v = evaluate(*expr.right, env);
            Value* slot = env->find(expr.name);
            if (!slot) raise(ErrorKind::NameError, "Undefined variable '" + expr.name + "'", expr);
            *slot = v;
            return v;
        }

        case Expr::Kind::IndexAssign: {
            Value target = evaluate(*expr.left, env);
            Value key = evaluate(*expr.right, env);
            Value v = evaluate(*expr.args[0], env);
            assign_index(expr, target, key, v);
            return v;
        }

        case Expr::Kind::Unary: {
            Value operand = evaluate(*expr.right, env);
            if (expr.op == TokenType::NOT) return Value(!operand.truthy());
            if (!operand.is(Value::Type::Number)) {
                raise(ErrorKind::TypeError, std::string("Bad operand type for unary -: ") + operand.type_name(), expr);
            }
            return Value(-operand.as_number());
        }

        case Expr::Kind::Logical: {
            bool left = evaluate(*expr.left, env).truthy();
            if (expr.op == TokenType::OR && left) return Value(true);
            if (expr.op == TokenType::AND && !left) return Value(false);
            return Value(evaluate(*expr.right, env).truthy());
        }

        case Expr::Kind::Binary: {
            Value left = evaluate(*expr.left, env);
            Value right = evaluate(*expr.right, env);
            return binary(expr, left, right);
        }

        case Expr::Kind::Call: {
            Value callee = evaluate(*expr.left, env);
            std::vector<Value> args;
            args.reserve(expr.args.size());
            for (const auto& a : expr.args) args.push_back(evaluate(*a, env));
            return call(expr, callee, args);
        }

        case Expr::Kind::Index: {
            Value target = evaluate(*expr.left, env);
            Value key = evaluate(*expr.right, env);
            return index(expr, target, key);
        }
    }
    return Value();
}

Value Interpreter::binary(const Expr& expr, const Value& left, const Value& right) {
    using T = Value::Type;
    const bool numbers = left.is(T::Number) && right.is(T::Number);

    switch (expr.op) {
        case TokenType::EQUAL: return Value(left == right);
        case TokenType::NOT_EQUAL: return Value(left != right);

        case TokenType::PLUS:
            if (numbers) return Value(left.as_number() + right.as_number());
            if (left.is(T::String) || right.is(T::String)) return Value(left.to_display() + right.to_display());
            if (left.is(T::List) && right.is(T::List)) {
                auto joined = std::make_shared<std::vector<Value>>(*left.as_list());
                joined->insert(joined->end(), right.as_list()->begin(), right.as_list()->end());
                return Value(joined);
            }
            break;

        case TokenType::MINUS:
            if (numbers) return Value(left.as_number() - right.as_number());
            break;
        case TokenType::STAR:
            if (numbers) return Value(left.as_number() * right.as_number());
            break;
        case TokenType::SLASH:
            if (numbers) {
                if (right.as_number() == 0.0) raise(ErrorKind::ZeroDivisionError, "Division by zero", expr);
                return Value(left.as_number() / right.as_number());
            }
            break;
        case TokenType::PERCENT:
            if (numbers) {
                if (right.as_number() == 0.0) raise(ErrorKind::ZeroDivisionError, "Modulo by zero", expr);
                return Value(std::fmod(left.as_number(), right.as_number()));
            }
            break;

        case TokenType::LESS:
        case TokenType::LESS_EQUAL:
        case TokenType::GREATER:
        case TokenType::GREATER_EQUAL: {
            int cmp;
            if (numbers) {
                cmp = left.as_number() < right.as_number() ? -1 : (left.as_number() > right.as_number() ? 1 : 0);
            } else if (left.is(T::String) && right.is(T::String)) {
                cmp = left.as_string().compare(right.as_string());
            } else {
                raise(ErrorKind::TypeError,
                      std::string("Cannot compare ") + left.type_name() + " and " + right.type_name(), expr);
            }
            switch (expr.op) {
                case TokenType::LESS: return Value(cmp < 0);
                case TokenType::LESS_EQUAL: return Value(cmp <= 0);
                case TokenType::GREATER: return Value(cmp > 0);
                default: return Value(cmp >= 0);
            }
        }

        default:
            break;
    }
    raise(ErrorKind::TypeError,
          std::string("Unsupported operand types for ") + token_type_name(expr.op) + ": " +
              left.type_name() + " and " + right.type_name(),
          expr);
}

Value Interpreter::call(const Expr& expr, const Value& callee, std::vector<Value>& args) {
    if (!callee.is(Value::Type::Function)) {
        raise(ErrorKind::TypeError, std::string(callee.type_name()) + " is not callable", expr);
    }
    const Callable& fn = *callee.as_function();
    if (fn.arity >= 0 && static_cast<size_t>(fn.arity) != args.size()) {
        raise(ErrorKind::TypeError,
              fn.name + "() expects " + std::to_string(fn.arity) + " argument(s) but got " + std::to_string(args.size()),
              expr);
    }
    if (fn.native) return fn.native(*this, args, expr.line, expr.column);

    if (frames_.size() > static_cast<size_t>(kMaxCallDepth)) {
        raise(ErrorKind::RecursionError, "Maximum recursion depth exceeded (" + std::to_string(kMaxCallDepth) + ")", expr);
    }

    auto scope = std::make_shared<Environment>(fn.closure);
    for (size_t i = 0; i < args.size(); ++i) scope->define(fn.declaration->params[i], std::move(args[i]));

    // Frames stay pushed when an error unwinds so run() can report them.
    frames_.push_back({fn.name, expr.line});
    Flow f = execute_block(fn.declaration->body, scope);
    frames_.pop_back();

    Value result;
    if (f == Flow::Return) result = std::move(return_value_);
    return_value_ = Value();
    return result;
}

Value Interpreter::index(const Expr& expr, const Value& target, const Value& key) {
    if (!target.is(Value::Type::List) && !target.is(Value::Type::String)) {
        raise(ErrorKind::TypeError, std::string(target.type_name()) + " is not indexable", expr);
    }
    if (!key.is(Value::Type::Number) || !is_integral(key.as_number())) {
        raise(ErrorKind::TypeError, "Index must be an integer", expr);
    }
    double i = key.as_number();
    size_t size = target.is(Value::Type::List) ? target.as_list()->size() : target.as_string().size();
    if (i < 0 || i >= static_cast<double>(size)) {
        raise(ErrorKind::RuntimeError,
              "Index " + Value(i).to_display() + " out of range (length " + std::to_string(size) + ")", expr);
    }
    size_t at = static_cast<size_t>(i);
    if (target.is(Value::Type::List)) return (*target.as_list())[at];
    return Value(std::string(1, target.as_string()[at]));
}

void Interpreter::assign_index(const Expr& expr, const Value& target, const Value& key, Value value) {
    if (!target.is(Value::Type::List)) {
        raise(ErrorKind::TypeError, std::string(target.type_name()) + " does not support item assignment", expr);
    }
    if (!key.is(Value::Type::Number) || !is_integral(key.as_number())) {
        raise(ErrorKind::TypeError, "Index must be an integer", expr);
    }
    auto& items = *target.as_list();
    double i = key.as_number();
    if (i < 0 || i >= static_cast<double>(items.size())) {
        raise(ErrorKind::RuntimeError,
              "Index " + Value(i).to_display() + " out of range (length " + std::to_string(items.size()) + ")", expr);
    }
    items[static_cast<size_t>(i)] = std::move(value);
}
