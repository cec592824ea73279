#pragma once
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

struct Stmt;
class Environment;
class Interpreter;
class Value;

using ListPtr = std::shared_ptr<std::vector<Value>>;

struct Callable {
    using Native = std::function<Value(Interpreter&, std::vector<Value>&, int line, int column)>;

    std::string name;
    int arity{-1};                          // -1: variadic
    const Stmt* declaration{nullptr};       // user functions
    std::shared_ptr<Environment> closure;   // user functions
    Native native;                          // builtins
};

using CallablePtr = std::shared_ptr<Callable>;

class Value {
public:
    enum class Type { Nil, Number, String, Bool, List, Function };

    // Nesting limit for printing and comparing lists.
    static constexpr size_t kMaxNesting = 1000;

    Value() = default;
    Value(double n) : data_(n) {}
    Value(bool b) : data_(b) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(ListPtr l) : data_(std::move(l)) {}
    Value(CallablePtr f) : data_(std::move(f)) {}

    Type type() const { return static_cast<Type>(data_.index()); }
    bool is(Type t) const { return type() == t; }

    double as_number() const { return std::get<double>(data_); }
    const std::string& as_string() const { return std::get<std::string>(data_); }
    bool as_bool() const { return std::get<bool>(data_); }
    const ListPtr& as_list() const { return std::get<ListPtr>(data_); }
    const CallablePtr& as_function() const { return std::get<CallablePtr>(data_); }

    bool truthy() const;
    // Text used by print() and str().
    std::string to_display() const;
    // Text used inside list displays (strings are quoted).
    std::string to_repr() const;

    static const char* type_name(Type t);
    const char* type_name() const { return type_name(type()); }

    friend bool operator==(const Value& a, const Value& b);
    friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }

private:
    // `open` holds the lists currently being printed, so a list that contains
    // itself prints as "[...]".
    std::string display(std::vector<const std::vector<Value>*>& open, bool quoted) const;

    // Alternative order must match Type.
    std::variant<std::monostate, double, std::string, bool, ListPtr, CallablePtr> data_;
};

class Environment {
public:
    explicit Environment(std::shared_ptr<Environment> parent = nullptr) : parent_(std::move(parent)) {}

    void define(const std::string& name, Value value) { values_[name] = std::move(value); }
    Value* find(const std::string& name);

private:
    std::map<std::string, Value> values_;
    std::shared_ptr<Environment> parent_;
};
