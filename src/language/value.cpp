#include "value.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>

static std::string format_number(double n) {
    if (std::isnan(n)) return "nan";
    if (std::isinf(n)) return n > 0 ? "inf" : "-inf";
    if (std::floor(n) == n && std::fabs(n) < 1e15) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.0f", n);
        return buf;
    }
    std::ostringstream ss;
    ss.precision(15);
    ss << n;
    return ss.str();
}

bool Value::truthy() const {
    switch (type()) {
        case Type::Nil: return false;
        case Type::Number: return as_number() != 0.0;
        case Type::String: return !as_string().empty();
        case Type::Bool: return as_bool();
        case Type::List: return !as_list()->empty();
        case Type::Function: return true;
    }
    return false;
}

std::string Value::to_display() const {
    std::vector<const std::vector<Value>*> open;
    return display(open, false);
}

std::string Value::to_repr() const {
    std::vector<const std::vector<Value>*> open;
    return display(open, true);
}

std::string Value::display(std::vector<const std::vector<Value>*>& open, bool quoted) const {
    switch (type()) {
        case Type::Nil: return "nil";
        case Type::Number: return format_number(as_number());
        case Type::String: return quoted ? "\"" + as_string() + "\"" : as_string();
        case Type::Bool: return as_bool() ? "true" : "false";
        case Type::List: {
            const std::vector<Value>* items = as_list().get();
            if (std::find(open.begin(), open.end(), items) != open.end()) return "[...]";
            if (open.size() >= kMaxNesting) {
                throw PuffingError(ErrorKind::RecursionError, "List is nested too deeply to display");
            }
            open.push_back(items);
            std::string out = "[";
            for (size_t i = 0; i < items->size(); ++i) {
                if (i) out += ", ";
                out += (*items)[i].display(open, true);
            }
            open.pop_back();
            return out + "]";
        }
        case Type::Function: return "<fn " + as_function()->name + ">";
    }
    return "";
}

const char* Value::type_name(Type t) {
    switch (t) {
        case Type::Nil: return "nil";
        case Type::Number: return "number";
        case Type::String: return "string";
        case Type::Bool: return "bool";
        case Type::List: return "list";
        case Type::Function: return "function";
    }
    return "unknown";
}

static bool equal(const Value& a, const Value& b, size_t depth) {
    if (a.type() != b.type()) return false;
    switch (a.type()) {
        case Value::Type::Nil: return true;
        case Value::Type::Number: return a.as_number() == b.as_number();
        case Value::Type::String: return a.as_string() == b.as_string();
        case Value::Type::Bool: return a.as_bool() == b.as_bool();
        case Value::Type::List: {
            const auto& x = *a.as_list();
            const auto& y = *b.as_list();
            if (&x == &y) return true;
            if (x.size() != y.size()) return false;
            if (depth >= Value::kMaxNesting) {
                throw PuffingError(ErrorKind::RecursionError, "Lists are nested too deeply to compare");
            }
            for (size_t i = 0; i < x.size(); ++i) {
                if (!equal(x[i], y[i], depth + 1)) return false;
            }
            return true;
        }
        case Value::Type::Function: return a.as_function() == b.as_function();
    }
    return false;
}

bool operator==(const Value& a, const Value& b) { return equal(a, b, 0); }

Value* Environment::find(const std::string& name) {
    for (Environment* env = this; env; env = env->parent_.get()) {
        auto it = env->values_.find(name);
        if (it != env->values_.end()) return &it->second;
    }
    return nullptr;
}
