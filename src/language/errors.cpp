#include "errors.hpp"
#include <utility>

static std::string with_location(const std::string& message, int line, int column) {
    if (line <= 0) return message;
    return message + " at line " + std::to_string(line) + ", column " + std::to_string(column);
}

PuffingError::PuffingError(ErrorKind kind, const std::string& message, int line, int column)
    : std::runtime_error(with_location(message, line, column)),
      kind_(kind),
      message_(message),
      line_(line),
      column_(column) {}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::LexerError: return "LexerError";
        case ErrorKind::ParserError: return "ParserError";
        case ErrorKind::NameError: return "NameError";
        case ErrorKind::TypeError: return "TypeError";
        case ErrorKind::ZeroDivisionError: return "ZeroDivisionError";
        case ErrorKind::RecursionError: return "RecursionError";
        case ErrorKind::InputError: return "InputError";
        case ErrorKind::RuntimeError: return "RuntimeError";
        case ErrorKind::TimeoutError: return "TimeoutError";
        case ErrorKind::MemoryError: return "MemoryError";
        case ErrorKind::InvalidRequest: return "InvalidRequest";
        case ErrorKind::UnexpectedError: return "UnexpectedError";
    }
    return "UnexpectedError";
}

bool error_kind_from_name(const std::string& name, ErrorKind& out) {
    static const std::pair<const char*, ErrorKind> table[] = {
        {"LexerError", ErrorKind::LexerError},
        {"ParserError", ErrorKind::ParserError},
        {"NameError", ErrorKind::NameError},
        {"TypeError", ErrorKind::TypeError},
        {"ZeroDivisionError", ErrorKind::ZeroDivisionError},
        {"RecursionError", ErrorKind::RecursionError},
        {"InputError", ErrorKind::InputError},
        {"RuntimeError", ErrorKind::RuntimeError},
        {"TimeoutError", ErrorKind::TimeoutError},
        {"MemoryError", ErrorKind::MemoryError},
        {"InvalidRequest", ErrorKind::InvalidRequest},
        {"UnexpectedError", ErrorKind::UnexpectedError},
    };
    for (const auto& [n, k] : table) {
        if (name == n) { out = k; return true; }
    }
    return false;
}

bool is_language_error(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::LexerError:
        case ErrorKind::ParserError:
        case ErrorKind::NameError:
        case ErrorKind::TypeError:
        case ErrorKind::ZeroDivisionError:
        case ErrorKind::RecursionError:
        case ErrorKind::InputError:
        case ErrorKind::RuntimeError:
            return true;
        case ErrorKind::TimeoutError:
        case ErrorKind::MemoryError:
        case ErrorKind::InvalidRequest:
        case ErrorKind::UnexpectedError:
            return false;
    }
    return false;
}
