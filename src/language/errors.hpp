#pragma once
#include <stdexcept>
#include <string>
#include <utility>

// Closed set of failure kinds reported by the runner. The first group is raised
// by the language pipeline itself, the second only by the execution harness.
enum class ErrorKind {
    LexerError,
    ParserError,
    NameError,
    TypeError,
    ZeroDivisionError,
    RecursionError,
    InputError,
    RuntimeError,

    TimeoutError,
    MemoryError,
    InvalidRequest,
    UnexpectedError,
};

const char* error_kind_name(ErrorKind kind);
bool error_kind_from_name(const std::string& name, ErrorKind& out);
bool is_language_error(ErrorKind kind);

// Base class for every error the Puffing pipeline raises about a user program.
class PuffingError : public std::runtime_error {
public:
    PuffingError(ErrorKind kind, const std::string& message, int line = 0, int column = 0);

    ErrorKind kind() const { return kind_; }
    const std::string& message() const { return message_; }
    int line() const { return line_; }
    int column() const { return column_; }

    // Interpreter call stack captured where the error was raised; empty for
    // lexer and parser errors.
    const std::string& trace() const { return trace_; }
    void set_trace(std::string trace) { trace_ = std::move(trace); }

private:
    ErrorKind kind_;
    std::string message_;
    int line_;
    int column_;
    std::string trace_;
};
