#pragma once
#include "language/errors.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

struct ExecutionResult {
    bool success{false};
    std::optional<std::string> output;          // success only
    std::optional<std::string> error_message;   // failure only
    std::optional<ErrorKind> error_kind;        // failure only
    std::optional<std::string> traceback;       // failure only, best effort
    double execution_time_seconds{0.0};         // rounded to 4 decimals

    static ExecutionResult ok(std::string output, double seconds);
    static ExecutionResult failure(ErrorKind kind, std::string message,
                                   std::optional<std::string> traceback, double seconds);
};

struct ValidationResult {
    bool valid{false};
    std::optional<std::string> error;           // invalid only
    std::optional<nlohmann::json> tokens;       // valid only: [{type, value}, ...]
};

double round_seconds(double seconds);

// Wire format shared with the HTTP layer; absent fields are emitted as null.
nlohmann::json to_json(const ExecutionResult& r);
nlohmann::json to_json(const ValidationResult& r);
