#include "execution_result.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

double round_seconds(double seconds) {
    return std::round(std::max(0.0, seconds) * 10000.0) / 10000.0;
}

ExecutionResult ExecutionResult::ok(std::string output, double seconds) {
    ExecutionResult r;
    r.success = true;
    r.output = std::move(output);
    r.execution_time_seconds = round_seconds(seconds);
    return r;
}

ExecutionResult ExecutionResult::failure(ErrorKind kind, std::string message,
                                         std::optional<std::string> traceback, double seconds) {
    ExecutionResult r;
    r.success = false;
    r.error_kind = kind;
    r.error_message = std::move(message);
    r.traceback = std::move(traceback);
    r.execution_time_seconds = round_seconds(seconds);
    return r;
}

template <class T>
static nlohmann::json or_null(const std::optional<T>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

nlohmann::json to_json(const ExecutionResult& r) {
    return nlohmann::json{
        {"success", r.success},
        {"output", or_null(r.output)},
        {"error", or_null(r.error_message)},
        {"error_type", r.error_kind ? nlohmann::json(error_kind_name(*r.error_kind)) : nlohmann::json(nullptr)},
        {"traceback", or_null(r.traceback)},
        {"execution_time", r.execution_time_seconds},
    };
}

nlohmann::json to_json(const ValidationResult& r) {
    return nlohmann::json{
        {"valid", r.valid},
        {"error", or_null(r.error)},
        {"tokens", r.tokens ? *r.tokens : nlohmann::json(nullptr)},
    };
}
