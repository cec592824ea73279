#include "api_router.hpp"
#include "executors/puffing_executor.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

using json = nlohmann::json;

static bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\n\r\f\v") == std::string::npos;
}

static ApiResponse detail(unsigned status, const std::string& message) {
    return ApiResponse{status, json{{"detail", message}}};
}

std::vector<std::string> allowed_origins(const std::string& environment) {
    std::vector<std::string> origins = {
        "https://puffingmanual.web.app",
        "https://puffingmanual.firebaseapp.com",
    };
    if (environment == "development") {
        origins.push_back("http://localhost:5173");
        origins.push_back("http://localhost:5000");
    }
    return origins;
}

bool origin_allowed(const std::vector<std::string>& allowed, const std::string& origin) {
    return !origin.empty() && std::find(allowed.begin(), allowed.end(), origin) != allowed.end();
}

ApiRouter::ApiRouter(const PuffingExecutor& executor, bool verbose)
    : executor_(executor), verbose_(verbose) {}

ApiResponse ApiRouter::handle(const std::string& method, const std::string& target, const std::string& body) const {
    const std::string path = target.substr(0, target.find('?'));
    const bool known = path == "/" || path == "/health" || path == "/execute" || path == "/validate";

    try {
        if (!known) return detail(404, "Not Found");
        if (method == "OPTIONS") return ApiResponse{204, nullptr};

        if (path == "/" && method == "GET") return root();
        if (path == "/health" && method == "GET") return health();
        if (path == "/execute" && method == "POST") return execute(body);
        if (path == "/validate" && method == "POST") return validate(body);
        return detail(405, "Method Not Allowed");
    } catch (const std::exception& e) {
        std::cerr << "[api] Unhandled exception on " << method << " " << path << ": " << e.what() << std::endl;
        return ApiResponse{500, json{{"detail", "Internal server error"}, {"error", e.what()}}};
    }
}

ApiResponse ApiRouter::root() const {
    return ApiResponse{200, json{
        {"message", "Puffing Language API"},
        {"version", kVersion},
        {"docs", "/docs"},
        {"health", "/health"},
    }};
}

ApiResponse ApiRouter::health() const {
    return ApiResponse{200, json{{"status", "ok"}, {"version", kVersion}, {"language", "Puffing"}}};
}

ApiResponse ApiRouter::execute(const std::string& body) const {
    json req = json::parse(body, nullptr, false);
    if (req.is_discarded() || !req.is_object()) return detail(422, "Request body must be a JSON object");
    if (!req.contains("code") || !req["code"].is_string()) {
        return detail(422, "Field 'code' is required and must be a string");
    }

    long long timeout = kDefaultTimeout;
    if (req.contains("timeout") && !req["timeout"].is_null()) {
        const json& t = req["timeout"];
        if (t.is_number_integer()) {
            timeout = t.get<long long>();
        } else if (t.is_number_float() && std::floor(t.get<double>()) == t.get<double>() &&
                   std::fabs(t.get<double>()) < 1e9) {
            timeout = static_cast<long long>(t.get<double>());
        } else {
            return detail(422, "Field 'timeout' must be an integer");
        }
        if (timeout < kMinTimeout || timeout > kMaxTimeout) {
            return detail(422, "Field 'timeout' must be between " + std::to_string(kMinTimeout) + " and " +
                                   std::to_string(kMaxTimeout));
        }
    }

    std::vector<json> inputs;
    if (req.contains("input_values") && !req["input_values"].is_null()) {
        if (!req["input_values"].is_array()) return detail(422, "Field 'input_values' must be an array");
        for (const auto& v : req["input_values"]) inputs.push_back(v);
    }

    const std::string code = req["code"].get<std::string>();
    if (is_blank(code)) return detail(400, "Code cannot be empty");

    if (verbose_) std::cout << "[api] Executing code (length: " << code.size() << " chars)" << std::endl;
    ExecutionResult result = executor_.execute(code, static_cast<int>(timeout), inputs);
    if (verbose_) {
        std::cout << "[api] Execution completed: success=" << (result.success ? "true" : "false")
                  << ", time=" << result.execution_time_seconds << "s" << std::endl;
    }
    return ApiResponse{200, to_json(result)};
}

ApiResponse ApiRouter::validate(const std::string& body) const {
    json req = json::parse(body, nullptr, false);
    if (req.is_discarded() || !req.is_object()) return detail(422, "Request body must be a JSON object");
    if (!req.contains("code") || !req["code"].is_string()) {
        return detail(422, "Field 'code' is required and must be a string");
    }

    const std::string code = req["code"].get<std::string>();
    if (is_blank(code)) {
        ValidationResult empty;
        empty.error = "Code cannot be empty";
        return ApiResponse{200, to_json(empty)};
    }

    if (verbose_) std::cout << "[api] Validating code (length: " << code.size() << " chars)" << std::endl;
    ValidationResult result = executor_.validate_syntax(code);
    if (verbose_) std::cout << "[api] Validation completed: valid=" << (result.valid ? "true" : "false") << std::endl;
    return ApiResponse{200, to_json(result)};
}
