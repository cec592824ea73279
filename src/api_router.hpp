#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

class PuffingExecutor;

struct ApiResponse {
    unsigned status{200};
    nlohmann::json body;        // null: no body
};

// Maps one HTTP request onto the executor. Transport agnostic so the whole
// request contract can be exercised without a socket.
class ApiRouter {
public:
    using json = nlohmann::json;

    static constexpr const char* kVersion = "0.1.0";
    static constexpr int kDefaultTimeout = 5;
    static constexpr int kMinTimeout = 1;
    static constexpr int kMaxTimeout = 30;

    explicit ApiRouter(const PuffingExecutor& executor, bool verbose = true);

    ApiResponse handle(const std::string& method, const std::string& target, const std::string& body) const;

private:
    ApiResponse root() const;
    ApiResponse health() const;
    ApiResponse execute(const std::string& body) const;
    ApiResponse validate(const std::string& body) const;

    const PuffingExecutor& executor_;
    bool verbose_;
};

// Origins allowed to call the API from a browser; `environment` is the value
// of the ENVIRONMENT variable.
std::vector<std::string> allowed_origins(const std::string& environment);
bool origin_allowed(const std::vector<std::string>& allowed, const std::string& origin);
