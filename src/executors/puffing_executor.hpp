#pragma once
#include "execution_result.hpp"
#include "output_sink.hpp"
#include "validation_cache.hpp"
#include "language/ilanguage.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

struct ExecutorConfig {
    size_t memory_limit_mb{0};                              // 0: no address-space limit
    size_t max_output_bytes{OutputSink::kDefaultMaxBytes};
    size_t validation_cache_size{256};
    size_t validation_cache_bytes{ValidationCache::kDefaultMaxBytes};
};

// Runs Puffing programs under a wall-clock deadline with isolated output.
//
// Each execute() call forks a worker process that tokenizes, parses and runs
// the program with its output bound to a private OutputSink, then reports a
// single JSON outcome over a pipe. The parent races that report against the
// deadline and SIGKILLs the worker when it expires, so a program stuck in a
// tight loop is stopped without its cooperation.
//
// execute() and validate_syntax() are safe to call from many threads at once.
class PuffingExecutor {
public:
    using json = nlohmann::json;

    static constexpr const char* kEmptyOutputPlaceholder = "Program executed successfully!";

    explicit PuffingExecutor(ExecutorConfig cfg = {},
                             std::shared_ptr<const ILanguage> language = std::make_shared<PuffingLanguage>());

    // Never throws; every failure is reported through the result.
    ExecutionResult execute(const std::string& source, int timeout_seconds,
                            const std::vector<json>& input_values = {}) const;

    // Tokenize + parse only. No worker, no deadline, no output capture.
    ValidationResult validate_syntax(const std::string& source) const;

    const ExecutorConfig& config() const { return cfg_; }
    size_t cached_validations() const { return cache_.size(); }

private:
    using Clock = std::chrono::steady_clock;

    ExecutionResult execute_isolated(const std::string& source, int timeout_seconds,
                                     const std::vector<json>& input_values, Clock::time_point start) const;
    [[noreturn]] void run_worker(int result_fd, const std::string& source, int timeout_seconds,
                                 const std::vector<json>& input_values) const;
    json run_pipeline(const std::string& source, const std::vector<json>& input_values) const;
    ValidationResult validate_uncached(const std::string& source, bool& cacheable) const;

    ExecutorConfig cfg_;
    std::shared_ptr<const ILanguage> language_;
    mutable ValidationCache cache_;
};
