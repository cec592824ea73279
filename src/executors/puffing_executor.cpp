#include "puffing_executor.hpp"
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <csignal>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <iostream>
#include <new>
#include <poll.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace {

using json = nlohmann::json;

// Owns one end of a pipe; closes it on every path out of execute().
class FdGuard {
public:
    explicit FdGuard(int fd = -1) : fd_(fd) {}
    ~FdGuard() { reset(); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    void reset() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_;
};

enum class WorkerStatus { Ok, LanguageError, MemoryError, UnexpectedError, Unknown };

WorkerStatus worker_status(const std::string& s) {
    if (s == "ok") return WorkerStatus::Ok;
    if (s == "language_error") return WorkerStatus::LanguageError;
    if (s == "memory_error") return WorkerStatus::MemoryError;
    if (s == "unexpected_error") return WorkerStatus::UnexpectedError;
    return WorkerStatus::Unknown;
}

struct WorkerReport {
    bool timed_out{false};
    std::string payload;
    std::string io_error;
    int status{0};
    bool reaped{false};
};

bool write_all(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

// A forked worker inherits every descriptor the server holds, including the
// write ends of other workers' result pipes; keeping those open would delay
// the other callers' EOF until this worker dies.
void close_inherited_fds(int keep) {
    if (DIR* dir = opendir("/proc/self/fd")) {
        int self = dirfd(dir);
        std::vector<int> fds;
        while (dirent* e = readdir(dir)) {
            if (e->d_name[0] == '.') continue;
            int fd = std::atoi(e->d_name);
            if (fd > STDERR_FILENO && fd != keep && fd != self) fds.push_back(fd);
        }
        closedir(dir);
        for (int fd : fds) ::close(fd);
        return;
    }
    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0 || max_fd > 65536) max_fd = 65536;
    for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) {
        if (fd != keep) ::close(fd);
    }
}

// Address space the worker already has mapped when it starts: the server's
// heap arenas and thread stacks come along with fork().
rlim_t mapped_bytes() {
    FILE* f = std::fopen("/proc/self/statm", "r");
    if (!f) return 0;
    unsigned long pages = 0;
    int n = std::fscanf(f, "%lu", &pages);
    std::fclose(f);
    if (n != 1) return 0;
    return static_cast<rlim_t>(pages) * static_cast<rlim_t>(sysconf(_SC_PAGESIZE));
}

// The memory limit is headroom on top of what fork() inherited, so a server
// with many threads does not leave its workers unable to allocate at all.
std::string apply_limits(size_t memory_limit_mb, int timeout_seconds) {
    struct rlimit rl;
    if (memory_limit_mb > 0) {
        rlim_t want = mapped_bytes() + static_cast<rlim_t>(memory_limit_mb) * 1024 * 1024;
        struct rlimit current;
        if (getrlimit(RLIMIT_AS, &current) == 0 && current.rlim_max != RLIM_INFINITY && current.rlim_max < want) {
            want = current.rlim_max;
        }
        rl.rlim_cur = rl.rlim_max = want;
        if (setrlimit(RLIMIT_AS, &rl) != 0) return std::string("RLIMIT_AS: ") + std::strerror(errno);
    }
    rl.rlim_cur = rl.rlim_max = static_cast<rlim_t>(timeout_seconds) + 1;
    if (setrlimit(RLIMIT_CPU, &rl) != 0) return std::string("RLIMIT_CPU: ") + std::strerror(errno);
    rl.rlim_cur = rl.rlim_max = 0;
    if (setrlimit(RLIMIT_FSIZE, &rl) != 0) return std::string("RLIMIT_FSIZE: ") + std::strerror(errno);
    return "";
}

// Reads the worker's report until EOF or the deadline, whichever comes first.
WorkerReport collect(int fd, pid_t pid, std::chrono::steady_clock::time_point deadline) {
    using namespace std::chrono;
    WorkerReport r;
    char buf[8192];

    for (;;) {
        auto now = steady_clock::now();
        if (now >= deadline) { r.timed_out = true; break; }
        auto remaining = duration_cast<milliseconds>(deadline - now).count() + 1;

        struct pollfd pfd{fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (rc < 0) {
            if (errno == EINTR) continue;
            r.io_error = std::string("poll failed: ") + std::strerror(errno);
            break;
        }
        if (rc == 0) continue;

        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) { r.payload.append(buf, static_cast<size_t>(n)); continue; }
        if (n == 0) break;
        if (errno == EINTR || errno == EAGAIN) continue;
        r.io_error = std::string("read failed: ") + std::strerror(errno);
        break;
    }

    if (r.timed_out || !r.io_error.empty()) {
        if (::kill(pid, SIGKILL) != 0 && errno != ESRCH) {
            std::cerr << "[executor] kill(" << pid << ") failed: " << std::strerror(errno) << std::endl;
        }
    }
    for (;;) {
        pid_t w = ::waitpid(pid, &r.status, 0);
        if (w == pid) { r.reaped = true; break; }
        if (w < 0 && errno == EINTR) continue;
        break;
    }
    return r;
}

json token_value(const Token& t) {
    switch (t.type) {
        case TokenType::END_OF_FILE: return nullptr;
        case TokenType::NUMBER: {
            double d = t.number;
            if (std::floor(d) == d && d >= -9.0e15 && d <= 9.0e15) return static_cast<long long>(d);
            return d;
        }
        default: return t.text;
    }
}

} // namespace

PuffingExecutor::PuffingExecutor(ExecutorConfig cfg, std::shared_ptr<const ILanguage> language)
    : cfg_(cfg), language_(std::move(language)), cache_(cfg.validation_cache_size, cfg.validation_cache_bytes) {}

// ------------------ execute ------------------

ExecutionResult PuffingExecutor::execute(const std::string& source, int timeout_seconds,
                                         const std::vector<json>& input_values) const {
    auto start = Clock::now();
    auto elapsed = [&] { return std::chrono::duration<double>(Clock::now() - start).count(); };

    if (timeout_seconds <= 0) {
        return ExecutionResult::failure(ErrorKind::InvalidRequest,
                                        "Timeout must be a positive number of seconds (got " +
                                            std::to_string(timeout_seconds) + ")",
                                        std::nullopt, elapsed());
    }

    try {
        return execute_isolated(source, timeout_seconds, input_values, start);
    } catch (const std::exception& e) {
        std::cerr << "[executor] internal failure: " << e.what() << std::endl;
        return ExecutionResult::failure(ErrorKind::UnexpectedError,
                                        std::string("Unexpected error: ") + e.what(), std::nullopt, elapsed());
    }
}

ExecutionResult PuffingExecutor::execute_isolated(const std::string& source, int timeout_seconds,
                                                  const std::vector<json>& input_values,
                                                  Clock::time_point start) const {
    auto elapsed = [&] { return std::chrono::duration<double>(Clock::now() - start).count(); };
    auto unexpected = [&](const std::string& what, std::optional<std::string> trace = std::nullopt) {
        std::cerr << "[executor] " << what << std::endl;
        return ExecutionResult::failure(ErrorKind::UnexpectedError, "Unexpected error: " + what,
                                        std::move(trace), elapsed());
    };

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == -1) {
        return unexpected(std::string("failed to create result pipe: ") + std::strerror(errno));
    }
    FdGuard read_end(fds[0]);
    FdGuard write_end(fds[1]);

    const auto deadline = start + std::chrono::seconds(timeout_seconds);

    pid_t pid = ::fork();
    if (pid == -1) {
        return unexpected(std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        run_worker(write_end.get(), source, timeout_seconds, input_values);
    }
    write_end.reset();

    WorkerReport report = collect(read_end.get(), pid, deadline);
    read_end.reset();

    if (report.timed_out) {
        return ExecutionResult::failure(ErrorKind::TimeoutError,
                                        "Execution timed out after " + std::to_string(timeout_seconds) + " seconds",
                                        std::nullopt, elapsed());
    }
    if (!report.io_error.empty()) return unexpected(report.io_error);

    if (report.payload.empty()) {
        if (report.reaped && WIFSIGNALED(report.status)) {
            int sig = WTERMSIG(report.status);
            if (sig == SIGXCPU) {
                return ExecutionResult::failure(ErrorKind::TimeoutError,
                                                "Execution timed out after " + std::to_string(timeout_seconds) + " seconds",
                                                std::nullopt, elapsed());
            }
            return unexpected("worker terminated by signal " + std::to_string(sig) + " (" + strsignal(sig) + ")");
        }
        if (report.reaped && WIFEXITED(report.status)) {
            return unexpected("worker exited with status " + std::to_string(WEXITSTATUS(report.status)) +
                              " without reporting a result");
        }
        return unexpected("worker produced no result");
    }

    json msg = json::parse(report.payload, nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) return unexpected("worker sent a malformed result");

    const std::string message = msg.value("message", std::string());
    std::optional<std::string> trace;
    if (msg.contains("traceback") && msg["traceback"].is_string()) trace = msg["traceback"].get<std::string>();

    switch (worker_status(msg.value("status", std::string()))) {
        case WorkerStatus::Ok: {
            std::string output = msg.value("output", std::string());
            if (output.empty()) output = kEmptyOutputPlaceholder;
            return ExecutionResult::ok(std::move(output), elapsed());
        }
        case WorkerStatus::LanguageError: {
            ErrorKind kind;
            if (!error_kind_from_name(msg.value("kind", std::string()), kind) || !is_language_error(kind)) {
                return unexpected("worker reported an unknown error kind: " + msg.value("kind", std::string()));
            }
            return ExecutionResult::failure(kind, message, std::move(trace), elapsed());
        }
        case WorkerStatus::MemoryError:
            return ExecutionResult::failure(ErrorKind::MemoryError, message, std::move(trace), elapsed());
        case WorkerStatus::UnexpectedError:
            return ExecutionResult::failure(ErrorKind::UnexpectedError, "Unexpected error: " + message,
                                            std::move(trace), elapsed());
        case WorkerStatus::Unknown:
            break;
    }
    return unexpected("worker sent an unknown status");
}

// ------------------ worker process ------------------

void PuffingExecutor::run_worker(int result_fd, const std::string& source, int timeout_seconds,
                                 const std::vector<json>& input_values) const {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    // Nothing the worker does may reach the server's own stdio.
    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        ::dup2(devnull, STDOUT_FILENO);
        ::dup2(devnull, STDERR_FILENO);
        if (devnull > STDERR_FILENO) ::close(devnull);
    }
    close_inherited_fds(result_fd);

    std::string payload;
    try {
        json msg;
        std::string limit_error = apply_limits(cfg_.memory_limit_mb, timeout_seconds);
        if (!limit_error.empty()) {
            msg = {{"status", "unexpected_error"}, {"message", "failed to apply resource limits: " + limit_error}};
        } else {
            msg = run_pipeline(source, input_values);
        }
        payload = msg.dump(-1, ' ', false, json::error_handler_t::replace);
    } catch (const std::exception&) {
        payload = R"({"status":"unexpected_error","message":"worker failed to encode its result"})";
    }

    int code = write_all(result_fd, payload) ? 0 : 1;
    ::close(result_fd);
    ::_exit(code);
}

PuffingExecutor::json PuffingExecutor::run_pipeline(const std::string& source,
                                                    const std::vector<json>& input_values) const {
    OutputSink sink(cfg_.max_output_bytes);
    RunContext ctx;
    ctx.inputs = input_values;
    try {
        ScopedOutputRedirect redirect(sink, ctx.output);
        TokenList tokens = language_->tokenize(source);
        std::unique_ptr<Program> program = language_->parse(tokens);
        language_->run(*program, ctx);
    } catch (const PuffingError& e) {
        json msg = {{"status", "language_error"}, {"kind", error_kind_name(e.kind())}, {"message", e.what()}};
        std::string trace = e.trace();
        trace += std::string(error_kind_name(e.kind())) + ": " + e.what() + "\n";
        msg["traceback"] = trace;
        return msg;
    } catch (const std::bad_alloc&) {
        return {{"status", "memory_error"}, {"message", "Program exceeded the memory limit"}};
    } catch (const std::exception& e) {
        return {{"status", "unexpected_error"}, {"message", e.what()}};
    }
    return {{"status", "ok"}, {"output", sink.contents()}};
}

// ------------------ validate_syntax ------------------

ValidationResult PuffingExecutor::validate_syntax(const std::string& source) const {
    const std::string key = ValidationCache::computeHash(source);
    if (auto hit = cache_.get(key)) return *hit;

    bool cacheable = false;
    auto result = std::make_shared<const ValidationResult>(validate_uncached(source, cacheable));
    if (cacheable) cache_.put(key, result);
    return *result;
}

ValidationResult PuffingExecutor::validate_uncached(const std::string& source, bool& cacheable) const {
    ValidationResult r;
    try {
        TokenList tokens = language_->tokenize(source);
        language_->parse(tokens);

        json list = json::array();
        for (const auto& t : tokens) {
            list.push_back({{"type", token_type_name(t.type)}, {"value", token_value(t)}});
        }
        r.valid = true;
        r.tokens = std::move(list);
        cacheable = true;
    } catch (const PuffingError& e) {
        r.valid = false;
        r.error = e.what();
        cacheable = true;
    } catch (const std::exception& e) {
        r.valid = false;
        r.error = std::string("Unexpected error: ") + e.what();
        cacheable = false;
    }
    return r;
}
