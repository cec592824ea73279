#include <iostream>
#include <string>
#include <vector>
#include <chrono>
#include <thread>
#include <cstdlib>
#include <csignal>
#include <atomic>
#include <algorithm>
#include "api_router.hpp"
#include "http_server.hpp"
#include "executors/puffing_executor.hpp"

// Global flag for signal handling
static std::atomic<bool> g_interrupted{false};

static void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupted = true;
    }
}

// Very small CLI parser
struct Args {
    std::string host = "0.0.0.0";
    int port = 5000;
    int concurrency = std::max(1u, std::thread::hardware_concurrency());
    bool tls = false;
    std::string cert = "server.crt";
    std::string key = "server.key";
    size_t memory_limit_mb = 512;
    size_t max_output_bytes = OutputSink::kDefaultMaxBytes;
    int io_timeout = 30;
    bool verbose = true;
};

static void print_help(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--host ADDR] [--port N] [--concurrency N] [--tls --cert FILE --key FILE]\n"
              << "       [--memory-limit-mb N] [--max-output-bytes N] [--io-timeout SECONDS] [--quiet]\n";
    std::cout << "\nEnvironment:\n"
              << "  PORT         listen port when --port is not given\n"
              << "  ENVIRONMENT  'development' also allows localhost origins for CORS\n";
    std::cout << "\nThe server can be stopped gracefully with Ctrl+C (SIGINT) or SIGTERM.\n";
}

static bool parse_port(const std::string& s, int& out) {
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (s.empty() || *end != '\0' || v < 0 || v > 65535) return false;
    out = static_cast<int>(v);
    return true;
}

static Args parse_args(int argc, char** argv) {
    Args a;
    if (const char* env_port = std::getenv("PORT")) {
        if (!parse_port(env_port, a.port)) {
            std::cerr << "Ignoring invalid PORT value: " << env_port << "\n";
        }
    }
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if (s == "--help" || s == "-h") { print_help(argv[0]); std::exit(0); }
        else if (s == "--host" && i + 1 < argc) { a.host = argv[++i]; }
        else if (s == "--port" && i + 1 < argc) {
            if (!parse_port(argv[++i], a.port)) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                std::exit(2);
            }
        }
        else if (s == "--concurrency" && i + 1 < argc) { a.concurrency = std::max(1, std::atoi(argv[++i])); }
        else if (s == "--tls") { a.tls = true; }
        else if (s == "--cert" && i + 1 < argc) { a.cert = argv[++i]; }
        else if (s == "--key" && i + 1 < argc) { a.key = argv[++i]; }
        else if (s == "--memory-limit-mb" && i + 1 < argc) {
            a.memory_limit_mb = static_cast<size_t>(std::max(0LL, std::atoll(argv[++i])));
        }
        else if (s == "--max-output-bytes" && i + 1 < argc) {
            a.max_output_bytes = static_cast<size_t>(std::max(1LL, std::atoll(argv[++i])));
        }
        else if (s == "--io-timeout" && i + 1 < argc) { a.io_timeout = std::max(1, std::atoi(argv[++i])); }
        else if (s == "--quiet") { a.verbose = false; }
        else {
            std::cerr << "Unknown arg: " << s << "\n";
            print_help(argv[0]);
            std::exit(2);
        }
    }
    return a;
}

int main(int argc, char** argv) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    // A client hanging up mid-response must not kill the server.
    std::signal(SIGPIPE, SIG_IGN);

    auto args = parse_args(argc, argv);

    const char* env = std::getenv("ENVIRONMENT");
    const std::string environment = env ? env : "production";

    ExecutorConfig exec_cfg;
    exec_cfg.memory_limit_mb = args.memory_limit_mb;
    exec_cfg.max_output_bytes = args.max_output_bytes;
    PuffingExecutor executor{exec_cfg};
    ApiRouter router{executor, args.verbose};

    ServerOptions opts;
    opts.address = args.host;
    opts.port = static_cast<unsigned short>(args.port);
    opts.use_ssl = args.tls;
    opts.cert_file = args.cert;
    opts.key_file = args.key;
    opts.concurrency = args.concurrency;
    opts.allowed_origins = allowed_origins(environment);
    opts.io_timeout_seconds = args.io_timeout;
    opts.verbose = args.verbose;

    std::cout << "[main] Puffing Language API " << ApiRouter::kVersion << " (" << environment << ")" << std::endl;
    if (args.memory_limit_mb > 0) {
        std::cout << "[main] Worker memory limit: " << args.memory_limit_mb << " MiB" << std::endl;
    }

    HttpServer server{router, opts};
    if (!server.start()) {
        std::cerr << "Failed to start server on " << args.host << ":" << args.port << "\n";
        return 2;
    }

    while (!g_interrupted) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    std::cout << "\n[Signal] Received interrupt signal, shutting down gracefully..." << std::endl;
    server.stop();
    return 0;
}
