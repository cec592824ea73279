#pragma once
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <memory>
#include <string>
#include <thread>
#include <vector>

class ApiRouter;
class ThreadPool;

struct ServerOptions {
    std::string address = "0.0.0.0";
    unsigned short port = 5000;
    bool use_ssl = false;
    std::string cert_file = "server.crt";
    std::string key_file = "server.key";
    int concurrency = 1;
    std::vector<std::string> allowed_origins;
    int io_timeout_seconds = 30;    // per handshake, read, write and shutdown
    bool verbose = true;
};

// HTTP/1.1 front end: one request per connection, each connection served on
// the thread pool. Every socket operation runs under a deadline so a silent
// client cannot hold a pool thread or stall stop().
class HttpServer {
public:
    static constexpr size_t kMaxBodyBytes = 1 << 20;

    HttpServer(const ApiRouter& router, ServerOptions options);
    ~HttpServer();

    // Binds and starts accepting on a background thread. False if the
    // listener or TLS context could not be set up.
    bool start();
    void stop();

    bool running() const { return running_; }
    unsigned short port() const { return bound_port_; }

private:
    struct Connection;

    void accept_loop();
    void handle_connection(Connection& conn);
    template <class Stream> void serve(Stream& stream, Connection& conn);
    void wake_acceptor();

    const ApiRouter& router_;
    ServerOptions opts_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::unique_ptr<boost::asio::ssl::context> ssl_ctx_;
    std::unique_ptr<ThreadPool> thread_pool_;
    std::atomic<bool> running_{false};
    std::atomic<unsigned short> bound_port_{0};
    std::thread th_;
};
