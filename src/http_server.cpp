// http_server.cpp
#include "http_server.hpp"
#include "api_router.hpp"
#include "thread_pool.hpp"
#include <boost/asio/error.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <iostream>
#include <utility>

using tcp = boost::asio::ip::tcp;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace ssl = boost::asio::ssl;

// Helper: treat these errors as normal client disconnects (not server fatal)
static bool is_normal_disconnect(const boost::system::error_code& ec){
    if(!ec) return false;
    return ec == boost::asio::error::eof
        || ec == boost::asio::error::connection_reset
        || ec == boost::asio::error::connection_aborted
        || ec == boost::asio::error::broken_pipe
        || ec == http::error::end_of_stream
        || ec == boost::asio::ssl::error::stream_truncated;
}

static std::string to_string(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

// Each connection owns an io_context so its operations can be driven from the
// pool thread serving it while the stream's timer bounds them.
struct HttpServer::Connection {
    boost::asio::io_context io;
    tcp::socket socket{io};
};

// Starts one asynchronous operation and runs the connection's context until
// it completes or its deadline fires.
template <class Start>
static boost::system::error_code run_op(boost::asio::io_context& io, Start&& start){
    boost::system::error_code result;
    start([&result](boost::system::error_code ec, std::size_t = 0){ result = ec; });
    io.restart();
    io.run();
    return result;
}

HttpServer::HttpServer(const ApiRouter& router, ServerOptions options)
    : router_(router), opts_(std::move(options)), acceptor_(ioc_) {
    thread_pool_ = std::make_unique<ThreadPool>(static_cast<size_t>(std::max(1, opts_.concurrency)));
}

HttpServer::~HttpServer(){ stop(); }

bool HttpServer::start(){
    if(running_) return false;

    boost::system::error_code ec;
    if(opts_.use_ssl){
        ssl_ctx_ = std::make_unique<ssl::context>(ssl::context::tlsv12_server);
        ssl_ctx_->use_certificate_chain_file(opts_.cert_file, ec);
        if(ec){
            std::cerr << "[server] cannot load certificate " << opts_.cert_file << ": " << ec.message() << std::endl;
            return false;
        }
        ssl_ctx_->use_private_key_file(opts_.key_file, ssl::context::pem, ec);
        if(ec){
            std::cerr << "[server] cannot load private key " << opts_.key_file << ": " << ec.message() << std::endl;
            return false;
        }
    }

    auto address = boost::asio::ip::make_address(opts_.address, ec);
    if(ec){
        std::cerr << "[server] invalid listen address " << opts_.address << ": " << ec.message() << std::endl;
        return false;
    }
    tcp::endpoint endpoint{address, opts_.port};

    acceptor_.open(endpoint.protocol(), ec);
    if(ec){
        std::cerr << "[server] acceptor.open error: " << ec.message() << std::endl;
        return false;
    }
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if(ec){
        std::cerr << "[server] setting reuse_address failed: " << ec.message() << std::endl;
    }
    acceptor_.bind(endpoint, ec);
    if(ec){
        std::cerr << "[server] bind error: " << ec.message() << std::endl;
        acceptor_.close(ec);
        return false;
    }
    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if(ec){
        std::cerr << "[server] listen error: " << ec.message() << std::endl;
        acceptor_.close(ec);
        return false;
    }
    bound_port_ = acceptor_.local_endpoint(ec).port();

    std::cout << "[server] Listening on " << (opts_.use_ssl ? "https://" : "http://")
              << opts_.address << ":" << bound_port_.load() << std::endl;
    std::cout << "[server] Concurrent processing enabled: " << thread_pool_->size() << " threads" << std::endl;

    running_ = true;
    th_ = std::thread(&HttpServer::accept_loop, this);
    return true;
}

void HttpServer::stop(){
    if(!running_.exchange(false)) return;
    wake_acceptor();
    if(th_.joinable()) th_.join();
    thread_pool_->wait_idle();
    boost::system::error_code ec;
    acceptor_.close(ec);
    std::cout << "[server] Stopped" << std::endl;
}

// The accept loop blocks in accept(); a throwaway connection lets it observe
// running_ == false.
void HttpServer::wake_acceptor(){
    boost::system::error_code ec;
    auto local = acceptor_.local_endpoint(ec);
    if(ec) return;
    auto address = local.address();
    if(address.is_unspecified()){
        address = address.is_v6() ? boost::asio::ip::address(boost::asio::ip::address_v6::loopback())
                                  : boost::asio::ip::address(boost::asio::ip::address_v4::loopback());
    }
    boost::asio::io_context ioc;
    tcp::socket s{ioc};
    s.connect(tcp::endpoint{address, local.port()}, ec);
    if(ec) std::cerr << "[server] could not wake acceptor: " << ec.message() << std::endl;
    s.close(ec);
}

void HttpServer::accept_loop(){
    while(running_){
        auto conn = std::make_shared<Connection>();
        boost::system::error_code accept_ec;
        acceptor_.accept(conn->socket, accept_ec);
        if(!running_) break;
        if(accept_ec){
            std::cerr << "[server] accept error: " << accept_ec.message() << std::endl;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }

        // Process each connection in thread pool
        try{
            thread_pool_->enqueue([this, conn]{ handle_connection(*conn); });
        }catch(std::exception const& e){
            std::cerr << "[server] could not dispatch connection: " << e.what() << std::endl;
        }
    }
}

void HttpServer::handle_connection(Connection& conn){
    const auto timeout = std::chrono::seconds(std::max(1, opts_.io_timeout_seconds));
    try{
        if(opts_.use_ssl){
            ssl::stream<beast::tcp_stream> ssl_stream{beast::tcp_stream(std::move(conn.socket)), *ssl_ctx_};

            beast::get_lowest_layer(ssl_stream).expires_after(timeout);
            auto hs_ec = run_op(conn.io, [&](auto handler){
                ssl_stream.async_handshake(ssl::stream_base::server, handler);
            });
            if(hs_ec){
                if(hs_ec == beast::error::timeout){
                    if(opts_.verbose) std::cerr << "[server] SSL handshake timed out" << std::endl;
                } else if(is_normal_disconnect(hs_ec)){
                    if(opts_.verbose) std::cerr << "[server] SSL handshake aborted by client: " << hs_ec.message() << std::endl;
                } else {
                    std::cerr << "[server] SSL handshake error: " << hs_ec.message() << std::endl;
                }
                beast::get_lowest_layer(ssl_stream).close();
                return;
            }

            serve(ssl_stream, conn);

            beast::get_lowest_layer(ssl_stream).expires_after(timeout);
            auto shutdown_ec = run_op(conn.io, [&](auto handler){
                ssl_stream.async_shutdown(handler);
            });
            if(shutdown_ec && !is_normal_disconnect(shutdown_ec) && shutdown_ec != beast::error::timeout
               && shutdown_ec.value() != EBADF){
                std::cerr << "[server] SSL shutdown error: " << shutdown_ec.message() << std::endl;
            }
            beast::get_lowest_layer(ssl_stream).close();
        } else {
            beast::tcp_stream stream{std::move(conn.socket)};
            serve(stream, conn);

            boost::system::error_code close_ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, close_ec);
            stream.close();
        }
    }catch(std::exception const& e){
        std::cerr << "[server] connection handler exception: " << e.what() << std::endl;
    }
}

template <class Stream>
void HttpServer::serve(Stream& stream, Connection& conn){
    const auto timeout = std::chrono::seconds(std::max(1, opts_.io_timeout_seconds));
    beast::flat_buffer buffer;
    http::request_parser<http::string_body> parser;
    parser.body_limit(kMaxBodyBytes);

    beast::get_lowest_layer(stream).expires_after(timeout);
    auto read_ec = run_op(conn.io, [&](auto handler){
        http::async_read(stream, buffer, parser, handler);
    });

    http::response<http::string_body> res;
    std::string method, target;
    if(read_ec == http::error::body_limit){
        res = http::response<http::string_body>{http::status::payload_too_large, 11};
        res.set(http::field::content_type, "application/json");
        res.body() = R"({"detail":"Request body too large"})";
        method = "?";
        target = "?";
    } else if(read_ec){
        if(read_ec == beast::error::timeout){
            if(opts_.verbose) std::cerr << "[server] client sent no request in time" << std::endl;
        } else if(is_normal_disconnect(read_ec)){
            if(opts_.verbose) std::cerr << "[server] client disconnected (read): " << read_ec.message() << std::endl;
        } else {
            std::cerr << "[server] HTTP read error: " << read_ec.message() << std::endl;
        }
        return;
    } else {
        const auto& req = parser.get();
        method = to_string(req.method_string());
        target = to_string(req.target());
        const std::string origin = to_string(req[http::field::origin]);

        ApiResponse api = router_.handle(method, target, req.body());

        res = http::response<http::string_body>{static_cast<http::status>(api.status), req.version()};
        if(!api.body.is_null()){
            res.set(http::field::content_type, "application/json");
            res.body() = api.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }
        if(origin_allowed(opts_.allowed_origins, origin)){
            res.set(http::field::access_control_allow_origin, origin);
            res.set(http::field::access_control_allow_credentials, "true");
            res.set(http::field::vary, "Origin");
            if(req.method() == http::verb::options){
                const std::string requested = to_string(req[http::field::access_control_request_headers]);
                res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
                res.set(http::field::access_control_allow_headers, requested.empty() ? "*" : requested);
                res.set(http::field::access_control_max_age, "600");
            }
        }
    }

    res.set(http::field::server, "puffing-runner");
    res.keep_alive(false);
    res.prepare_payload();

    if(opts_.verbose){
        std::cout << "[server] " << method << " " << target << " -> " << res.result_int() << std::endl;
    }

    beast::get_lowest_layer(stream).expires_after(timeout);
    auto write_ec = run_op(conn.io, [&](auto handler){
        http::async_write(stream, res, handler);
    });
    if(write_ec){
        if(write_ec == beast::error::timeout){
            if(opts_.verbose) std::cerr << "[server] client stopped reading the response" << std::endl;
        } else if(is_normal_disconnect(write_ec)){
            if(opts_.verbose) std::cerr << "[server] client disconnected (write): " << write_ec.message() << std::endl;
        } else {
            std::cerr << "[server] HTTP write error: " << write_ec.message() << std::endl;
        }
    }
}
