#include <gtest/gtest.h>
#include "api_router.hpp"
#include "executors/puffing_executor.hpp"
#include "http_server.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <thread>

namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

class HttpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ServerOptions opts;
        opts.address = "127.0.0.1";
        opts.port = 0;
        opts.concurrency = 2;
        opts.io_timeout_seconds = 1;
        opts.verbose = false;
        server_ = std::make_unique<HttpServer>(router_, opts);
        ASSERT_TRUE(server_->start());
        ASSERT_NE(server_->port(), 0);
    }

    void TearDown() override { server_->stop(); }

    tcp::endpoint endpoint() const {
        return {boost::asio::ip::make_address("127.0.0.1"), server_->port()};
    }

    PuffingExecutor executor_;
    ApiRouter router_{executor_, false};
    std::unique_ptr<HttpServer> server_;
};

TEST_F(HttpServerTest, ServesHealth) {
    boost::asio::io_context ioc;
    beast::tcp_stream stream(ioc);
    stream.connect(endpoint());

    http::request<http::string_body> req{http::verb::get, "/health", 11};
    req.set(http::field::host, "127.0.0.1");
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::server], "puffing-runner");
    auto body = nlohmann::json::parse(res.body());
    EXPECT_EQ(body["status"], "ok");

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
}

TEST_F(HttpServerTest, IdleClientIsDisconnected) {
    boost::asio::io_context ioc;
    tcp::socket idle(ioc);
    idle.connect(endpoint());

    // The server gives up on the silent client and closes its side.
    char byte;
    beast::error_code ec;
    auto started = std::chrono::steady_clock::now();
    idle.read_some(boost::asio::buffer(&byte, 1), ec);
    auto waited = std::chrono::steady_clock::now() - started;
    EXPECT_TRUE(ec);
    EXPECT_LT(waited, std::chrono::seconds(10));
}

TEST_F(HttpServerTest, StopReturnsWhileClientIsIdle) {
    boost::asio::io_context ioc;
    tcp::socket idle(ioc);
    idle.connect(endpoint());
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto started = std::chrono::steady_clock::now();
    server_->stop();
    EXPECT_FALSE(server_->running());
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}
