#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/http.hpp>

#include "scriptbox/core/config.hpp"
#include "scriptbox/core/error.hpp"
#include "scriptbox/service/pipeline.hpp"

namespace scriptbox::server {

using boost::asio::awaitable;
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

/// HTTP/1.1 front end for the execution pipeline.
///
/// The accept loop and connection coroutines run on the io_context; every
/// pipeline invocation is handed to a dedicated worker pool so that sandbox
/// processes run in parallel and never stall network I/O.
class HttpServer {
public:
    HttpServer(net::io_context& ioc, const service::Pipeline& pipeline,
               ServerConfig config, std::size_t worker_threads);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Opens and binds the listening socket. Port 0 picks a free port.
    auto listen() -> VoidResult;

    /// Accepts connections until stop() is called.
    auto run() -> awaitable<void>;

    /// Closes the listening socket; in-flight requests finish normally.
    void stop();

    /// Produces the response for one request.
    auto route(const Request& req) -> awaitable<Response>;

    [[nodiscard]] auto local_port() const -> uint16_t;
    [[nodiscard]] auto is_running() const noexcept -> bool { return running_; }
    [[nodiscard]] auto connection_count() const noexcept -> std::size_t {
        return active_connections_;
    }

private:
    auto accept_loop() -> awaitable<void>;
    auto handle_connection(tcp::socket socket) -> awaitable<void>;
    auto execute(std::string body) -> awaitable<service::Reply>;

    net::io_context& ioc_;
    const service::Pipeline& pipeline_;
    ServerConfig config_;
    net::thread_pool workers_;
    tcp::acceptor acceptor_;

    std::atomic<bool> running_{false};
    std::atomic<std::size_t> active_connections_{0};
};

/// Builds a JSON response with the service's standard headers.
auto make_json_response(unsigned status, const json& body, unsigned version,
                        bool keep_alive) -> Response;

} // namespace scriptbox::server
