#include "scriptbox/server/http_server.hpp"

#include "scriptbox/core/logger.hpp"
#include "scriptbox/core/utils.hpp"

#include <chrono>
#include <exception>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#ifndef SCRIPTBOX_VERSION_STRING
#define SCRIPTBOX_VERSION_STRING "0.1.0-dev"
#endif

namespace scriptbox::server {

namespace {

constexpr auto kReadTimeout = std::chrono::seconds(30);
constexpr auto kWriteTimeout = std::chrono::seconds(30);

auto target_path(const Request& req) -> std::string {
    std::string target(req.target().data(), req.target().size());
    auto query = target.find('?');
    if (query != std::string::npos) target.resize(query);
    return target;
}

} // anonymous namespace

auto make_json_response(unsigned status, const json& body, unsigned version,
                        bool keep_alive) -> Response {
    Response res{static_cast<http::status>(status), version};
    res.set(http::field::server, "scriptbox/" SCRIPTBOX_VERSION_STRING);
    res.set(http::field::content_type, "application/json");
    res.keep_alive(keep_alive);
    // Captured script output is not guaranteed to be valid UTF-8.
    res.body() = body.dump(-1, ' ', false, json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}

HttpServer::HttpServer(net::io_context& ioc, const service::Pipeline& pipeline,
                       ServerConfig config, std::size_t worker_threads)
    : ioc_(ioc)
    , pipeline_(pipeline)
    , config_(std::move(config))
    , workers_(worker_threads)
    , acceptor_(ioc) {}

HttpServer::~HttpServer() {
    stop();
    workers_.join();
}

auto HttpServer::listen() -> VoidResult {
    boost::system::error_code ec;
    auto address = net::ip::make_address(config_.bind_address, ec);
    if (ec) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "Invalid bind address", config_.bind_address));
    }

    auto endpoint = tcp::endpoint{address, config_.port};
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        acceptor_.close(ec);
        return std::unexpected(make_error(
            ErrorCode::IoError,
            "Cannot listen on " + config_.bind_address + ":" + std::to_string(config_.port),
            ec.message()));
    }

    running_ = true;
    LOG_INFO("Listening on {}:{}", address.to_string(), local_port());
    return {};
}

auto HttpServer::run() -> awaitable<void> {
    co_await accept_loop();
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;

    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        LOG_DEBUG("Acceptor close: {}", ec.message());
    }
    LOG_INFO("Server stopped accepting connections");
}

auto HttpServer::local_port() const -> uint16_t {
    boost::system::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

auto HttpServer::accept_loop() -> awaitable<void> {
    while (running_) {
        try {
            auto socket = co_await acceptor_.async_accept(net::use_awaitable);

            if (active_connections_ >= config_.max_connections) {
                LOG_WARN("Max connections ({}) reached, rejecting", config_.max_connections);
                boost::system::error_code ec;
                socket.close(ec);
                continue;
            }

            net::co_spawn(ioc_, handle_connection(std::move(socket)), net::detached);

        } catch (const boost::system::system_error& e) {
            if (!running_) break;  // acceptor closed by stop()
            LOG_ERROR("Accept error: {}", e.what());
        }
    }
}

auto HttpServer::handle_connection(tcp::socket socket) -> awaitable<void> {
    auto conn_id = utils::generate_id(12);
    ++active_connections_;

    boost::system::error_code ep_ec;
    auto remote = socket.remote_endpoint(ep_ec);
    if (!ep_ec) {
        LOG_DEBUG("Connection {} from {}:{}", conn_id,
                  remote.address().to_string(), remote.port());
    }

    beast::tcp_stream stream(std::move(socket));
    beast::flat_buffer buffer;

    try {
        for (;;) {
            http::request_parser<http::string_body> parser;
            parser.body_limit(config_.max_body_bytes);

            stream.expires_after(kReadTimeout);
            boost::system::error_code ec;
            co_await http::async_read(stream, buffer, parser,
                                      net::redirect_error(net::use_awaitable, ec));
            if (ec == http::error::end_of_stream) break;
            if (ec == http::error::body_limit) {
                auto res = make_json_response(
                    413, json{{"error", "Request body too large"}}, 11, false);
                stream.expires_after(kWriteTimeout);
                co_await http::async_write(stream, res, net::use_awaitable);
                break;
            }
            if (ec) {
                LOG_DEBUG("Connection {}: read error: {}", conn_id, ec.message());
                break;
            }

            auto req = parser.release();
            auto res = co_await route(req);

            stream.expires_after(kWriteTimeout);
            co_await http::async_write(stream, res, net::use_awaitable);

            if (!res.keep_alive()) break;
        }
    } catch (const boost::system::system_error& e) {
        LOG_DEBUG("Connection {}: {}", conn_id, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Connection {}: {}", conn_id, e.what());
    }

    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    --active_connections_;
    LOG_DEBUG("Connection {} closed", conn_id);
}

auto HttpServer::route(const Request& req) -> awaitable<Response> {
    auto path = target_path(req);
    auto version = req.version();
    auto keep_alive = req.keep_alive();

    LOG_DEBUG("{} {} ({} bytes)", std::string(req.method_string().data(),
                                             req.method_string().size()),
              path, req.body().size());

    if (path == "/execute") {
        if (req.method() != http::verb::post) {
            co_return make_json_response(
                405, json{{"error", "Method not allowed"}}, version, keep_alive);
        }
        auto reply = co_await execute(req.body());
        co_return make_json_response(reply.status, reply.body, version, keep_alive);
    }

    if (path == "/health") {
        if (req.method() != http::verb::get) {
            co_return make_json_response(
                405, json{{"error", "Method not allowed"}}, version, keep_alive);
        }
        co_return make_json_response(200, json{{"status", "ok"}}, version, keep_alive);
    }

    co_return make_json_response(404, json{{"error", "Not found"}}, version, keep_alive);
}

auto HttpServer::execute(std::string body) -> awaitable<service::Reply> {
    try {
        // Hop onto the worker pool; the completion resumes us on the caller's
        // executor.
        co_return co_await net::co_spawn(
            workers_.get_executor(),
            [this, body = std::move(body)]() -> awaitable<service::Reply> {
                co_return pipeline_.handle(body);
            },
            net::use_awaitable);
    } catch (const std::exception& e) {
        LOG_ERROR("Pipeline failure: {}", e.what());
        co_return service::Reply{500, json{{"error", "Internal server error"}},
                                 service::FailureKind::InternalError};
    }
}

} // namespace scriptbox::server
