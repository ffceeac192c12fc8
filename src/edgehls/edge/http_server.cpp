// Copyright (c) 2026 changcheng967. All rights reserved.

#include <edgehls/edge/http_server.hpp>
#include <edgehls/core/log.hpp>
#include <edgehls/version.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <algorithm>
#include <chrono>
#include <csignal>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace edgehls::edge {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

constexpr std::chrono::seconds READ_TIMEOUT{30};

http::response<http::string_body>
to_beast(const http::request<http::string_body>& req, EdgeResponse&& edge) {
    http::response<http::string_body> res{static_cast<http::status>(edge.status), req.version()};
    res.set(http::field::server, "edgehls/" + edgehls::version.to_string());

    std::optional<std::string> head_length;
    for (auto& [name, value] : edge.headers) {
        if (beast::iequals(name, "Content-Length")) {
            head_length = value;
            continue;
        }
        res.set(name, value);
    }
    res.keep_alive(req.keep_alive());

    if (req.method() == http::verb::head && head_length) {
        res.set(http::field::content_length, *head_length);
    } else {
        res.body() = std::move(edge.body);
        res.prepare_payload();
    }
    return res;
}

// One connection: read a request, answer it, repeat while keep-alive
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket&& socket, Orchestrator& orchestrator)
        : stream_(std::move(socket)), orchestrator_(orchestrator) {}

    void run() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&Session::do_read, shared_from_this()));
    }

private:
    void do_read() {
        request_ = {};
        stream_.expires_after(READ_TIMEOUT);
        http::async_read(stream_, buffer_, request_,
                         beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            do_close();
            return;
        }
        if (ec) {
            EDGEHLS_LOG_DEBUG << "read: " << ec.message();
            return;
        }

        const auto target = request_.target();
        auto edge_request = EdgeRequest::from_target(
            std::string(request_.method_string()),
            std::string_view(target.data(), target.size()));

        response_ = std::make_shared<http::response<http::string_body>>(
            to_beast(request_, orchestrator_.handle(edge_request)));

        EDGEHLS_LOG_INFO << request_.method_string() << " " << target << " "
                         << response_->result_int();

        http::async_write(stream_, *response_,
                          beast::bind_front_handler(&Session::on_write, shared_from_this(),
                                                    response_->keep_alive()));
    }

    void on_write(bool keep_alive, beast::error_code ec, std::size_t) {
        if (ec) {
            EDGEHLS_LOG_DEBUG << "write: " << ec.message();
            return;
        }
        response_.reset();
        if (!keep_alive) {
            do_close();
            return;
        }
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    std::shared_ptr<http::response<http::string_body>> response_;
    Orchestrator& orchestrator_;
};

} // namespace

HttpServer::HttpServer(Orchestrator& orchestrator, std::size_t threads)
    : orchestrator_(orchestrator)
    , threads_(std::max<std::size_t>(threads, 1))
    , ioc_(static_cast<int>(threads_))
    , acceptor_(net::make_strand(ioc_))
    , signals_(ioc_, SIGINT, SIGTERM) {}

std::error_code HttpServer::listen(std::uint16_t port) {
    beast::error_code ec;
    const tcp::endpoint endpoint{tcp::v4(), port};

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) return ec;
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) return ec;
    acceptor_.bind(endpoint, ec);
    if (ec) return ec;
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) return ec;

    EDGEHLS_LOG_INFO << "listening on port " << this->port();
    return {};
}

std::uint16_t HttpServer::port() const {
    beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void HttpServer::run() {
    signals_.async_wait([this](const beast::error_code& ec, int signo) {
        if (!ec) {
            EDGEHLS_LOG_INFO << "signal " << signo << " received, shutting down";
            stop();
        }
    });

    do_accept();

    std::vector<std::thread> workers;
    workers.reserve(threads_ - 1);
    for (std::size_t i = 1; i < threads_; ++i) {
        workers.emplace_back([this] { ioc_.run(); });
    }
    ioc_.run();

    for (auto& worker : workers) {
        worker.join();
    }
}

void HttpServer::stop() {
    ioc_.stop();
}

void HttpServer::do_accept() {
    acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket) {
        if (ec) {
            EDGEHLS_LOG_ERROR << "accept failed: " << ec.message();
        } else {
            std::make_shared<Session>(std::move(socket), orchestrator_)->run();
        }
        if (acceptor_.is_open()) {
            do_accept();
        }
    });
}

} // namespace edgehls::edge
