// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <edgehls/edge/orchestrator.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <cstddef>
#include <cstdint>
#include <system_error>

namespace edgehls::edge {

// HTTP/1.1 front end over Boost.Beast. Requests are handed to the
// orchestrator on the io_context worker threads; origin fetches block the
// worker, so the pool should be sized for concurrent origin round trips.
class HttpServer {
public:
    HttpServer(Orchestrator& orchestrator, std::size_t threads);

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind and listen on all IPv4 interfaces
    [[nodiscard]] std::error_code listen(std::uint16_t port);

    // Serve until SIGINT/SIGTERM or stop()
    void run();
    void stop();

    [[nodiscard]] std::uint16_t port() const;

private:
    void do_accept();

    Orchestrator& orchestrator_;
    std::size_t threads_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::signal_set signals_;
};

} // namespace edgehls::edge
