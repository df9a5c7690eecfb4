#pragma once
/**
 * @file http_listener.hpp
 * @brief Boost.Beast HTTP/1.1 server feeding inbound requests to the GatewayHandler.
 *
 * Sockets are driven by a small io_context pool; dispatch (which blocks on
 * upstream I/O and retry backoff) runs on a separate worker pool so slow
 * backends never stall accepting or reading.
 */

#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>

#include "conduit/config/constants.hpp"

namespace spdlog { class logger; }

namespace conduit::gateway {

class GatewayHandler;

struct ListenerOptions {
    std::string   address{config::constants::LISTEN_ADDRESS_DEFAULT};
    std::uint16_t port{config::constants::LISTEN_PORT_DEFAULT};   ///< 0 picks an ephemeral port
    std::uint32_t threads{config::constants::LISTEN_THREADS_DEFAULT};
};

class HttpListener {
public:
    HttpListener(ListenerOptions opts, GatewayHandler& handler);
    ~HttpListener();

    HttpListener(const HttpListener&) = delete;
    HttpListener& operator=(const HttpListener&) = delete;

    /// Bind, listen and start the I/O threads. Throws boost::system::system_error on bind failure.
    void start();

    /// Stop accepting, cancel in-flight dispatches and join all threads. Idempotent.
    void stop();

    /// Port actually bound (useful with port 0).
    [[nodiscard]] std::uint16_t port() const noexcept { return bound_port_; }

private:
    void accept();

    ListenerOptions opts_;
    GatewayHandler& handler_;
    std::shared_ptr<spdlog::logger> log_;

    boost::asio::io_context        ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::thread_pool       workers_;
    std::vector<std::jthread>      io_threads_;
    std::stop_source               stop_;
    std::uint16_t                  bound_port_{0};
    bool                           running_{false};
};

} // namespace conduit::gateway
