/**
 * @file beast_transport.cpp
 * @brief Boost.Beast client: async resolve/connect/write/read driven on a local io_context.
 */
#include "conduit/proxy/beast_transport.hpp"
#include "conduit/version.hpp"

#include <atomic>
#include <optional>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace conduit::proxy {

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp = asio::ip::tcp;

std::string_view to_string(TransportErrorKind k) noexcept {
    switch (k) {
        case TransportErrorKind::ConnectionRefused: return "connection_refused";
        case TransportErrorKind::ConnectionReset:   return "connection_reset";
        case TransportErrorKind::DnsFailure:        return "dns_failure";
        case TransportErrorKind::Timeout:           return "timeout";
        case TransportErrorKind::Cancelled:         return "cancelled";
        case TransportErrorKind::Protocol:          return "protocol";
    }
    return "protocol";
}

namespace {

TransportErrorKind classify(const beast::error_code& ec, bool cancelled) noexcept {
    if (cancelled) return TransportErrorKind::Cancelled;
    if (ec == beast::error::timeout) return TransportErrorKind::Timeout;
    if (ec == asio::error::connection_refused) return TransportErrorKind::ConnectionRefused;
    if (ec == asio::error::host_not_found || ec == asio::error::host_not_found_try_again ||
        ec == asio::error::no_data) {
        return TransportErrorKind::DnsFailure;
    }
    if (ec == asio::error::connection_reset || ec == asio::error::connection_aborted ||
        ec == asio::error::broken_pipe || ec == asio::error::eof ||
        ec == http::error::end_of_stream || ec == http::error::partial_message) {
        return TransportErrorKind::ConnectionReset;
    }
    return TransportErrorKind::Protocol;
}

/// State of one exchange; all handlers run on the owning io_context thread.
struct Exchange {
    explicit Exchange(asio::io_context& ioc) : resolver(ioc), stream(ioc) {}

    tcp::resolver resolver;
    beast::tcp_stream stream;
    http::request<http::string_body> request;
    http::response<http::string_body> response;
    beast::flat_buffer buffer;
    beast::error_code error;
    bool done{false};
};

} // namespace

TransportResult BeastTransport::send(const OutboundRequest& req,
                                     std::chrono::milliseconds timeout,
                                     std::stop_token stop) {
    auto ep = parse_http_url(req.url);
    if (!ep) {
        return conduit_detail::unexpected<TransportError>(
            TransportError{TransportErrorKind::Protocol, "unsupported url: " + req.url});
    }
    if (stop.stop_requested()) {
        return conduit_detail::unexpected<TransportError>(TransportError{TransportErrorKind::Cancelled, "cancelled"});
    }

    asio::io_context ioc;
    Exchange ex(ioc);
    std::atomic<bool> cancelled{false};

    ex.request.method_string(req.method);
    ex.request.target(ep->target);
    ex.request.version(11);
    for (const auto& [name, value] : req.headers) ex.request.insert(name, value);
    ex.request.set(http::field::host, host_header(*ep));
    if (ex.request.find(http::field::user_agent) == ex.request.end()) {
        ex.request.set(http::field::user_agent, user_agent);
    }
    ex.request.keep_alive(false);
    if (!req.body.empty() || method_carries_body(req.method)) {
        ex.request.body() = req.body;
        ex.request.prepare_payload();
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;

    auto fail = [&ex](beast::error_code ec) {
        ex.error = ec;
        ex.done = true;
    };

    ex.resolver.async_resolve(ep->host, ep->port,
        [&](beast::error_code ec, tcp::resolver::results_type results) {
            if (ec) return fail(ec);
            ex.stream.expires_at(deadline);
            ex.stream.async_connect(results,
                [&](beast::error_code ec, const tcp::endpoint&) {
                    if (ec) return fail(ec);
                    http::async_write(ex.stream, ex.request,
                        [&](beast::error_code ec, std::size_t) {
                            if (ec) return fail(ec);
                            http::async_read(ex.stream, ex.buffer, ex.response,
                                [&](beast::error_code ec, std::size_t) {
                                    if (ec) return fail(ec);
                                    beast::error_code ignored;
                                    ex.stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
                                    ex.done = true;
                                });
                        });
                });
        });

    // Cancellation is marshalled onto the exchange's own io_context.
    std::stop_callback on_stop(stop, [&] {
        cancelled.store(true, std::memory_order_relaxed);
        asio::post(ioc, [&ex] {
            ex.resolver.cancel();
            ex.stream.cancel();
        });
    });

    // The stream timer does not cover name resolution; bound the whole run instead.
    ioc.run_for(timeout);

    if (!ex.done) {
        if (cancelled.load(std::memory_order_relaxed)) {
            return conduit_detail::unexpected<TransportError>(TransportError{TransportErrorKind::Cancelled, "cancelled"});
        }
        return conduit_detail::unexpected<TransportError>(
            TransportError{TransportErrorKind::Timeout, "no response within " +
                           std::to_string(timeout.count()) + "ms"});
    }
    if (ex.error) {
        const auto kind = classify(ex.error, cancelled.load(std::memory_order_relaxed));
        return conduit_detail::unexpected<TransportError>(TransportError{kind, ex.error.message()});
    }

    HttpResponse out;
    out.status = ex.response.result_int();
    for (const auto& field : ex.response) {
        out.headers.emplace_back(std::string(field.name_string().data(), field.name_string().size()),
                                 std::string(field.value().data(), field.value().size()));
    }
    out.body = std::move(ex.response.body());
    return out;
}

} // namespace conduit::proxy
