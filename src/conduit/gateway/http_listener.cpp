#include "conduit/gateway/http_listener.hpp"

#include <algorithm>
#include <stop_token>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>

#include "conduit/gateway/gateway_handler.hpp"
#include "conduit/obs/logging.hpp"
#include "conduit/proxy/http_types.hpp"

namespace conduit::gateway {

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp = asio::ip::tcp;

namespace {

constexpr auto kReadTimeout = std::chrono::seconds(30);

std::string str(beast::string_view s) { return std::string(s.data(), s.size()); }

proxy::ProxyRequest to_proxy_request(const http::request<http::string_body>& in, std::string client_key) {
    proxy::ProxyRequest out;
    out.method = str(in.method_string());
    const std::string target = str(in.target());
    const auto q = target.find('?');
    out.path = target.substr(0, q);
    if (q != std::string::npos) out.query = target.substr(q + 1);
    if (out.path.empty()) out.path = "/";
    for (const auto& field : in) {
        out.headers.emplace_back(str(field.name_string()), str(field.value()));
    }
    out.body = in.body();
    out.client_key = std::move(client_key);
    return out;
}

http::response<http::string_body> to_beast_response(proxy::HttpResponse in, unsigned version, bool keep_alive) {
    http::response<http::string_body> out;
    out.version(version);
    out.result(in.status);
    for (auto& [name, value] : in.headers) {
        if (proxy::iequals(name, "Content-Length") || proxy::iequals(name, "Transfer-Encoding")) continue;
        out.insert(name, value);
    }
    out.body() = std::move(in.body);
    out.keep_alive(keep_alive);
    out.prepare_payload();
    return out;
}

/**
 * One client connection: read, dispatch on the worker pool, write, repeat.
 *
 * Every request gets its own stop_source, fired when the listener stops or when
 * the peer closes or resets the connection while the request is still being
 * dispatched. The handler only ever sees that per-request token.
 */
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket socket, GatewayHandler& handler, asio::thread_pool& workers,
            std::stop_token server_stop, std::shared_ptr<spdlog::logger> log)
        : stream_(std::move(socket)), handler_(handler), workers_(workers),
          server_stop_(std::move(server_stop)), log_(std::move(log)) {}

    void run() {
        beast::error_code ec;
        auto remote = stream_.socket().remote_endpoint(ec);
        if (!ec) client_ = remote.address().to_string();
        asio::dispatch(stream_.get_executor(), [self = shared_from_this()] { self->read(); });
    }

private:
    void read() {
        request_ = {};
        stream_.expires_after(kReadTimeout);
        http::async_read(stream_, buffer_, request_,
                         [self = shared_from_this()](beast::error_code ec, std::size_t) { self->onRead(ec); });
    }

    void onRead(beast::error_code ec) {
        if (ec == http::error::end_of_stream || ec == beast::error::timeout) return close();
        if (ec) {
            log_->debug("read from {} failed: {}", client_, ec.message());
            return;
        }
        stream_.expires_never();

        std::stop_source cancel;
        in_flight_ = true;
        watchPeer(cancel);
        asio::post(workers_, [self = shared_from_this(), cancel]() mutable {
            std::stop_callback link(self->server_stop_, [cancel]() mutable { cancel.request_stop(); });
            auto req = to_proxy_request(self->request_, self->client_);
            auto resp = self->handler_.handle(req, cancel.get_token());
            auto out = to_beast_response(std::move(resp), self->request_.version(), self->request_.keep_alive());
            asio::post(self->stream_.get_executor(), [self, out = std::move(out)]() mutable {
                self->in_flight_ = false;
                beast::error_code ignored;
                self->stream_.socket().cancel(ignored);  // ends watchPeer()
                self->write(std::move(out));
            });
        });
    }

    /// Readable with nothing to read means EOF: the client hung up mid-request.
    void watchPeer(std::stop_source cancel) {
        stream_.socket().async_wait(tcp::socket::wait_read,
            [self = shared_from_this(), cancel](beast::error_code ec) mutable {
                if (!self->in_flight_ || ec == asio::error::operation_aborted) return;
                beast::error_code avail_ec;
                const auto pending = self->stream_.socket().available(avail_ec);
                if (ec || avail_ec || pending == 0) {
                    self->log_->debug("client {} disconnected, cancelling {} {}", self->client_,
                                      str(self->request_.method_string()), str(self->request_.target()));
                    cancel.request_stop();
                }
                // pipelined bytes: the next read picks them up
            });
    }

    void write(http::response<http::string_body> res) {
        response_ = std::move(res);
        http::async_write(stream_, response_,
                          [self = shared_from_this()](beast::error_code ec, std::size_t) { self->onWrite(ec); });
    }

    void onWrite(beast::error_code ec) {
        if (ec) {
            log_->debug("write to {} failed: {}", client_, ec.message());
            return;
        }
        if (!response_.keep_alive() || server_stop_.stop_requested()) return close();
        read();
    }

    void close() {
        beast::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    http::response<http::string_body> response_;
    GatewayHandler& handler_;
    asio::thread_pool& workers_;
    std::stop_token server_stop_;
    std::shared_ptr<spdlog::logger> log_;
    std::string client_;
    bool in_flight_{false};  ///< Touched only on the connection strand
};

} // namespace

HttpListener::HttpListener(ListenerOptions opts, GatewayHandler& handler)
    : opts_(std::move(opts)), handler_(handler), log_(obs::logger("listener")),
      acceptor_(asio::make_strand(ioc_)), workers_(opts_.threads) {}

HttpListener::~HttpListener() { stop(); }

void HttpListener::start() {
    if (running_) return;
    const tcp::endpoint ep{asio::ip::make_address(opts_.address), opts_.port};
    acceptor_.open(ep.protocol());
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(ep);
    acceptor_.listen(asio::socket_base::max_listen_connections);
    bound_port_ = acceptor_.local_endpoint().port();
    running_ = true;

    accept();
    const auto n = std::max<std::uint32_t>(1, opts_.threads);
    io_threads_.reserve(n);
    for (std::uint32_t i = 0; i < n; ++i) io_threads_.emplace_back([this] { ioc_.run(); });
    log_->info("listening on {}:{} ({} io threads)", opts_.address, bound_port_, n);
}

void HttpListener::stop() {
    if (!running_) return;
    running_ = false;
    stop_.request_stop();
    asio::post(acceptor_.get_executor(), [this] {
        beast::error_code ignored;
        acceptor_.close(ignored);
    });
    workers_.join();
    ioc_.stop();
    io_threads_.clear();  // jthread joins
    log_->info("listener on port {} stopped", bound_port_);
}

void HttpListener::accept() {
    acceptor_.async_accept(asio::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec != asio::error::operation_aborted) log_->warn("accept failed: {}", ec.message());
            if (!acceptor_.is_open()) return;
        } else {
            std::make_shared<Session>(std::move(socket), handler_, workers_, stop_.get_token(), log_)->run();
        }
        accept();
    });
}

} // namespace conduit::gateway
