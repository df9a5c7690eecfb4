#pragma once
/**
 * @file transport.hpp
 * @brief Outbound HTTP transport seam used by the proxy executor and health checks.
 */

#include <chrono>
#include <cstdint>
#include <stop_token>
#include <string>
#include <string_view>

#include "conduit/compat/expected.hpp"
#include "conduit/proxy/http_types.hpp"

namespace conduit::proxy {

/**
 * @enum TransportErrorKind
 * @brief Transport-level failures (the backend never produced a response).
 */
enum class TransportErrorKind : std::uint8_t {
    ConnectionRefused,  ///< Nothing listening at the instance address
    ConnectionReset,    ///< Peer closed or reset mid-exchange
    DnsFailure,         ///< Host name did not resolve
    Timeout,            ///< Attempt budget elapsed
    Cancelled,          ///< Caller withdrew (stop token)
    Protocol            ///< Malformed URL or HTTP framing error
};

std::string_view to_string(TransportErrorKind k) noexcept;

struct TransportError {
    TransportErrorKind kind{TransportErrorKind::Protocol};
    std::string message;
};

using TransportResult = conduit_detail::expected<HttpResponse, TransportError>;

/**
 * @class HttpTransport
 * @brief Performs one HTTP exchange. Implementations must be safe for concurrent use.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Send `req` and wait for the complete response.
     * @param req Absolute-URL request.
     * @param timeout Budget for the whole exchange (resolve, connect, write, read).
     * @param stop Cancels the exchange when requested.
     */
    virtual TransportResult send(const OutboundRequest& req,
                                 std::chrono::milliseconds timeout,
                                 std::stop_token stop) = 0;
};

} // namespace conduit::proxy
