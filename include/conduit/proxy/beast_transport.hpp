#pragma once
/**
 * @file beast_transport.hpp
 * @brief HttpTransport over Boost.Beast (HTTP/1.1, plain TCP).
 */

#include "conduit/proxy/transport.hpp"

namespace conduit::proxy {

/**
 * @class BeastTransport
 * @brief One connection per exchange on a private io_context.
 * @details Stateless between calls, so a single instance is shared by every request
 *          thread and the health loop.
 */
class BeastTransport final : public HttpTransport {
public:
    TransportResult send(const OutboundRequest& req,
                         std::chrono::milliseconds timeout,
                         std::stop_token stop) override;
};

} // namespace conduit::proxy
