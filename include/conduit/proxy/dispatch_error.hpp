#pragma once
/**
 * @file dispatch_error.hpp
 * @brief Uniform dispatch error taxonomy and the client-facing error envelope.
 *
 * Envelope wire format:
 *   { "success": false, "error": { "code": "CIRCUIT_OPEN", "message": "..." } }
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "conduit/proxy/http_types.hpp"

namespace conduit::proxy {

enum class DispatchErrorKind : std::uint8_t {
    NoHealthyInstance,    ///< 503, no eligible instance
    CircuitOpen,          ///< 503, breaker open, no network attempt made
    UpstreamTimeout,      ///< 504, deadline exceeded awaiting the backend
    UpstreamUnreachable,  ///< 503, refused/reset/DNS failure
    UpstreamServerError,  ///< Backend 5xx or 429, relayed as-is
    UpstreamClientError,  ///< Backend 4xx, relayed as-is
    RouteNotFound,        ///< 404, no route for path/method
    RateLimited,          ///< 429, per-route limit exceeded
    ClientCancelled,      ///< 499, caller went away
    Internal              ///< 500, unexpected failure inside the gateway
};

/// Stable envelope code, e.g. "NO_HEALTHY_INSTANCE".
std::string_view code(DispatchErrorKind k) noexcept;

/// HTTP status for kinds that do not relay a backend response.
unsigned http_status(DispatchErrorKind k) noexcept;

/// True for failures that may succeed on another attempt.
bool is_retryable(DispatchErrorKind k) noexcept;

/// Backend status classification: nullopt for 1xx-3xx, otherwise the matching kind.
std::optional<DispatchErrorKind> classify_status(unsigned status) noexcept;

struct DispatchError {
    DispatchErrorKind kind{DispatchErrorKind::Internal};
    std::string message;
    std::optional<HttpResponse> upstream;          ///< Backend response to relay verbatim
    std::optional<std::chrono::seconds> retry_after; ///< Emitted as Retry-After when set

    /// Status the caller will see (upstream status when relaying).
    [[nodiscard]] unsigned status() const noexcept;
};

/// Serialized `{success:false, error:{code,message}}` body.
std::string make_envelope(DispatchErrorKind kind, std::string_view message);

/// Response for `err`: the relayed upstream response, or a JSON envelope.
HttpResponse to_response(const DispatchError& err);

} // namespace conduit::proxy
