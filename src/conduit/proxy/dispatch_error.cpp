#include "conduit/proxy/dispatch_error.hpp"

#include <nlohmann/json.hpp>

namespace conduit::proxy {

std::string_view code(DispatchErrorKind k) noexcept {
    switch (k) {
        case DispatchErrorKind::NoHealthyInstance:   return "NO_HEALTHY_INSTANCE";
        case DispatchErrorKind::CircuitOpen:         return "CIRCUIT_OPEN";
        case DispatchErrorKind::UpstreamTimeout:     return "UPSTREAM_TIMEOUT";
        case DispatchErrorKind::UpstreamUnreachable: return "UPSTREAM_UNREACHABLE";
        case DispatchErrorKind::UpstreamServerError: return "UPSTREAM_SERVER_ERROR";
        case DispatchErrorKind::UpstreamClientError: return "UPSTREAM_CLIENT_ERROR";
        case DispatchErrorKind::RouteNotFound:       return "ROUTE_NOT_FOUND";
        case DispatchErrorKind::RateLimited:         return "RATE_LIMITED";
        case DispatchErrorKind::ClientCancelled:     return "CLIENT_CLOSED_REQUEST";
        case DispatchErrorKind::Internal:            return "INTERNAL_SERVER_ERROR";
    }
    return "INTERNAL_SERVER_ERROR";
}

unsigned http_status(DispatchErrorKind k) noexcept {
    switch (k) {
        case DispatchErrorKind::NoHealthyInstance:   return 503;
        case DispatchErrorKind::CircuitOpen:         return 503;
        case DispatchErrorKind::UpstreamTimeout:     return 504;
        case DispatchErrorKind::UpstreamUnreachable: return 503;
        case DispatchErrorKind::UpstreamServerError: return 502;
        case DispatchErrorKind::UpstreamClientError: return 400;
        case DispatchErrorKind::RouteNotFound:       return 404;
        case DispatchErrorKind::RateLimited:         return 429;
        case DispatchErrorKind::ClientCancelled:     return 499;
        case DispatchErrorKind::Internal:            return 500;
    }
    return 500;
}

bool is_retryable(DispatchErrorKind k) noexcept {
    return k == DispatchErrorKind::UpstreamTimeout
        || k == DispatchErrorKind::UpstreamUnreachable
        || k == DispatchErrorKind::UpstreamServerError;
}

std::optional<DispatchErrorKind> classify_status(unsigned status) noexcept {
    if (status >= 500 || status == 429) return DispatchErrorKind::UpstreamServerError;
    if (status >= 400) return DispatchErrorKind::UpstreamClientError;
    return std::nullopt;
}

unsigned DispatchError::status() const noexcept {
    return upstream ? upstream->status : http_status(kind);
}

std::string make_envelope(DispatchErrorKind kind, std::string_view message) {
    nlohmann::json j = {
        {"success", false},
        {"error", {{"code", std::string(code(kind))}, {"message", std::string(message)}}},
    };
    return j.dump();
}

HttpResponse to_response(const DispatchError& err) {
    if (err.upstream) return *err.upstream;

    HttpResponse r;
    r.status = http_status(err.kind);
    r.headers.emplace_back("Content-Type", "application/json");
    if (err.retry_after) r.headers.emplace_back("Retry-After", std::to_string(err.retry_after->count()));
    r.body = make_envelope(err.kind, err.message);
    return r;
}

} // namespace conduit::proxy
