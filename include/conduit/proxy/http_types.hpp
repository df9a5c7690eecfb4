#pragma once
/**
 * @file http_types.hpp
 * @brief Framework-neutral HTTP request/response shapes used by the dispatch core.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace conduit::proxy {

/// Ordered header list; duplicates allowed, names compared case-insensitively.
using Headers = std::vector<std::pair<std::string, std::string>>;

/**
 * @struct ProxyRequest
 * @brief Inbound request as handed to the dispatch core by the listener.
 */
struct ProxyRequest {
    std::string method{"GET"};
    std::string path{"/"};        ///< Path without query string
    std::string query;            ///< Raw query string without '?'
    Headers     headers;
    std::string body;
    std::string client_key;       ///< Client identity for affinity/hash/limits (e.g. peer IP)
};

/**
 * @struct HttpResponse
 * @brief Response relayed to the caller (or received from a backend).
 */
struct HttpResponse {
    unsigned    status{200};
    Headers     headers;
    std::string body;
};

/**
 * @struct OutboundRequest
 * @brief Fully rewritten request aimed at one backend instance.
 */
struct OutboundRequest {
    std::string method{"GET"};
    std::string url;              ///< Absolute URL, e.g. "http://10.0.0.5:8080/orders?id=1"
    Headers     headers;
    std::string body;
};

/**
 * @struct HttpEndpoint
 * @brief Parsed "http://host[:port][/base]" URL.
 */
struct HttpEndpoint {
    std::string host;
    std::string port{"80"};
    std::string base_path;        ///< Without trailing '/', may be empty
    std::string target{"/"};      ///< Path + query of the parsed URL (defaults to "/")
};

/// Parse an absolute http:// URL. Returns nullopt for other schemes or malformed input.
std::optional<HttpEndpoint> parse_http_url(std::string_view url);

/// Host header value for `ep`: IPv6 literals bracketed, port omitted when 80.
std::string host_header(const HttpEndpoint& ep);

/// Case-insensitive ASCII comparison.
bool iequals(std::string_view a, std::string_view b) noexcept;

/// True for the hop-by-hop headers a proxy must not forward.
bool is_hop_by_hop(std::string_view name) noexcept;

/// Copy of `in` without hop-by-hop headers, including any named by `Connection`.
Headers strip_hop_by_hop(const Headers& in);

/// First value of header `name`, if present.
std::optional<std::string_view> find_header(const Headers& h, std::string_view name) noexcept;

/// Replace every occurrence of `name` with a single `name: value`.
void set_header(Headers& h, std::string_view name, std::string value);

/// POST/PUT/PATCH carry their body upstream; other methods are forwarded without one.
bool method_carries_body(std::string_view method) noexcept;

} // namespace conduit::proxy
