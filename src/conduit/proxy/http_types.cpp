/**
 * @file http_types.cpp
 * @brief Header sanitation and URL parsing helpers.
 */
#include "conduit/proxy/http_types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>

namespace conduit::proxy {

namespace {

constexpr std::array<std::string_view, 8> kHopByHop{
    "connection", "keep-alive", "transfer-encoding", "upgrade",
    "te", "trailers", "proxy-authenticate", "proxy-authorization"};

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

} // namespace

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

bool is_hop_by_hop(std::string_view name) noexcept {
    return std::any_of(kHopByHop.begin(), kHopByHop.end(),
                       [&](std::string_view h) { return iequals(h, name); });
}

Headers strip_hop_by_hop(const Headers& in) {
    // RFC 7230 6.1: tokens listed in Connection are hop-by-hop as well.
    std::vector<std::string_view> listed;
    for (const auto& [name, value] : in) {
        if (!iequals(name, "connection")) continue;
        std::string_view rest(value);
        while (!rest.empty()) {
            const auto comma = rest.find(',');
            const auto token = trim(rest.substr(0, comma));
            if (!token.empty()) listed.push_back(token);
            if (comma == std::string_view::npos) break;
            rest.remove_prefix(comma + 1);
        }
    }

    Headers out;
    out.reserve(in.size());
    for (const auto& h : in) {
        if (is_hop_by_hop(h.first)) continue;
        const bool named = std::any_of(listed.begin(), listed.end(),
                                       [&](std::string_view t) { return iequals(t, h.first); });
        if (!named) out.push_back(h);
    }
    return out;
}

std::optional<std::string_view> find_header(const Headers& h, std::string_view name) noexcept {
    for (const auto& [n, v] : h) {
        if (iequals(n, name)) return std::string_view(v);
    }
    return std::nullopt;
}

void set_header(Headers& h, std::string_view name, std::string value) {
    std::erase_if(h, [&](const auto& kv) { return iequals(kv.first, name); });
    h.emplace_back(std::string(name), std::move(value));
}

bool method_carries_body(std::string_view method) noexcept {
    return iequals(method, "POST") || iequals(method, "PUT") || iequals(method, "PATCH");
}

std::optional<HttpEndpoint> parse_http_url(std::string_view url) {
    constexpr std::string_view scheme = "http://";
    if (url.size() <= scheme.size() || !iequals(url.substr(0, scheme.size()), scheme)) {
        return std::nullopt;
    }
    url.remove_prefix(scheme.size());

    const auto slash = url.find_first_of("/?");
    std::string_view authority = url.substr(0, slash);
    std::string_view rest = slash == std::string_view::npos ? std::string_view{} : url.substr(slash);
    if (authority.empty() || authority.find('@') != std::string_view::npos) return std::nullopt;

    HttpEndpoint ep;
    std::string_view host = authority;
    std::string_view port;
    if (authority.front() == '[') {
        // IPv6 literal: [::1]:8080
        const auto close = authority.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        host = authority.substr(1, close - 1);
        const auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') return std::nullopt;
            port = after.substr(1);
        }
    } else if (const auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }
    if (host.empty()) return std::nullopt;

    if (!port.empty()) {
        unsigned value = 0;
        const auto* end = port.data() + port.size();
        const auto [ptr, ec] = std::from_chars(port.data(), end, value);
        if (ec != std::errc{} || ptr != end || value == 0 || value > 65535) return std::nullopt;
        ep.port = std::string(port);
    }
    ep.host = std::string(host);

    const auto q = rest.find('?');
    std::string_view path = rest.substr(0, q);
    while (!path.empty() && path.back() == '/') path.remove_suffix(1);
    ep.base_path = std::string(path);
    ep.target = rest.empty() ? std::string("/") : std::string(rest);
    if (ep.target.front() == '?') ep.target.insert(ep.target.begin(), '/');
    return ep;
}

std::string host_header(const HttpEndpoint& ep) {
    std::string out = ep.host.find(':') == std::string::npos ? ep.host : "[" + ep.host + "]";
    if (ep.port != "80") {
        out += ':';
        out += ep.port;
    }
    return out;
}

} // namespace conduit::proxy
