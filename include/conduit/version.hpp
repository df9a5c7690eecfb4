#ifndef CONDUIT_VERSION_HPP
#define CONDUIT_VERSION_HPP

#pragma once

namespace conduit {

    /// Project semantic version components
    inline constexpr int version_major = 0;
    inline constexpr int version_minor = 3;
    inline constexpr int version_patch = 0;

    /// Combined version string (e.g. "0.3.0")
    inline constexpr const char* version_string = "0.3.0";

    /// User-Agent sent on outbound health probes and forwarded requests
    inline constexpr const char* user_agent = "conduit-gateway/0.3.0";

} // namespace conduit

#endif // CONDUIT_VERSION_HPP
