#pragma once
/**
 * @file string_key.hpp
 * @brief Transparent string keying for heterogeneous lookup with string_view.
 */

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace conduit::routing {

// Transparent hash/equal functors enable heterogeneous lookup with string_view
// (avoids constructing std::string temporaries for every query).
struct SKeyHash {
    using is_transparent = void;
    std::size_t operator()(std::string_view s) const noexcept {
        return std::hash<std::string_view>{}(s);
    }
};
struct SKeyEq {
    using is_transparent = void;
    bool operator()(std::string_view a, std::string_view b) const noexcept {
        return a == b;
    }
};

template <class V>
using StringMap = std::unordered_map<std::string, V, SKeyHash, SKeyEq>;

} // namespace conduit::routing
