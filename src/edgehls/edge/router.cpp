// Copyright (c) 2026 changcheng967. All rights reserved.

#include <edgehls/edge/router.hpp>
#include <algorithm>

namespace edgehls::edge {

namespace {

bool prefix_matches(std::string_view prefix, std::string_view path) noexcept {
    while (prefix.size() > 1 && prefix.back() == '/') {
        prefix.remove_suffix(1);
    }
    if (prefix == "/") {
        return true;
    }
    if (!path.starts_with(prefix)) {
        return false;
    }
    return path.size() == prefix.size() || path[prefix.size()] == '/';
}

} // namespace

Router::Router(std::vector<core::Route> routes, std::string default_backend)
    : routes_(std::move(routes))
    , default_backend_(std::move(default_backend)) {
    std::stable_sort(routes_.begin(), routes_.end(), [](const auto& a, const auto& b) {
        return a.prefix.size() > b.prefix.size();
    });
}

RouteTarget Router::resolve(std::string_view path) const {
    for (const auto& route : routes_) {
        if (!prefix_matches(route.prefix, path)) {
            continue;
        }

        RouteTarget target{route.backend, std::string(path)};
        if (route.strip_prefix) {
            std::string_view prefix = route.prefix;
            while (!prefix.empty() && prefix.back() == '/') {
                prefix.remove_suffix(1);
            }
            target.path = std::string(path.substr(prefix.size()));
            if (target.path.empty() || target.path.front() != '/') {
                target.path.insert(target.path.begin(), '/');
            }
        }
        return target;
    }
    return RouteTarget{default_backend_, std::string(path)};
}

} // namespace edgehls::edge
