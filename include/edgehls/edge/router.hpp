// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <edgehls/core/edge_config.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace edgehls::edge {

struct RouteTarget {
    std::string backend;
    std::string path;  // Path to request from the backend
};

// Maps request paths to backends by longest matching path prefix.
// A prefix matches whole path segments only: "/alt" matches "/alt" and
// "/alt/x.m3u8" but not "/alternate.m3u8".
class Router {
public:
    Router(std::vector<core::Route> routes, std::string default_backend);

    [[nodiscard]] RouteTarget resolve(std::string_view path) const;

private:
    std::vector<core::Route> routes_;  // Longest prefix first
    std::string default_backend_;
};

} // namespace edgehls::edge
