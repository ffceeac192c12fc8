// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <edgehls/core/error.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <expected>

namespace edgehls::core {

// One query parameter, kept exactly as received (no percent-decoding)
struct QueryParam {
    std::string name;
    std::string value;
    bool has_value{false};  // "name=" vs "name"
};

// Ordered query string. Parameters are forwarded to origin unmodified.
class QueryParams {
public:
    QueryParams() = default;

    [[nodiscard]] static QueryParams parse(std::string_view query);

    [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept;
    [[nodiscard]] bool contains(std::string_view name) const noexcept;
    [[nodiscard]] bool empty() const noexcept { return params_.empty(); }
    [[nodiscard]] const std::vector<QueryParam>& params() const noexcept { return params_; }

    void add(std::string name, std::string value);
    void remove(std::string_view name);

    // Serialize in received order
    [[nodiscard]] std::string to_string() const;

    // Serialize sorted by name then value, for cache keys
    [[nodiscard]] std::string canonical() const;

private:
    std::vector<QueryParam> params_;
};

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string base() const;  // scheme://host[:port]

    // Append a request path and query to this URL's path, e.g. a backend
    // "https://origin/live" + "/a.m3u8" -> "https://origin/live/a.m3u8"
    [[nodiscard]] std::string resolve(std::string_view request_path,
                                      const QueryParams& query) const;

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

// Split "path?query" as received on the request line
[[nodiscard]] std::pair<std::string, QueryParams> split_target(std::string_view target);

} // namespace edgehls::core
