// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <edgehls/core/edge_config.hpp>
#include <edgehls/edge/cache.hpp>
#include <edgehls/edge/fetcher.hpp>
#include <edgehls/edge/request.hpp>
#include <edgehls/edge/router.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace edgehls::edge {

// How a request was resolved
enum class Outcome : std::uint8_t {
    success,     // Full or delta playlist served as requested
    fallback,    // Delta requested, full playlist served instead
    hard_error   // No bytes to serve: upstream status or 502
};

[[nodiscard]] std::string_view to_string(Outcome outcome) noexcept;

constexpr std::string_view HEADER_VARIANT = "X-Edgehls-Variant";
constexpr std::string_view HEADER_OUTCOME = "X-Edgehls-Outcome";
constexpr std::string_view STALE_WARNING = "110 - \"Response is Stale\"";

// Routes a request through classify -> snapshot fetch (cache-through) ->
// transform, and builds the response. Holds no per-request state, so one
// instance serves concurrent requests when its collaborators are thread safe.
class Orchestrator {
public:
    Orchestrator(const core::EdgeConfig& config, PlaylistFetcher& fetcher, ResponseCache& cache);

    [[nodiscard]] EdgeResponse handle(const EdgeRequest& request);

    // "backend|path?sorted-query|variant"
    [[nodiscard]] static std::string cache_key(std::string_view backend, std::string_view path,
                                               const core::QueryParams& query,
                                               std::string_view variant);

private:
    struct Snapshot {
        Outcome outcome{Outcome::success};
        CachedResponse response;
        bool stale{false};
    };

    Snapshot load_snapshot(const RouteTarget& target, const core::QueryParams& query);

    EdgeResponse forward(const RouteTarget& target, const core::QueryParams& query);
    EdgeResponse serve_full(const RouteTarget& target, const DeltaRequest& request);
    EdgeResponse serve_delta(const RouteTarget& target, const DeltaRequest& request);

    [[nodiscard]] EdgeResponse make_response(const CachedResponse& cached, std::string_view variant,
                                             Outcome outcome, bool stale) const;
    [[nodiscard]] std::string cache_control(std::uint32_t max_age) const;

    core::CacheSettings cache_settings_;
    Router router_;
    PlaylistFetcher& fetcher_;
    ResponseCache& cache_;
};

} // namespace edgehls::edge
