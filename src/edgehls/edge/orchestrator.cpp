// Copyright (c) 2026 changcheng967. All rights reserved.

#include <edgehls/edge/orchestrator.hpp>
#include <edgehls/core/config.hpp>
#include <edgehls/core/log.hpp>
#include <edgehls/delta/renderer.hpp>
#include <functional>

namespace edgehls::edge {

namespace {

constexpr std::string_view VARIANT_FULL = "full";
constexpr std::string_view VARIANT_DELTA = "delta";
constexpr std::string_view VARIANT_FALLBACK = "delta-fallback";
constexpr std::string_view VARIANT_FORWARD = "forward";

std::string content_type_or_default(const std::string& content_type) {
    return content_type.empty() ? std::string(core::PLAYLIST_CONTENT_TYPE) : content_type;
}

std::size_t digest(std::string_view bytes) noexcept {
    return std::hash<std::string_view>{}(bytes);
}

EdgeResponse bad_gateway() {
    EdgeResponse response;
    response.status = core::BAD_GATEWAY;
    response.set_header("Content-Type", "text/plain");
    response.set_header("Cache-Control", "no-store");
    response.body = "Bad Gateway\n";
    return response;
}

} // namespace

std::string_view to_string(Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::success:    return "success";
        case Outcome::fallback:   return "fallback";
        case Outcome::hard_error: return "hard-error";
    }
    return "unknown";
}

Orchestrator::Orchestrator(const core::EdgeConfig& config, PlaylistFetcher& fetcher, ResponseCache& cache)
    : cache_settings_(config.cache)
    , router_(config.routes, config.default_backend)
    , fetcher_(fetcher)
    , cache_(cache) {}

std::string Orchestrator::cache_key(std::string_view backend, std::string_view path,
                                    const core::QueryParams& query, std::string_view variant) {
    std::string key;
    key.reserve(backend.size() + path.size() + variant.size() + 16);
    key += backend;
    key += '|';
    key += path;
    if (!query.empty()) {
        key += '?';
        key += query.canonical();
    }
    key += '|';
    key += variant;
    return key;
}

EdgeResponse Orchestrator::handle(const EdgeRequest& request) {
    const bool head = request.method == "HEAD";
    if (request.method != "GET" && !head) {
        EdgeResponse response;
        response.status = 405;
        response.set_header("Allow", "GET, HEAD");
        response.set_header("Content-Type", "text/plain");
        response.body = "Method Not Allowed\n";
        return response;
    }

    const RouteTarget target = router_.resolve(request.path);
    const DeltaRequest classified = classify(target.path, request.query);

    EDGEHLS_LOG_DEBUG << request.method << " " << request.path << " -> " << target.backend
                      << " " << target.path << " [" << to_string(classified.kind) << "]";

    EdgeResponse response;
    switch (classified.kind) {
        case RequestClass::forward:
            response = forward(target, request.query);
            break;
        case RequestClass::full:
            response = serve_full(target, classified);
            break;
        case RequestClass::delta:
            response = serve_delta(target, classified);
            break;
    }

    if (head) {
        response.set_header("Content-Length", std::to_string(response.body.size()));
        response.body.clear();
    }
    return response;
}

Orchestrator::Snapshot Orchestrator::load_snapshot(const RouteTarget& target, const core::QueryParams& query) {
    const std::string key = cache_key(target.backend, target.path, query, VARIANT_FULL);

    auto cached = cache_.lookup(key);
    if (cached && !cached->stale) {
        EDGEHLS_LOG_TRACE << "snapshot hit " << key;
        return Snapshot{Outcome::success, std::move(cached->response), false};
    }

    auto fetched = fetcher_.fetch(target.backend, target.path, query);
    if (fetched && fetched->ok()) {
        CachedResponse response;
        response.status = fetched->status;
        response.content_type = content_type_or_default(fetched->content_type);
        response.body = std::move(fetched->body);
        response.max_age = fetched->max_age.value_or(cache_settings_.default_max_age);
        response.etag = std::move(fetched->etag);
        response.source_digest = digest(response.body);

        cache_.store(key, response, std::chrono::seconds(response.max_age));
        return Snapshot{Outcome::success, std::move(response), false};
    }

    if (cached) {
        EDGEHLS_LOG_WARNING << "origin failed for " << key << ", serving stale snapshot";
        return Snapshot{Outcome::success, std::move(cached->response), true};
    }

    Snapshot failed;
    failed.outcome = Outcome::hard_error;
    if (fetched) {
        // Origin answered with an error status: surface it
        EDGEHLS_LOG_WARNING << "origin returned " << fetched->status << " for " << key;
        failed.response.status = fetched->status;
        failed.response.content_type = fetched->content_type;
        failed.response.body = std::move(fetched->body);
    } else {
        EDGEHLS_LOG_WARNING << "origin unreachable for " << key << ": " << fetched.error().message();
        failed.response.status = core::BAD_GATEWAY;
    }
    return failed;
}

EdgeResponse Orchestrator::forward(const RouteTarget& target, const core::QueryParams& query) {
    auto fetched = fetcher_.fetch(target.backend, target.path, query);
    if (!fetched) {
        auto response = bad_gateway();
        response.set_header(std::string(HEADER_VARIANT), std::string(VARIANT_FORWARD));
        return response;
    }

    EdgeResponse response;
    response.status = fetched->status;
    if (!fetched->content_type.empty()) {
        response.set_header("Content-Type", fetched->content_type);
    }
    if (fetched->max_age) {
        response.set_header("Cache-Control", "public, max-age=" + std::to_string(*fetched->max_age));
    }
    if (!fetched->etag.empty()) {
        response.set_header("ETag", fetched->etag);
    }
    response.set_header(std::string(HEADER_VARIANT), std::string(VARIANT_FORWARD));
    response.body = std::move(fetched->body);
    return response;
}

EdgeResponse Orchestrator::serve_full(const RouteTarget& target, const DeltaRequest& request) {
    auto snapshot = load_snapshot(target, request.origin_query);
    if (snapshot.outcome == Outcome::hard_error) {
        return make_response(snapshot.response, VARIANT_FULL, Outcome::hard_error, false);
    }
    return make_response(snapshot.response, VARIANT_FULL, Outcome::success, snapshot.stale);
}

EdgeResponse Orchestrator::serve_delta(const RouteTarget& target, const DeltaRequest& request) {
    auto snapshot = load_snapshot(target, request.origin_query);
    if (snapshot.outcome == Outcome::hard_error) {
        return make_response(snapshot.response, VARIANT_FULL, Outcome::hard_error, false);
    }

    const std::string variant = "delta-" + std::string(delta::to_string(request.mode));
    const std::string delta_key = cache_key(target.backend, target.path, request.origin_query, variant);
    const std::string fallback_key = cache_key(target.backend, target.path, request.origin_query,
                                               VARIANT_FALLBACK);
    const std::size_t source = digest(snapshot.response.body);

    // Derived entries are only reused when rendered from this exact snapshot
    if (!snapshot.stale) {
        if (auto hit = cache_.lookup(delta_key); hit && !hit->stale && hit->response.source_digest == source) {
            return make_response(hit->response, VARIANT_DELTA, Outcome::success, false);
        }
        if (auto hit = cache_.lookup(fallback_key); hit && !hit->stale && hit->response.source_digest == source) {
            return make_response(hit->response, VARIANT_FALLBACK, Outcome::fallback, false);
        }
    }

    auto outcome = delta::transform(snapshot.response.body, request.mode);

    CachedResponse derived = snapshot.response;
    derived.body = std::move(outcome.body);
    derived.source_digest = source;

    const bool is_delta = outcome.is_delta();
    if (is_delta) {
        EDGEHLS_LOG_DEBUG << "delta " << variant << " skipped " << outcome.skipped_segments
                          << " segments of " << target.path;
    } else {
        EDGEHLS_LOG_DEBUG << "delta fallback for " << target.path << ": " << outcome.reason.message();
    }

    if (!snapshot.stale) {
        cache_.store(is_delta ? delta_key : fallback_key, derived, std::chrono::seconds(derived.max_age));
    }
    return make_response(derived, is_delta ? VARIANT_DELTA : VARIANT_FALLBACK,
                         is_delta ? Outcome::success : Outcome::fallback, snapshot.stale);
}

EdgeResponse Orchestrator::make_response(const CachedResponse& cached, std::string_view variant,
                                         Outcome outcome, bool stale) const {
    if (outcome == Outcome::hard_error) {
        if (cached.status == core::BAD_GATEWAY && cached.body.empty()) {
            auto response = bad_gateway();
            response.set_header(std::string(HEADER_OUTCOME), std::string(to_string(outcome)));
            return response;
        }
        EdgeResponse response;
        response.status = cached.status;
        if (!cached.content_type.empty()) {
            response.set_header("Content-Type", cached.content_type);
        }
        response.set_header("Cache-Control", "no-store");
        response.set_header(std::string(HEADER_OUTCOME), std::string(to_string(outcome)));
        response.body = cached.body;
        return response;
    }

    EdgeResponse response;
    response.status = cached.status;
    response.set_header("Content-Type", content_type_or_default(cached.content_type));
    response.set_header("Cache-Control", cache_control(stale ? 0 : cached.max_age));
    if (variant == VARIANT_FULL && !cached.etag.empty()) {
        response.set_header("ETag", cached.etag);
    }
    response.set_header(std::string(HEADER_VARIANT), std::string(variant));
    response.set_header(std::string(HEADER_OUTCOME), std::string(to_string(outcome)));
    if (stale) {
        response.set_header("Warning", std::string(STALE_WARNING));
    }
    response.body = cached.body;
    return response;
}

std::string Orchestrator::cache_control(std::uint32_t max_age) const {
    std::string value = "public, max-age=" + std::to_string(max_age);
    if (cache_settings_.stale_while_revalidate > 0) {
        value += ", stale-while-revalidate=" + std::to_string(cache_settings_.stale_while_revalidate);
    }
    return value;
}

} // namespace edgehls::edge
