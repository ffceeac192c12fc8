// Copyright (c) 2026 changcheng967. All rights reserved.

#include <edgehls/edge/request.hpp>
#include <edgehls/core/config.hpp>
#include <edgehls/playlist/parser.hpp>
#include <algorithm>
#include <cctype>

namespace edgehls::edge {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) ==
                   std::tolower(static_cast<unsigned char>(y));
        });
}

} // namespace

EdgeRequest EdgeRequest::from_target(std::string method, std::string_view target) {
    auto [path, query] = core::split_target(target);
    EdgeRequest request;
    request.method = std::move(method);
    request.path = std::move(path);
    request.query = std::move(query);
    return request;
}

std::optional<std::string_view> EdgeResponse::header(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return std::string_view(value);
        }
    }
    return std::nullopt;
}

void EdgeResponse::set_header(std::string name, std::string value) {
    for (auto& [key, existing] : headers) {
        if (iequals(key, name)) {
            existing = std::move(value);
            return;
        }
    }
    headers.emplace_back(std::move(name), std::move(value));
}

std::string_view to_string(RequestClass cls) noexcept {
    switch (cls) {
        case RequestClass::forward: return "forward";
        case RequestClass::full:    return "full";
        case RequestClass::delta:   return "delta";
    }
    return "unknown";
}

DeltaRequest classify(std::string_view path, const core::QueryParams& query) {
    DeltaRequest request;
    request.origin_query = query;

    if (!playlist::PlaylistParser::is_playlist_path(path)) {
        return request;
    }

    request.blocking_reload = query.contains(core::QUERY_MSN) || query.contains(core::QUERY_PART);
    if (request.blocking_reload) {
        return request;
    }

    request.origin_query.remove(core::QUERY_SKIP);

    if (auto skip = query.get(core::QUERY_SKIP)) {
        request.mode = delta::parse_skip_mode(*skip);
    }
    request.kind = request.mode == delta::SkipMode::none ? RequestClass::full : RequestClass::delta;
    return request;
}

} // namespace edgehls::edge
