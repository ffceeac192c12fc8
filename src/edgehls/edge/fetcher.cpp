// Copyright (c) 2026 changcheng967. All rights reserved.

#include <edgehls/edge/fetcher.hpp>
#include <edgehls/core/log.hpp>

namespace edgehls::edge {

CurlPlaylistFetcher::CurlPlaylistFetcher(const core::EdgeConfig& config)
    : backends_(config.backends)
    , session_(core::HttpOptions{config.fetch.connect_timeout, config.fetch.timeout}) {}

std::expected<FetchedPlaylist, std::error_code>
CurlPlaylistFetcher::fetch(const std::string& backend, std::string_view path,
                           const core::QueryParams& query) {
    auto it = backends_.find(backend);
    if (it == backends_.end()) {
        EDGEHLS_LOG_ERROR << "no backend named " << backend;
        return std::unexpected(make_error_code(core::FetchErrc::unknown_backend));
    }

    const std::string url = it->second.resolve(path, query);
    EDGEHLS_LOG_DEBUG << "origin fetch " << backend << ": " << url;

    auto response = session_.get(url);
    if (!response) {
        EDGEHLS_LOG_WARNING << "origin fetch failed for " << url << ": " << response.error().message();
        return std::unexpected(response.error());
    }

    FetchedPlaylist fetched;
    fetched.status = response->status_code;
    fetched.body = std::move(response->body);
    fetched.content_type = std::move(response->content_type);
    fetched.max_age = response->max_age();
    if (auto etag = response->header("etag")) {
        fetched.etag = std::string(*etag);
    }
    return fetched;
}

} // namespace edgehls::edge
