// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <edgehls/core/edge_config.hpp>
#include <edgehls/core/http_session.hpp>
#include <edgehls/core/url.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <expected>

namespace edgehls::edge {

// Origin answer. Non-2xx statuses are carried here, not reported as errors.
struct FetchedPlaylist {
    int status{200};
    std::string body;
    std::string content_type;
    std::optional<std::uint32_t> max_age;
    std::string etag;

    [[nodiscard]] bool ok() const noexcept { return status >= 200 && status < 300; }
};

// Playlist fetch collaborator. Errors are transport failures (FetchErrc).
class PlaylistFetcher {
public:
    virtual ~PlaylistFetcher() = default;

    [[nodiscard]] virtual std::expected<FetchedPlaylist, std::error_code>
    fetch(const std::string& backend, std::string_view path, const core::QueryParams& query) = 0;
};

// Fetches from the configured backends over libcurl
class CurlPlaylistFetcher final : public PlaylistFetcher {
public:
    explicit CurlPlaylistFetcher(const core::EdgeConfig& config);

    [[nodiscard]] std::expected<FetchedPlaylist, std::error_code>
    fetch(const std::string& backend, std::string_view path, const core::QueryParams& query) override;

private:
    std::map<std::string, core::Url> backends_;
    core::HttpSession session_;
};

} // namespace edgehls::edge
