// Copyright (c) 2026 changcheng967. All rights reserved.

#include <edgehls/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace edgehls::core {

//=============================================================================
// QueryParams
//=============================================================================

QueryParams QueryParams::parse(std::string_view query) {
    QueryParams result;
    if (!query.empty() && query.front() == '?') {
        query.remove_prefix(1);
    }

    while (!query.empty()) {
        auto amp = query.find('&');
        auto piece = query.substr(0, amp);
        query = (amp == std::string_view::npos) ? std::string_view{} : query.substr(amp + 1);

        if (piece.empty()) {
            continue;
        }

        QueryParam param;
        auto eq = piece.find('=');
        if (eq == std::string_view::npos) {
            param.name = std::string(piece);
        } else {
            param.name = std::string(piece.substr(0, eq));
            param.value = std::string(piece.substr(eq + 1));
            param.has_value = true;
        }
        result.params_.push_back(std::move(param));
    }

    return result;
}

std::optional<std::string_view> QueryParams::get(std::string_view name) const noexcept {
    for (const auto& p : params_) {
        if (p.name == name) {
            return std::string_view(p.value);
        }
    }
    return std::nullopt;
}

bool QueryParams::contains(std::string_view name) const noexcept {
    return std::any_of(params_.begin(), params_.end(),
                       [name](const QueryParam& p) { return p.name == name; });
}

void QueryParams::add(std::string name, std::string value) {
    params_.push_back(QueryParam{std::move(name), std::move(value), true});
}

void QueryParams::remove(std::string_view name) {
    std::erase_if(params_, [name](const QueryParam& p) { return p.name == name; });
}

namespace {

std::string join(const std::vector<QueryParam>& params) {
    std::string out;
    for (const auto& p : params) {
        if (!out.empty()) {
            out += '&';
        }
        out += p.name;
        if (p.has_value) {
            out += '=';
            out += p.value;
        }
    }
    return out;
}

} // namespace

std::string QueryParams::to_string() const {
    return join(params_);
}

std::string QueryParams::canonical() const {
    auto sorted = params_;
    std::stable_sort(sorted.begin(), sorted.end(), [](const QueryParam& a, const QueryParam& b) {
        if (a.name != b.name) return a.name < b.name;
        return a.value < b.value;
    });
    return join(sorted);
}

//=============================================================================
// Url
//=============================================================================

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(FetchErrc::invalid_url));
    }

    for (std::size_t i = 0; i < scheme_end; ++i) {
        url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
    }
    if (url.scheme_ != "http" && url.scheme_ != "https") {
        return std::unexpected(make_error_code(FetchErrc::invalid_url));
    }

    auto rest_start = scheme_end + 3;

    auto path_start = url_str.find('/', rest_start);
    if (path_start == std::string_view::npos) {
        path_start = url_str.length();
    }

    auto query_start = url_str.find('?', rest_start);
    if (query_start == std::string_view::npos) {
        query_start = url_str.length();
    }

    auto fragment_start = url_str.find('#', rest_start);
    if (fragment_start == std::string_view::npos) {
        fragment_start = url_str.length();
    }

    auto host_end = std::min({path_start, query_start, fragment_start});

    // Skip userinfo (user:pass@host)
    std::size_t authority_start = rest_start;
    auto at_pos = url_str.find('@', rest_start);
    if (at_pos != std::string_view::npos && at_pos < host_end) {
        authority_start = at_pos + 1;
    }

    auto authority = url_str.substr(authority_start, host_end - authority_start);
    if (!authority.empty() && authority.front() == '[') {
        // IPv6 literal [::1]:port
        auto bracket_end = authority.find(']');
        if (bracket_end == std::string_view::npos) {
            return std::unexpected(make_error_code(FetchErrc::invalid_url));
        }
        url.host_ = std::string(authority.substr(0, bracket_end + 1));
        auto rest = authority.substr(bracket_end + 1);
        if (rest.starts_with(":")) {
            url.port_ = std::string(rest.substr(1));
        }
    } else {
        auto colon = authority.find(':');
        if (colon != std::string_view::npos) {
            url.host_ = std::string(authority.substr(0, colon));
            url.port_ = std::string(authority.substr(colon + 1));
        } else {
            url.host_ = std::string(authority);
        }
    }

    if (!url.port_.empty() &&
        !std::all_of(url.port_.begin(), url.port_.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::unexpected(make_error_code(FetchErrc::invalid_url));
    }

    if (path_start < url_str.length() && path_start < std::min(query_start, fragment_start)) {
        auto path_end = std::min(query_start, fragment_start);
        url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
    } else {
        url.path_ = "/";
    }

    if (query_start < url_str.length() && query_start < fragment_start) {
        url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
    }

    if (fragment_start < url_str.length()) {
        url.fragment_ = std::string(url_str.substr(fragment_start + 1));
    }

    if (url.host_.empty()) {
        return std::unexpected(make_error_code(FetchErrc::invalid_url));
    }

    return url;
}

std::string Url::full() const {
    std::string result = base();
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    if (!fragment_.empty()) {
        result += "#";
        result += fragment_;
    }
    return result;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::string Url::resolve(std::string_view request_path, const QueryParams& query) const {
    std::string result = base();

    std::string_view prefix = path_;
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.remove_suffix(1);
    }
    result += prefix;

    if (!request_path.starts_with("/")) {
        result += '/';
    }
    result += request_path;

    auto q = query.to_string();
    if (!q.empty()) {
        result += '?';
        result += q;
    }
    return result;
}

std::pair<std::string, QueryParams> split_target(std::string_view target) {
    auto fragment = target.find('#');
    if (fragment != std::string_view::npos) {
        target = target.substr(0, fragment);
    }

    auto q = target.find('?');
    if (q == std::string_view::npos) {
        return {std::string(target), QueryParams{}};
    }
    return {std::string(target.substr(0, q)), QueryParams::parse(target.substr(q + 1))};
}

} // namespace edgehls::core
