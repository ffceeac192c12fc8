// Copyright (c) 2026 changcheng967. All rights reserved.

#include <edgehls/core/http_session.hpp>
#include <edgehls/core/log.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace edgehls::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// Header callback, names lowercased. A new status line (redirect) resets the map.
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);
    if (header.starts_with("HTTP/")) {
        headers->clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) {
        value.remove_suffix(1);
    }

    (*headers)[to_lower(name)] = std::string(value);
    return total;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    if (!body) return 0;

    std::size_t total = size * nitems;
    body->append(ptr, total);
    return total;
}

FetchErrc map_curl_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:     return FetchErrc::timeout;
        case CURLE_COULDNT_CONNECT:        return FetchErrc::refused;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:  return FetchErrc::dns_error;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:     return FetchErrc::ssl_error;
        case CURLE_TOO_MANY_REDIRECTS:     return FetchErrc::too_many_redirects;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:   return FetchErrc::invalid_url;
        default:                           return FetchErrc::network_error;
    }
}

} // namespace

std::optional<std::string_view> HttpResponse::header(std::string_view name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return std::string_view(it->second);
}

std::optional<std::uint32_t> HttpResponse::max_age() const {
    auto cc = header("cache-control");
    if (!cc) {
        return std::nullopt;
    }
    return parse_max_age(*cc);
}

std::optional<std::uint32_t> parse_max_age(std::string_view cache_control) noexcept {
    std::size_t pos = 0;
    while (pos < cache_control.size()) {
        auto comma = cache_control.find(',', pos);
        auto directive = cache_control.substr(pos, comma == std::string_view::npos
                                                       ? std::string_view::npos
                                                       : comma - pos);
        pos = comma == std::string_view::npos ? cache_control.size() : comma + 1;

        while (!directive.empty() && directive.front() == ' ') directive.remove_prefix(1);
        while (!directive.empty() && directive.back() == ' ') directive.remove_suffix(1);

        constexpr std::string_view MAX_AGE = "max-age=";
        if (directive.size() <= MAX_AGE.size()) continue;
        bool match = std::equal(MAX_AGE.begin(), MAX_AGE.end(), directive.begin(),
            [](char a, char b) {
                return a == std::tolower(static_cast<unsigned char>(b));
            });
        if (!match) continue;

        auto value = directive.substr(MAX_AGE.size());
        std::uint32_t seconds = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
        if (ec == std::errc{} && ptr == value.data() + value.size()) {
            return seconds;
        }
        return std::nullopt;
    }
    return std::nullopt;
}

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession(HttpOptions options) : options_(options) {}

std::expected<HttpResponse, std::error_code>
HttpSession::get(const std::string& url) const noexcept {
    CurlHandle curl = CurlHandle(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(FetchErrc::network_error));
    }

    HttpResponse response{};

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout));
    curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT, static_cast<long>(options_.timeout));
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &response.body);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        EDGEHLS_LOG_DEBUG << "GET " << url << " failed: " << curl_easy_strerror(result);
        return std::unexpected(make_error_code(map_curl_error(result)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    char* ct = nullptr;
    if (curl_easy_getinfo(curl.ptr, CURLINFO_CONTENT_TYPE, &ct) == CURLE_OK && ct) {
        response.content_type = ct;
    }

    EDGEHLS_LOG_TRACE << "GET " << url << " -> " << response.status_code
                      << " (" << response.body.size() << " bytes)";
    return response;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace edgehls::core
