// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace edgehls::core {

// Origin fetch failures
enum class FetchErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    dns_error,
    ssl_error,
    too_many_redirects,
    upstream_status,      // Origin answered with a non-2xx status
    invalid_url,
    unknown_backend,
};

// Configuration loading failures
enum class ConfigErrc {
    success = 0,
    file_not_found,
    invalid_json,
    missing_backends,
    unknown_default_backend,
    unknown_route_backend,
    invalid_value,
};

namespace detail {

struct FetchErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "edgehls::fetch";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<FetchErrc>(ev)) {
            case FetchErrc::success:             return "Success";
            case FetchErrc::network_error:       return "Network error";
            case FetchErrc::timeout:             return "Operation timed out";
            case FetchErrc::refused:             return "Connection refused";
            case FetchErrc::dns_error:           return "DNS resolution failed";
            case FetchErrc::ssl_error:           return "SSL/TLS error";
            case FetchErrc::too_many_redirects:  return "Too many redirects";
            case FetchErrc::upstream_status:     return "Origin returned an error status";
            case FetchErrc::invalid_url:         return "Invalid URL";
            case FetchErrc::unknown_backend:     return "Unknown backend";
            default:                             return "Unknown error";
        }
    }
};

struct ConfigErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "edgehls::config";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<ConfigErrc>(ev)) {
            case ConfigErrc::success:                  return "Success";
            case ConfigErrc::file_not_found:           return "Config file not found";
            case ConfigErrc::invalid_json:             return "Config is not valid JSON";
            case ConfigErrc::missing_backends:         return "No backends configured";
            case ConfigErrc::unknown_default_backend:  return "Default backend is not configured";
            case ConfigErrc::unknown_route_backend:    return "Route names an unknown backend";
            case ConfigErrc::invalid_value:            return "Invalid config value";
            default:                                   return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::FetchErrcCategory& fetch_errc_category() noexcept {
    static detail::FetchErrcCategory category;
    return category;
}

inline std::error_code make_error_code(FetchErrc e) noexcept {
    return {static_cast<int>(e), fetch_errc_category()};
}

inline const detail::ConfigErrcCategory& config_errc_category() noexcept {
    static detail::ConfigErrcCategory category;
    return category;
}

inline std::error_code make_error_code(ConfigErrc e) noexcept {
    return {static_cast<int>(e), config_errc_category()};
}

} // namespace edgehls::core

namespace std {

template<>
struct is_error_code_enum<edgehls::core::FetchErrc> : true_type {};

template<>
struct is_error_code_enum<edgehls::core::ConfigErrc> : true_type {};

} // namespace std
