// Copyright (c) 2026 changcheng967. All rights reserved.

#include <edgehls/core/edge_config.hpp>
#include <edgehls/core/log.hpp>
#include <nlohmann/json.hpp>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace edgehls::core {

namespace {

template<typename T>
void read_number(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key)) {
        out = j[key].get<T>();
    }
}

} // namespace

std::optional<std::string> process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

std::string EdgeConfig::backend_env_name(std::string_view backend) {
    std::string name = "EDGEHLS_BACKEND_";
    for (char c : backend) {
        name += std::isalnum(static_cast<unsigned char>(c))
            ? static_cast<char>(std::toupper(static_cast<unsigned char>(c)))
            : '_';
    }
    return name;
}

std::expected<EdgeConfig, std::error_code> EdgeConfig::parse(std::string_view json) noexcept {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        EDGEHLS_LOG_ERROR << "config parse error: " << e.what();
        return std::unexpected(make_error_code(ConfigErrc::invalid_json));
    }

    if (!j.is_object()) {
        return std::unexpected(make_error_code(ConfigErrc::invalid_json));
    }

    EdgeConfig config;
    try {
        read_number(j, "listen_port", config.listen_port);

        if (!j.contains("backends") || !j["backends"].is_object() || j["backends"].empty()) {
            return std::unexpected(make_error_code(ConfigErrc::missing_backends));
        }
        for (auto& [name, value] : j["backends"].items()) {
            auto url = Url::parse(value.get<std::string>());
            if (!url) {
                EDGEHLS_LOG_ERROR << "backend " << name << " has an invalid URL";
                return std::unexpected(make_error_code(ConfigErrc::invalid_value));
            }
            config.backends.emplace(name, std::move(*url));
        }

        if (j.contains("default_backend")) {
            config.default_backend = j["default_backend"].get<std::string>();
        } else if (config.backends.size() == 1) {
            config.default_backend = config.backends.begin()->first;
        }

        if (j.contains("routes") && j["routes"].is_array()) {
            for (const auto& r : j["routes"]) {
                Route route;
                route.prefix = r.at("prefix").get<std::string>();
                route.backend = r.at("backend").get<std::string>();
                if (r.contains("strip_prefix")) {
                    route.strip_prefix = r["strip_prefix"].get<bool>();
                }
                if (!route.prefix.starts_with("/")) {
                    return std::unexpected(make_error_code(ConfigErrc::invalid_value));
                }
                config.routes.push_back(std::move(route));
            }
        }

        if (j.contains("cache") && j["cache"].is_object()) {
            const auto& c = j["cache"];
            read_number(c, "default_max_age", config.cache.default_max_age);
            read_number(c, "stale_while_revalidate", config.cache.stale_while_revalidate);
            read_number(c, "stale_if_error", config.cache.stale_if_error);
            read_number(c, "max_entries", config.cache.max_entries);
        }

        if (j.contains("fetch") && j["fetch"].is_object()) {
            const auto& f = j["fetch"];
            read_number(f, "connect_timeout", config.fetch.connect_timeout);
            read_number(f, "timeout", config.fetch.timeout);
        }
    } catch (const nlohmann::json::exception& e) {
        EDGEHLS_LOG_ERROR << "config value error: " << e.what();
        return std::unexpected(make_error_code(ConfigErrc::invalid_value));
    }

    if (auto ec = config.validate()) {
        return std::unexpected(ec);
    }
    return config;
}

std::expected<EdgeConfig, std::error_code> EdgeConfig::load(std::string_view path) noexcept {
    std::ifstream file{std::string(path)};
    if (!file) {
        return std::unexpected(make_error_code(ConfigErrc::file_not_found));
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return parse(ss.str());
}

std::error_code EdgeConfig::apply_env(const EnvLookup& lookup) {
    for (auto& [name, url] : backends) {
        if (auto value = lookup(backend_env_name(name))) {
            auto parsed = Url::parse(*value);
            if (!parsed) {
                return make_error_code(ConfigErrc::invalid_value);
            }
            EDGEHLS_LOG_INFO << "backend " << name << " overridden from environment: " << parsed->full();
            url = std::move(*parsed);
        }
    }

    if (auto value = lookup("EDGEHLS_LISTEN_PORT")) {
        std::uint16_t port = 0;
        auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), port);
        if (ec != std::errc{} || ptr != value->data() + value->size() || port == 0) {
            return make_error_code(ConfigErrc::invalid_value);
        }
        listen_port = port;
    }
    return {};
}

std::error_code EdgeConfig::validate() const noexcept {
    if (backends.empty()) {
        return make_error_code(ConfigErrc::missing_backends);
    }
    if (!backends.contains(default_backend)) {
        return make_error_code(ConfigErrc::unknown_default_backend);
    }
    for (const auto& route : routes) {
        if (!backends.contains(route.backend)) {
            return make_error_code(ConfigErrc::unknown_route_backend);
        }
    }
    return {};
}

} // namespace edgehls::core
