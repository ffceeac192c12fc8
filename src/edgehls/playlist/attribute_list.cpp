// Copyright (c) 2026 changcheng967. All rights reserved.

#include <edgehls/playlist/attribute_list.hpp>
#include <charconv>
#include <cmath>

namespace edgehls::playlist {

namespace {

bool is_space(char c) noexcept {
    return c == ' ' || c == '\t';
}

} // namespace

std::optional<double> parse_decimal(std::string_view text) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value,
                                     std::chars_format::fixed);
    if (ec != std::errc{} || ptr != text.data() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::uint64_t> parse_integer(std::string_view text) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::expected<AttributeList, std::error_code>
AttributeList::parse(std::string_view text) noexcept {
    AttributeList list;
    std::size_t pos = 0;
    const std::size_t n = text.size();

    while (pos < n) {
        while (pos < n && is_space(text[pos])) ++pos;
        if (pos == n) break;

        // Attribute name
        auto name_start = pos;
        while (pos < n && text[pos] != '=' && text[pos] != ',') ++pos;
        if (pos == n || text[pos] != '=') {
            return std::unexpected(make_error_code(PlaylistErrc::attribute_syntax));
        }
        auto name = text.substr(name_start, pos - name_start);
        while (!name.empty() && is_space(name.back())) name.remove_suffix(1);
        if (name.empty()) {
            return std::unexpected(make_error_code(PlaylistErrc::attribute_syntax));
        }
        ++pos; // '='

        Attribute attr;
        attr.name = std::string(name);

        if (pos < n && text[pos] == '"') {
            auto close = text.find('"', pos + 1);
            if (close == std::string_view::npos) {
                return std::unexpected(make_error_code(PlaylistErrc::attribute_syntax));
            }
            attr.value = std::string(text.substr(pos + 1, close - pos - 1));
            attr.quoted = true;
            pos = close + 1;
            while (pos < n && is_space(text[pos])) ++pos;
            if (pos < n && text[pos] != ',') {
                return std::unexpected(make_error_code(PlaylistErrc::attribute_syntax));
            }
        } else {
            auto comma = text.find(',', pos);
            auto end = (comma == std::string_view::npos) ? n : comma;
            auto value = text.substr(pos, end - pos);
            while (!value.empty() && is_space(value.back())) value.remove_suffix(1);
            if (value.find('"') != std::string_view::npos) {
                return std::unexpected(make_error_code(PlaylistErrc::attribute_syntax));
            }
            attr.value = std::string(value);
            pos = end;
        }

        list.attributes_.push_back(std::move(attr));

        if (pos < n) {
            ++pos; // ','
        }
    }

    return list;
}

const Attribute* AttributeList::find(std::string_view name) const noexcept {
    for (const auto& attr : attributes_) {
        if (attr.name == name) {
            return &attr;
        }
    }
    return nullptr;
}

std::optional<std::string_view> AttributeList::get(std::string_view name) const noexcept {
    if (const auto* attr = find(name)) {
        return std::string_view(attr->value);
    }
    return std::nullopt;
}

std::optional<double> AttributeList::get_double(std::string_view name) const noexcept {
    auto value = get(name);
    if (!value) {
        return std::nullopt;
    }
    return parse_decimal(*value);
}

bool AttributeList::get_yes(std::string_view name) const noexcept {
    auto value = get(name);
    return value && *value == "YES";
}

} // namespace edgehls::playlist
