// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <edgehls/playlist/error.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <expected>

namespace edgehls::playlist {

struct Attribute {
    std::string name;
    std::string value;   // Without surrounding quotes
    bool quoted{false};
};

// Comma-separated KEY=VALUE list of a tag, in source order.
// Commas inside quoted strings do not separate attributes. Unknown
// attributes are kept; rendering never re-serializes from this list.
class AttributeList {
public:
    [[nodiscard]] static std::expected<AttributeList, std::error_code>
    parse(std::string_view text) noexcept;

    [[nodiscard]] const Attribute* find(std::string_view name) const noexcept;
    [[nodiscard]] bool contains(std::string_view name) const noexcept { return find(name) != nullptr; }

    [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept;

    // Decimal-floating-point value; nullopt when absent or not a number
    [[nodiscard]] std::optional<double> get_double(std::string_view name) const noexcept;

    // Enumerated YES/NO value; false when absent
    [[nodiscard]] bool get_yes(std::string_view name) const noexcept;

    [[nodiscard]] const std::vector<Attribute>& attributes() const noexcept { return attributes_; }
    [[nodiscard]] std::size_t size() const noexcept { return attributes_.size(); }

private:
    std::vector<Attribute> attributes_;
};

// Strict decimal parse of the whole string ("4.00008", "12", not "4s")
[[nodiscard]] std::optional<double> parse_decimal(std::string_view text) noexcept;

// Strict non-negative integer parse
[[nodiscard]] std::optional<std::uint64_t> parse_integer(std::string_view text) noexcept;

} // namespace edgehls::playlist
