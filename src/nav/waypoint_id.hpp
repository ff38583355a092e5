#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace wg::nav {

/// Identifier printed on a QR marker: a series tag ('A' for landmarks and
/// rooms, 'B' for intermediate markers) followed by a positive index.
struct WaypointId {
    char series = 'A';
    u32 index = 0;

    WaypointId() = default;
    WaypointId(char s, u32 i) : series(s), index(i) {}

    /// Parse the decoded text of a QR code, e.g. "A7" or " b12 ".
    /// Leading/trailing whitespace is ignored and the tag is case-insensitive.
    static std::optional<WaypointId> parse(std::string_view text);

    /// Parse a recognized spoken destination ("a 7", "B-12").
    /// Inner spaces and hyphens are dropped before parsing.
    static std::optional<WaypointId> parse_spoken(std::string_view phrase);

    std::string str() const;

    bool operator==(const WaypointId& o) const {
        return series == o.series && index == o.index;
    }
    bool operator!=(const WaypointId& o) const { return !(*this == o); }

    /// Series first, then numeric index: A2 < A10 < B1.
    bool operator<(const WaypointId& o) const {
        if (series != o.series) return series < o.series;
        return index < o.index;
    }
};

} // namespace wg::nav
