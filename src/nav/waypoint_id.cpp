#include "nav/waypoint_id.hpp"

#include <cctype>

namespace wg::nav {

namespace {

constexpr size_t MAX_INDEX_DIGITS = 6;

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

} // namespace

std::optional<WaypointId> WaypointId::parse(std::string_view text) {
    text = trim(text);
    if (text.size() < 2 || text.size() > 1 + MAX_INDEX_DIGITS)
        return std::nullopt;

    char tag = static_cast<char>(
        std::toupper(static_cast<unsigned char>(text[0])));
    if (tag != 'A' && tag != 'B') return std::nullopt;

    u32 index = 0;
    for (size_t i = 1; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c)) return std::nullopt;
        index = index * 10 + static_cast<u32>(c - '0');
    }
    if (index == 0) return std::nullopt;

    return WaypointId(tag, index);
}

std::optional<WaypointId> WaypointId::parse_spoken(std::string_view phrase) {
    std::string compact;
    compact.reserve(phrase.size());
    for (char c : phrase) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == '-') continue;
        compact.push_back(c);
    }
    return parse(compact);
}

std::string WaypointId::str() const {
    return std::string(1, series) + std::to_string(index);
}

} // namespace wg::nav
