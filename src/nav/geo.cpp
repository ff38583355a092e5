#include "nav/geo.hpp"

#include <algorithm>
#include <cmath>

namespace wg::nav {

static constexpr f64 EARTH_RADIUS_M = 6371000.0;
static constexpr f64 DEG_TO_RAD = 3.14159265358979323846 / 180.0;

f64 distance_m(const GeoPoint& a, const GeoPoint& b) {
    f64 dlat = (b.lat - a.lat) * DEG_TO_RAD;
    f64 dlon = (b.lon - a.lon) * DEG_TO_RAD;
    f64 s1 = std::sin(dlat / 2);
    f64 s2 = std::sin(dlon / 2);
    f64 h = s1 * s1 + std::cos(a.lat * DEG_TO_RAD) *
                          std::cos(b.lat * DEG_TO_RAD) * s2 * s2;
    return 2.0 * EARTH_RADIUS_M * std::asin(std::sqrt(std::min(1.0, h)));
}

bool is_valid(const GeoPoint& p) {
    return std::isfinite(p.lat) && std::isfinite(p.lon) &&
           p.lat >= -90.0 && p.lat <= 90.0 &&
           p.lon >= -180.0 && p.lon <= 180.0;
}

} // namespace wg::nav
