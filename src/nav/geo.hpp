#pragma once

#include "core/types.hpp"

namespace wg::nav {

struct GeoPoint {
    f64 lat = 0.0;
    f64 lon = 0.0;
};

/// Great-circle distance in metres (haversine, spherical earth).
f64 distance_m(const GeoPoint& a, const GeoPoint& b);

/// True when lat is in [-90, 90] and lon in [-180, 180].
bool is_valid(const GeoPoint& p);

} // namespace wg::nav
