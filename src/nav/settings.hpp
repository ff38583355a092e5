#pragma once

#include "core/types.hpp"

namespace wg::nav {

/// Tunables for the router, the session's advisory GPS guidance and the
/// service idle timer. Overridable from the topology file's Settings table
/// and from the command line.
struct NavSettings {
    i64 debounce_ms = 1500;        ///< Repeated scans of one code inside this window collapse
    f64 max_speed_mps = 3.0;       ///< GPS samples implying a faster walk are noise
    i64 scan_timeout_ms = 30000;   ///< Idle time before a re-prompt is considered
    f64 min_movement_m = 3.0;      ///< Movement since the last scan that counts as walking
    f64 approach_radius_m = 5.0;   ///< "Getting closer" is announced once inside this radius
    f64 progress_step_m = 10.0;    ///< ...or each time the distance shrinks by this much
};

} // namespace wg::nav
