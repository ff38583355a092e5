#pragma once

#include "core/types.hpp"

#include <chrono>

namespace wg {

/// Milliseconds on the monotonic clock shared by all adapters.
inline TimestampMs now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

} // namespace wg
