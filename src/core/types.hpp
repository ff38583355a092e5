#pragma once

#include <cstdint>
#include <filesystem>

namespace wg {

namespace fs = std::filesystem;

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i32 = int32_t;
using i64 = int64_t;
using f32 = float;
using f64 = double;

/// Monotonic timestamp in milliseconds, as supplied by the sensor adapters.
using TimestampMs = i64;

} // namespace wg
