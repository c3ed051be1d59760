#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>

// Capacity of the bounded queue used by DROP_LATEST / DROP_OLDEST / ERROR
// when no explicit capacity is passed. Override with -DSURGE_DEFAULT_BUFFER_SIZE=N.
#ifndef SURGE_DEFAULT_BUFFER_SIZE
#define SURGE_DEFAULT_BUFFER_SIZE 128
#endif

namespace surge {

inline constexpr std::size_t default_buffer_size = SURGE_DEFAULT_BUFFER_SIZE;

// request(unbounded) switches a flow subscription to "no backpressure".
inline constexpr std::int64_t unbounded = std::numeric_limits<std::int64_t>::max();

static_assert(default_buffer_size > 0, "SURGE_DEFAULT_BUFFER_SIZE must be > 0");

} // namespace surge
