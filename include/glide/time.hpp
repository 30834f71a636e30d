#pragma once

#include <chrono>

namespace glide
{

using Clock    = std::chrono::steady_clock;
using Instant  = Clock::time_point;
using Duration = Clock::duration;

// Duration used by every default-constructed Easing and Transition.
inline constexpr Duration DEFAULT_DURATION = std::chrono::milliseconds(500);

inline float to_seconds(Duration d)
{
    return std::chrono::duration<float>(d).count();
}

}   // namespace glide
