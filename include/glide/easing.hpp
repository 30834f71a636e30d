#pragma once

#include <glide/curve.hpp>
#include <glide/time.hpp>

namespace glide
{

// Declarative configuration for new transitions.
//
// A reversible easing moves back along the same curve when the new target is
// the value the transition started from (0 -> 1 -> 0). A non-reversible one
// treats every new target as a fresh forward transition from the current
// value.
struct Easing
{
    Curve    curve      = Curve::linear();
    Duration duration   = DEFAULT_DURATION;
    bool     reversible = false;

    constexpr Easing() = default;
    constexpr explicit Easing(Curve c) : curve(c) {}
    constexpr Easing(Curve c, Duration d, bool rev = false) : curve(c), duration(d), reversible(rev)
    {
    }

    constexpr Easing with_curve(Curve c) const { return Easing(c, duration, reversible); }
    constexpr Easing with_duration(Duration d) const { return Easing(curve, d, reversible); }
    constexpr Easing with_reversible(bool rev) const { return Easing(curve, duration, rev); }

    constexpr Easing very_quick() const { return with_duration(std::chrono::milliseconds(100)); }
    constexpr Easing quick() const { return with_duration(std::chrono::milliseconds(200)); }
    constexpr Easing slow() const { return with_duration(std::chrono::milliseconds(400)); }
    constexpr Easing very_slow() const { return with_duration(std::chrono::milliseconds(500)); }

    constexpr bool operator==(const Easing& o) const
    {
        return curve == o.curve && duration == o.duration && reversible == o.reversible;
    }
    constexpr bool operator!=(const Easing& o) const { return !(*this == o); }
};

namespace easings
{
inline constexpr Easing linear{Curve::linear()};
inline constexpr Easing ease{Curve::ease()};
inline constexpr Easing ease_in{Curve::ease_in()};
inline constexpr Easing ease_out{Curve::ease_out()};
inline constexpr Easing ease_in_out{Curve::ease_in_out()};
}   // namespace easings

}   // namespace glide
