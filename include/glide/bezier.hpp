#pragma once

namespace glide::ease
{

// Cubic-bezier easing with implicit endpoints (0,0) and (1,1), as used by
// CSS timing functions. Stateless; evaluate with operator().
struct CubicBezier
{
    float x1 = 0.0f;
    float y1 = 0.0f;
    float x2 = 1.0f;
    float y2 = 1.0f;

    // Solver budget. Newton steps run first, bisection only if Newton stalls.
    static constexpr int   NEWTON_ITERATIONS    = 8;
    static constexpr int   BISECTION_ITERATIONS = 32;
    static constexpr float EPSILON              = 1e-6f;

    // Eased progress for normalized input x. Exact at 0 and 1.
    float operator()(float x) const;

    // Curve parameter u in [0,1] whose x coordinate is closest to x.
    float solve_u(float x) const;

    float sample_x(float u) const;
    float sample_y(float u) const;
    float sample_dx(float u) const;

    constexpr bool operator==(const CubicBezier& o) const
    {
        return x1 == o.x1 && y1 == o.y1 && x2 == o.x2 && y2 == o.y2;
    }
    constexpr bool operator!=(const CubicBezier& o) const { return !(*this == o); }
};

// CSS timing-function control points
inline constexpr CubicBezier css_ease{0.25f, 0.1f, 0.25f, 1.0f};
inline constexpr CubicBezier css_ease_in{0.42f, 0.0f, 1.0f, 1.0f};
inline constexpr CubicBezier css_ease_out{0.0f, 0.0f, 0.58f, 1.0f};
inline constexpr CubicBezier css_ease_in_out{0.42f, 0.0f, 0.58f, 1.0f};

}   // namespace glide::ease
