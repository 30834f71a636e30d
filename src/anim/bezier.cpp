#include <algorithm>
#include <cmath>
#include <glide/bezier.hpp>

namespace glide::ease
{

float CubicBezier::sample_x(float u) const
{
    // bezier_x(u) = 3*(1-u)^2*u*x1 + 3*(1-u)*u^2*x2 + u^3
    float inv = 1.0f - u;
    return 3.0f * inv * inv * u * x1 + 3.0f * inv * u * u * x2 + u * u * u;
}

float CubicBezier::sample_y(float u) const
{
    float inv = 1.0f - u;
    return 3.0f * inv * inv * u * y1 + 3.0f * inv * u * u * y2 + u * u * u;
}

float CubicBezier::sample_dx(float u) const
{
    float inv = 1.0f - u;
    return 3.0f * inv * inv * x1 + 6.0f * inv * u * (x2 - x1) + 3.0f * u * u * (1.0f - x2);
}

float CubicBezier::solve_u(float x) const
{
    // Newton-Raphson from u = x
    float u = x;
    for (int i = 0; i < NEWTON_ITERATIONS; ++i)
    {
        float err = sample_x(u) - x;
        if (std::abs(err) < EPSILON)
            return u;

        float dx = sample_dx(u);
        if (std::abs(dx) < 1e-7f)
            break;
        u = std::clamp(u - err / dx, 0.0f, 1.0f);
    }

    // Bisection fallback. bezier_x is monotonic for x1, x2 in [0,1].
    float lo   = 0.0f;
    float hi   = 1.0f;
    float best = u;
    float best_err = std::abs(sample_x(u) - x);
    for (int i = 0; i < BISECTION_ITERATIONS; ++i)
    {
        float mid = 0.5f * (lo + hi);
        float err = sample_x(mid) - x;
        if (std::abs(err) < best_err)
        {
            best     = mid;
            best_err = std::abs(err);
        }
        if (std::abs(err) < EPSILON)
            break;
        if (err < 0.0f)
            lo = mid;
        else
            hi = mid;
    }
    return best;
}

float CubicBezier::operator()(float x) const
{
    if (!(x > 0.0f))
        return 0.0f;
    if (x >= 1.0f)
        return 1.0f;

    return sample_y(solve_u(x));
}

}   // namespace glide::ease
