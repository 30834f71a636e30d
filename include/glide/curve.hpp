#pragma once

#include <glide/bezier.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace glide
{

// Maps normalized progress in [0,1] to eased progress in [0,1].
// Every curve returns exactly 0 at 0 and exactly 1 at 1. Custom curves whose
// y control points leave [0,1] are clamped rather than overshooting.
class Curve
{
   public:
    enum class Kind
    {
        Linear,
        Ease,
        EaseIn,
        EaseOut,
        EaseInOut,
        CubicBezier,   // user-supplied control points
    };

    constexpr Curve() = default;

    static constexpr Curve linear() { return Curve(Kind::Linear, {}); }
    static constexpr Curve ease() { return Curve(Kind::Ease, ease::css_ease); }
    static constexpr Curve ease_in() { return Curve(Kind::EaseIn, ease::css_ease_in); }
    static constexpr Curve ease_out() { return Curve(Kind::EaseOut, ease::css_ease_out); }
    static constexpr Curve ease_in_out() { return Curve(Kind::EaseInOut, ease::css_ease_in_out); }

    // x control points are clamped to [0,1] so the curve stays a function of x.
    static Curve cubic_bezier(float x1, float y1, float x2, float y2);

    // Parses "linear", "ease", "ease-in", "ease-out", "ease-in-out" or
    // "cubic-bezier(x1, y1, x2, y2)". Underscores are accepted for dashes.
    static std::optional<Curve> from_name(std::string_view name);

    float value(float t) const;
    float operator()(float t) const { return value(t); }

    Kind                     kind() const { return kind_; }
    const ease::CubicBezier& control_points() const { return bezier_; }

    // Inverse of from_name().
    std::string name() const;

    constexpr bool operator==(const Curve& o) const
    {
        if (kind_ != o.kind_)
            return false;
        return kind_ != Kind::CubicBezier || bezier_ == o.bezier_;
    }
    constexpr bool operator!=(const Curve& o) const { return !(*this == o); }

   private:
    constexpr Curve(Kind kind, ease::CubicBezier bezier) : kind_(kind), bezier_(bezier) {}

    Kind              kind_ = Kind::Linear;
    ease::CubicBezier bezier_{};
};

}   // namespace glide
