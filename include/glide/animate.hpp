#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <glide/color.hpp>
#include <glide/geometry.hpp>
#include <limits>
#include <optional>
#include <span>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace glide
{

// Read position over a flat sequence of per-component deltas.
// Nested types consume contiguous sub-ranges in a fixed order. Reading past
// the end yields 0.0f so that short sequences degrade to no-ops.
class DeltaCursor
{
   public:
    explicit DeltaCursor(std::span<const float> deltas) : deltas_(deltas) {}

    float next()
    {
        float v = pos_ < deltas_.size() ? deltas_[pos_] : 0.0f;
        ++pos_;
        return v;
    }

    void skip(size_t count) { pos_ += count; }

    size_t position() const { return pos_; }
    size_t remaining() const { return pos_ < deltas_.size() ? deltas_.size() - pos_ : 0; }

   private:
    std::span<const float> deltas_;
    size_t                 pos_ = 0;
};

// ─── Animate capability ─────────────────────────────────────────────────────
//
// Specialize Animate<T> to make T animatable. A specialization provides:
//
//   static constexpr size_t components();
//       Number of scalar degrees of freedom. Must not depend on the value.
//
//   static void apply(T& value, DeltaCursor& deltas);
//       Adds exactly components() deltas to value, in a fixed order.
//
//   static void lerp(T& value, const T& start, const T& end, float t);
//       Sets value to the blend of start and end at fraction t.
//
//   static void distance(const T& from, const T& to, std::vector<float>& out);
//       Appends exactly components() signed distances (to - from), in the
//       same order apply() consumes them.
//
// apply(from, distance(from, to)) reproduces to, up to the rounding of
// quantized types.
template <typename T, typename Enable = void>
struct Animate;

template <typename T, typename = void>
struct is_animatable : std::false_type
{
};

template <typename T>
struct is_animatable<T, std::void_t<decltype(Animate<T>::components())>> : std::true_type
{
};

template <typename T>
inline constexpr bool is_animatable_v = is_animatable<T>::value;

// ─── Free functions ─────────────────────────────────────────────────────────

template <typename T>
constexpr size_t component_count()
{
    return Animate<T>::components();
}

template <typename T>
void apply_deltas(T& value, DeltaCursor& deltas)
{
    Animate<T>::apply(value, deltas);
}

template <typename T>
void apply_deltas(T& value, std::span<const float> deltas)
{
    DeltaCursor cursor(deltas);
    Animate<T>::apply(value, cursor);
}

template <typename T>
void lerp(T& value, const T& start, const T& end, float t)
{
    Animate<T>::lerp(value, start, end, t);
}

template <typename T>
T lerped(const T& start, const T& end, float t)
{
    T value = start;
    Animate<T>::lerp(value, start, end, t);
    return value;
}

// Always exactly component_count<T>() entries long.
template <typename T>
std::vector<float> distance(const T& from, const T& to)
{
    std::vector<float> out;
    out.reserve(Animate<T>::components());
    Animate<T>::distance(from, to, out);
    out.resize(Animate<T>::components(), 0.0f);
    return out;
}

namespace detail
{

inline float lerp_scalar(float start, float end, float t)
{
    return start + (end - start) * t;
}

// Rounds half away from zero into [0,255].
inline uint8_t quantize_channel(float v)
{
    return static_cast<uint8_t>(std::lround(std::clamp(v, 0.0f, 255.0f)));
}

template <typename T>
T round_to_integral(double v)
{
    constexpr double lo = static_cast<double>(std::numeric_limits<T>::lowest());
    constexpr double hi = static_cast<double>(std::numeric_limits<T>::max());
    if (std::isnan(v))
        return T{};
    return static_cast<T>(std::round(std::clamp(v, lo, hi)));
}

}   // namespace detail

// ─── Scalars ────────────────────────────────────────────────────────────────

template <typename T>
struct Animate<T, std::enable_if_t<std::is_floating_point_v<T>>>
{
    static constexpr size_t components() { return 1; }

    static void apply(T& value, DeltaCursor& deltas) { value += static_cast<T>(deltas.next()); }

    static void lerp(T& value, const T& start, const T& end, float t)
    {
        value = start + (end - start) * static_cast<T>(t);
    }

    static void distance(const T& from, const T& to, std::vector<float>& out)
    {
        out.push_back(static_cast<float>(to - from));
    }
};

// Integers up to 32 bits. Results round half away from zero and saturate.
template <typename T>
struct Animate<T,
               std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>
                                && (sizeof(T) <= 4)>>
{
    static constexpr size_t components() { return 1; }

    static void apply(T& value, DeltaCursor& deltas)
    {
        value = detail::round_to_integral<T>(static_cast<double>(value) + deltas.next());
    }

    static void lerp(T& value, const T& start, const T& end, float t)
    {
        double s = static_cast<double>(start);
        double e = static_cast<double>(end);
        value    = detail::round_to_integral<T>(s + (e - s) * t);
    }

    static void distance(const T& from, const T& to, std::vector<float>& out)
    {
        out.push_back(static_cast<float>(static_cast<double>(to) - static_cast<double>(from)));
    }
};

// ─── Colors ─────────────────────────────────────────────────────────────────

// r, g, b, a. Channels are clamped to [0,1] by apply() and lerp().
template <>
struct Animate<Color>
{
    static constexpr size_t components() { return 4; }

    static void apply(Color& value, DeltaCursor& deltas)
    {
        value.r = std::clamp(value.r + deltas.next(), 0.0f, 1.0f);
        value.g = std::clamp(value.g + deltas.next(), 0.0f, 1.0f);
        value.b = std::clamp(value.b + deltas.next(), 0.0f, 1.0f);
        value.a = std::clamp(value.a + deltas.next(), 0.0f, 1.0f);
    }

    static void lerp(Color& value, const Color& start, const Color& end, float t)
    {
        auto mix = [t](float s, float e)
        { return std::clamp(detail::lerp_scalar(s, e, t), 0.0f, 1.0f); };
        value.r = mix(start.r, end.r);
        value.g = mix(start.g, end.g);
        value.b = mix(start.b, end.b);
        value.a = mix(start.a, end.a);
    }

    static void distance(const Color& from, const Color& to, std::vector<float>& out)
    {
        out.push_back(to.r - from.r);
        out.push_back(to.g - from.g);
        out.push_back(to.b - from.b);
        out.push_back(to.a - from.a);
    }
};

// r, g, b, a as fractions of 255. Blends round half away from zero, so the
// midpoint of 255 and 0 is 128.
template <>
struct Animate<Color8>
{
    static constexpr size_t components() { return 4; }

    static void apply(Color8& value, DeltaCursor& deltas)
    {
        auto step = [&](uint8_t& c)
        {
            float f = std::clamp(c / 255.0f + deltas.next(), 0.0f, 1.0f);
            c       = detail::quantize_channel(f * 255.0f);
        };
        step(value.r);
        step(value.g);
        step(value.b);
        step(value.a);
    }

    static void lerp(Color8& value, const Color8& start, const Color8& end, float t)
    {
        auto mix = [t](uint8_t s, uint8_t e)
        { return detail::quantize_channel(detail::lerp_scalar(float(s), float(e), t)); };
        value.r = mix(start.r, end.r);
        value.g = mix(start.g, end.g);
        value.b = mix(start.b, end.b);
        value.a = mix(start.a, end.a);
    }

    static void distance(const Color8& from, const Color8& to, std::vector<float>& out)
    {
        out.push_back((float(to.r) - float(from.r)) / 255.0f);
        out.push_back((float(to.g) - float(from.g)) / 255.0f);
        out.push_back((float(to.b) - float(from.b)) / 255.0f);
        out.push_back((float(to.a) - float(from.a)) / 255.0f);
    }
};

// ─── Geometry ───────────────────────────────────────────────────────────────

template <>
struct Animate<Point>
{
    static constexpr size_t components() { return 2; }

    static void apply(Point& value, DeltaCursor& deltas)
    {
        value.x += deltas.next();
        value.y += deltas.next();
    }

    static void lerp(Point& value, const Point& start, const Point& end, float t)
    {
        value.x = detail::lerp_scalar(start.x, end.x, t);
        value.y = detail::lerp_scalar(start.y, end.y, t);
    }

    static void distance(const Point& from, const Point& to, std::vector<float>& out)
    {
        out.push_back(to.x - from.x);
        out.push_back(to.y - from.y);
    }
};

// width, height. Applying deltas never produces a negative extent.
template <>
struct Animate<Size>
{
    static constexpr size_t components() { return 2; }

    static void apply(Size& value, DeltaCursor& deltas)
    {
        value.width  = std::max(0.0f, value.width + deltas.next());
        value.height = std::max(0.0f, value.height + deltas.next());
    }

    static void lerp(Size& value, const Size& start, const Size& end, float t)
    {
        value.width  = detail::lerp_scalar(start.width, end.width, t);
        value.height = detail::lerp_scalar(start.height, end.height, t);
    }

    static void distance(const Size& from, const Size& to, std::vector<float>& out)
    {
        out.push_back(to.width - from.width);
        out.push_back(to.height - from.height);
    }
};

// x, y, w, h
template <>
struct Animate<Rect>
{
    static constexpr size_t components() { return 4; }

    static void apply(Rect& value, DeltaCursor& deltas)
    {
        value.x += deltas.next();
        value.y += deltas.next();
        value.w = std::max(0.0f, value.w + deltas.next());
        value.h = std::max(0.0f, value.h + deltas.next());
    }

    static void lerp(Rect& value, const Rect& start, const Rect& end, float t)
    {
        value.x = detail::lerp_scalar(start.x, end.x, t);
        value.y = detail::lerp_scalar(start.y, end.y, t);
        value.w = detail::lerp_scalar(start.w, end.w, t);
        value.h = detail::lerp_scalar(start.h, end.h, t);
    }

    static void distance(const Rect& from, const Rect& to, std::vector<float>& out)
    {
        out.push_back(to.x - from.x);
        out.push_back(to.y - from.y);
        out.push_back(to.w - from.w);
        out.push_back(to.h - from.h);
    }
};

// ─── Containers ─────────────────────────────────────────────────────────────

// Elements in index order.
template <typename T, size_t N>
struct Animate<std::array<T, N>>
{
    static constexpr size_t components() { return Animate<T>::components() * N; }

    static void apply(std::array<T, N>& value, DeltaCursor& deltas)
    {
        for (auto& item : value)
            Animate<T>::apply(item, deltas);
    }

    static void lerp(std::array<T, N>&       value,
                     const std::array<T, N>& start,
                     const std::array<T, N>& end,
                     float                   t)
    {
        for (size_t i = 0; i < N; ++i)
            Animate<T>::lerp(value[i], start[i], end[i], t);
    }

    static void distance(const std::array<T, N>& from,
                         const std::array<T, N>& to,
                         std::vector<float>&     out)
    {
        for (size_t i = 0; i < N; ++i)
            Animate<T>::distance(from[i], to[i], out);
    }
};

// first, then second.
template <typename A, typename B>
struct Animate<std::pair<A, B>>
{
    static constexpr size_t components()
    {
        return Animate<A>::components() + Animate<B>::components();
    }

    static void apply(std::pair<A, B>& value, DeltaCursor& deltas)
    {
        Animate<A>::apply(value.first, deltas);
        Animate<B>::apply(value.second, deltas);
    }

    static void lerp(std::pair<A, B>&       value,
                     const std::pair<A, B>& start,
                     const std::pair<A, B>& end,
                     float                  t)
    {
        Animate<A>::lerp(value.first, start.first, end.first, t);
        Animate<B>::lerp(value.second, start.second, end.second, t);
    }

    static void distance(const std::pair<A, B>& from,
                         const std::pair<A, B>& to,
                         std::vector<float>&    out)
    {
        Animate<A>::distance(from.first, to.first, out);
        Animate<B>::distance(from.second, to.second, out);
    }
};

// Elements in declaration order.
template <typename... Ts>
struct Animate<std::tuple<Ts...>>
{
    static constexpr size_t components() { return (Animate<Ts>::components() + ... + 0); }

    static void apply(std::tuple<Ts...>& value, DeltaCursor& deltas)
    {
        std::apply([&](auto&... items) { (apply_one(items, deltas), ...); }, value);
    }

    static void lerp(std::tuple<Ts...>&       value,
                     const std::tuple<Ts...>& start,
                     const std::tuple<Ts...>& end,
                     float                    t)
    {
        lerp_each(value, start, end, t, std::index_sequence_for<Ts...>{});
    }

    static void distance(const std::tuple<Ts...>& from,
                         const std::tuple<Ts...>& to,
                         std::vector<float>&      out)
    {
        distance_each(from, to, out, std::index_sequence_for<Ts...>{});
    }

   private:
    template <typename U>
    static void apply_one(U& item, DeltaCursor& deltas)
    {
        Animate<U>::apply(item, deltas);
    }

    template <size_t... I>
    static void lerp_each(std::tuple<Ts...>&       value,
                          const std::tuple<Ts...>& start,
                          const std::tuple<Ts...>& end,
                          float                    t,
                          std::index_sequence<I...>)
    {
        (Animate<Ts>::lerp(std::get<I>(value), std::get<I>(start), std::get<I>(end), t), ...);
    }

    template <size_t... I>
    static void distance_each(const std::tuple<Ts...>& from,
                              const std::tuple<Ts...>& to,
                              std::vector<float>&      out,
                              std::index_sequence<I...>)
    {
        (Animate<Ts>::distance(std::get<I>(from), std::get<I>(to), out), ...);
    }
};

// An empty optional still owns its component slots. Blending between an
// engaged and an empty optional is discrete: start below t = 0.5, end from
// there on.
template <typename T>
struct Animate<std::optional<T>>
{
    static constexpr size_t components() { return Animate<T>::components(); }

    static void apply(std::optional<T>& value, DeltaCursor& deltas)
    {
        if (value)
            Animate<T>::apply(*value, deltas);
        else
            deltas.skip(Animate<T>::components());
    }

    static void lerp(std::optional<T>&       value,
                     const std::optional<T>& start,
                     const std::optional<T>& end,
                     float                   t)
    {
        if (start && end)
        {
            if (!value)
                value.emplace(*start);
            Animate<T>::lerp(*value, *start, *end, t);
        }
        else
        {
            value = t < 0.5f ? start : end;
        }
    }

    static void distance(const std::optional<T>& from,
                         const std::optional<T>& to,
                         std::vector<float>&     out)
    {
        if (from && to)
            Animate<T>::distance(*from, *to, out);
        else
            out.insert(out.end(), Animate<T>::components(), 0.0f);
    }
};

}   // namespace glide
