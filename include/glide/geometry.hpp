#pragma once

namespace glide
{

struct Point
{
    float x = 0.0f;
    float y = 0.0f;

    constexpr bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Point& o) const { return !(*this == o); }
};

// Widget extent. Never negative once animated.
struct Size
{
    float width  = 0.0f;
    float height = 0.0f;

    constexpr bool operator==(const Size& o) const { return width == o.width && height == o.height; }
    constexpr bool operator!=(const Size& o) const { return !(*this == o); }
};

struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    constexpr Point position() const { return {x, y}; }
    constexpr Size  size() const { return {w, h}; }

    constexpr bool operator==(const Rect& o) const
    {
        return x == o.x && y == o.y && w == o.w && h == o.h;
    }
    constexpr bool operator!=(const Rect& o) const { return !(*this == o); }
};

}   // namespace glide
