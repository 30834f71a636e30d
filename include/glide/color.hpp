#pragma once

#include <cstdint>

namespace glide
{

// Linear RGBA, channels nominally in [0,1]. Used for animated UI colors.
struct Color
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float r_, float g_, float b_, float a_ = 1.0f) : r(r_), g(g_), b(b_), a(a_) {}

    constexpr bool operator==(const Color& o) const
    {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
    constexpr bool operator!=(const Color& o) const { return !(*this == o); }
};

// 8 bits per channel, the storage format of highlight themes.
struct Color8
{
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    constexpr Color8() = default;
    constexpr Color8(uint8_t r_, uint8_t g_, uint8_t b_, uint8_t a_ = 255)
        : r(r_), g(g_), b(b_), a(a_)
    {
    }

    // 0xRRGGBB, or 0xRRGGBBAA when has_alpha is set.
    static constexpr Color8 from_hex(uint32_t hex, bool has_alpha = false)
    {
        if (!has_alpha)
            hex = (hex << 8) | 0xFFu;
        return Color8(uint8_t(hex >> 24), uint8_t(hex >> 16), uint8_t(hex >> 8), uint8_t(hex));
    }

    constexpr Color to_color() const
    {
        return Color(r / 255.0f, g / 255.0f, b / 255.0f, a / 255.0f);
    }

    constexpr bool operator==(const Color8& o) const
    {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
    constexpr bool operator!=(const Color8& o) const { return !(*this == o); }
};

namespace colors
{
inline constexpr Color transparent{0.0f, 0.0f, 0.0f, 0.0f};
inline constexpr Color black{0.0f, 0.0f, 0.0f};
inline constexpr Color white{1.0f, 1.0f, 1.0f};
inline constexpr Color red{1.0f, 0.0f, 0.0f};
inline constexpr Color green{0.0f, 1.0f, 0.0f};
inline constexpr Color blue{0.0f, 0.0f, 1.0f};
}   // namespace colors

}   // namespace glide
