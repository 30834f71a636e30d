#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <glide/curve.hpp>
#include <sstream>

namespace glide
{

Curve Curve::cubic_bezier(float x1, float y1, float x2, float y2)
{
    return Curve(Kind::CubicBezier,
                 ease::CubicBezier{std::clamp(x1, 0.0f, 1.0f), y1, std::clamp(x2, 0.0f, 1.0f), y2});
}

float Curve::value(float t) const
{
    if (!(t > 0.0f))
        return 0.0f;
    if (t >= 1.0f)
        return 1.0f;

    if (kind_ == Kind::Linear)
        return t;
    // Control points with y outside [0,1] would overshoot.
    return std::clamp(bezier_(t), 0.0f, 1.0f);
}

std::string Curve::name() const
{
    switch (kind_)
    {
        case Kind::Linear:
            return "linear";
        case Kind::Ease:
            return "ease";
        case Kind::EaseIn:
            return "ease-in";
        case Kind::EaseOut:
            return "ease-out";
        case Kind::EaseInOut:
            return "ease-in-out";
        case Kind::CubicBezier:
        {
            std::ostringstream os;
            os << "cubic-bezier(" << bezier_.x1 << ", " << bezier_.y1 << ", " << bezier_.x2
               << ", " << bezier_.y2 << ")";
            return os.str();
        }
    }
    return "linear";
}

// ─── Parsing ────────────────────────────────────────────────────────────────

namespace
{

std::string normalize(std::string_view name)
{
    std::string out;
    out.reserve(name.size());
    for (char c : name)
    {
        if (std::isspace(static_cast<unsigned char>(c)))
            continue;
        out += c == '_' ? '-' : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// Parses "x1,y1,x2,y2" into four floats.
bool parse_control_points(const std::string& args, float out[4])
{
    const char* p = args.c_str();
    for (int i = 0; i < 4; ++i)
    {
        char* end = nullptr;
        out[i]    = std::strtof(p, &end);
        if (end == p)
            return false;
        p = end;
        if (i < 3)
        {
            if (*p != ',')
                return false;
            ++p;
        }
    }
    return *p == '\0';
}

}   // anonymous namespace

std::optional<Curve> Curve::from_name(std::string_view name)
{
    std::string n = normalize(name);

    if (n == "linear")
        return linear();
    if (n == "ease")
        return ease();
    if (n == "ease-in")
        return ease_in();
    if (n == "ease-out")
        return ease_out();
    if (n == "ease-in-out")
        return ease_in_out();

    const std::string prefix = "cubic-bezier(";
    if (n.size() > prefix.size() + 1 && n.compare(0, prefix.size(), prefix) == 0
        && n.back() == ')')
    {
        float pts[4];
        if (parse_control_points(n.substr(prefix.size(), n.size() - prefix.size() - 1), pts))
            return cubic_bezier(pts[0], pts[1], pts[2], pts[3]);
    }
    return std::nullopt;
}

}   // namespace glide
