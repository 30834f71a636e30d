#include <cmath>
#include <gtest/gtest.h>
#include <glide/bezier.hpp>
#include <glide/curve.hpp>

using namespace glide;

// Every curve must satisfy: f(0) == 0, f(1) == 1, exactly.

static const Curve ALL_CURVES[] = {
    Curve::linear(),
    Curve::ease(),
    Curve::ease_in(),
    Curve::ease_out(),
    Curve::ease_in_out(),
    Curve::cubic_bezier(0.68f, -0.55f, 0.27f, 1.55f),
};

TEST(Curve, ExactEndpoints)
{
    for (const auto& c : ALL_CURVES)
    {
        EXPECT_EQ(c.value(0.0f), 0.0f) << c.name();
        EXPECT_EQ(c.value(1.0f), 1.0f) << c.name();
    }
}

TEST(Curve, OutOfRangeInputClamps)
{
    for (const auto& c : ALL_CURVES)
    {
        EXPECT_EQ(c.value(-0.5f), 0.0f) << c.name();
        EXPECT_EQ(c.value(3.0f), 1.0f) << c.name();
        EXPECT_EQ(c.value(NAN), 0.0f) << c.name();
    }
}

TEST(Curve, LinearIsIdentity)
{
    for (float t = 0.0f; t <= 1.0f; t += 0.125f)
        EXPECT_FLOAT_EQ(Curve::linear().value(t), t);
}

TEST(Curve, CssPresetsStayInUnitRange)
{
    for (const auto& c :
         {Curve::ease(), Curve::ease_in(), Curve::ease_out(), Curve::ease_in_out()})
    {
        for (float t = 0.0f; t <= 1.0f; t += 0.01f)
        {
            float v = c.value(t);
            EXPECT_GE(v, -1e-5f) << c.name() << " at t=" << t;
            EXPECT_LE(v, 1.0f + 1e-5f) << c.name() << " at t=" << t;
        }
    }
}

TEST(Curve, CssPresetsAreMonotonic)
{
    for (const auto& c :
         {Curve::ease(), Curve::ease_in(), Curve::ease_out(), Curve::ease_in_out()})
    {
        float prev = 0.0f;
        for (float t = 0.01f; t <= 1.0f; t += 0.01f)
        {
            float v = c.value(t);
            EXPECT_GE(v, prev - 1e-5f) << c.name() << " at t=" << t;
            prev = v;
        }
    }
}

TEST(Curve, EaseInSlowerStartEaseOutFasterStart)
{
    EXPECT_LT(Curve::ease_in().value(0.25f), 0.25f);
    EXPECT_GT(Curve::ease_out().value(0.25f), 0.25f);
}

TEST(Curve, EaseInOutSymmetry)
{
    // Control points (0.42,0) (0.58,1) are point-symmetric about (0.5,0.5)
    for (float t = 0.05f; t < 1.0f; t += 0.1f)
    {
        float sum = Curve::ease_in_out().value(t) + Curve::ease_in_out().value(1.0f - t);
        EXPECT_NEAR(sum, 1.0f, 1e-4f) << "at t=" << t;
    }
    EXPECT_NEAR(Curve::ease_in_out().value(0.5f), 0.5f, 1e-4f);
}

TEST(Curve, EaseReferenceValues)
{
    // Reference values from the CSS "ease" timing function
    EXPECT_NEAR(Curve::ease().value(0.25f), 0.4094f, 2e-3f);
    EXPECT_NEAR(Curve::ease().value(0.5f), 0.8024f, 2e-3f);
}

TEST(Curve, CubicBezierClampsX)
{
    Curve c = Curve::cubic_bezier(-1.0f, 0.5f, 2.0f, 0.5f);
    EXPECT_FLOAT_EQ(c.control_points().x1, 0.0f);
    EXPECT_FLOAT_EQ(c.control_points().x2, 1.0f);
    EXPECT_FLOAT_EQ(c.control_points().y1, 0.5f);
}

TEST(Curve, CubicBezierOutputStaysInUnitRange)
{
    Curve back = Curve::cubic_bezier(0.3f, 2.0f, 0.7f, 2.0f);
    for (float t = 0.0f; t <= 1.0f; t += 0.05f)
    {
        float v = back.value(t);
        EXPECT_GE(v, 0.0f) << t;
        EXPECT_LE(v, 1.0f) << t;
    }
    EXPECT_FLOAT_EQ(back.value(0.5f), 1.0f);

    Curve anticipate = Curve::cubic_bezier(0.3f, -1.0f, 0.7f, -1.0f);
    EXPECT_FLOAT_EQ(anticipate.value(0.5f), 0.0f);
}

TEST(Curve, CubicBezierMatchingPresetPoints)
{
    Curve custom = Curve::cubic_bezier(0.25f, 0.1f, 0.25f, 1.0f);
    for (float t = 0.1f; t < 1.0f; t += 0.1f)
        EXPECT_FLOAT_EQ(custom.value(t), Curve::ease().value(t));
    EXPECT_NE(custom, Curve::ease());
}

// ─── Names ──────────────────────────────────────────────────────────────────

TEST(CurveName, FromNameKeywords)
{
    EXPECT_EQ(Curve::from_name("linear"), Curve::linear());
    EXPECT_EQ(Curve::from_name("ease"), Curve::ease());
    EXPECT_EQ(Curve::from_name("ease-in"), Curve::ease_in());
    EXPECT_EQ(Curve::from_name("EASE_OUT"), Curve::ease_out());
    EXPECT_EQ(Curve::from_name("ease-in-out"), Curve::ease_in_out());
}

TEST(CurveName, FromNameCubicBezier)
{
    auto c = Curve::from_name("cubic-bezier(0.1, 0.2, 0.3, 0.4)");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->kind(), Curve::Kind::CubicBezier);
    EXPECT_FLOAT_EQ(c->control_points().x1, 0.1f);
    EXPECT_FLOAT_EQ(c->control_points().y2, 0.4f);
}

TEST(CurveName, FromNameRejectsGarbage)
{
    EXPECT_FALSE(Curve::from_name("").has_value());
    EXPECT_FALSE(Curve::from_name("bounce").has_value());
    EXPECT_FALSE(Curve::from_name("cubic-bezier(1,2,3)").has_value());
    EXPECT_FALSE(Curve::from_name("cubic-bezier(a,b,c,d)").has_value());
}

TEST(CurveName, NameRoundTrips)
{
    for (const auto& c : ALL_CURVES)
    {
        auto parsed = Curve::from_name(c.name());
        ASSERT_TRUE(parsed.has_value()) << c.name();
        EXPECT_EQ(parsed->kind(), c.kind());
    }
}

// ─── Bezier solver ──────────────────────────────────────────────────────────

TEST(CubicBezier, SolveInvertsSampleX)
{
    const ease::CubicBezier& b = ease::css_ease_in_out;
    for (float u = 0.05f; u < 1.0f; u += 0.1f)
    {
        float x = b.sample_x(u);
        EXPECT_NEAR(b.solve_u(x), u, 1e-4f) << "at u=" << u;
    }
}

TEST(CubicBezier, FlatDerivativeFallsBackToBisection)
{
    // x'(0) == 0 for these points, so Newton stalls near the start
    ease::CubicBezier b{0.0f, 0.0f, 1.0f, 1.0f};
    float             x = 0.001f;
    EXPECT_NEAR(b.sample_x(b.solve_u(x)), x, 1e-4f);
}

TEST(CubicBezier, LinearControlPointsGiveIdentity)
{
    ease::CubicBezier b{1.0f / 3.0f, 1.0f / 3.0f, 2.0f / 3.0f, 2.0f / 3.0f};
    for (float t = 0.1f; t < 1.0f; t += 0.1f)
        EXPECT_NEAR(b(t), t, 1e-4f);
}
