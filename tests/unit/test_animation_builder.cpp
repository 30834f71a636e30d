#include <chrono>
#include <gtest/gtest.h>
#include <glide/glide.hpp>
#include <string>

using namespace glide;
using namespace std::chrono_literals;

static const Instant T0 = Instant{} + 1000s;

// Builders read the process-wide settings; keep them at defaults.
class AnimationBuilderTest : public ::testing::Test
{
   protected:
    void SetUp() override { AnimationSettings::global().reset(); }
    void TearDown() override { AnimationSettings::global().reset(); }

    static std::string label(const float& width) { return "box:" + std::to_string(int(width)); }
};

TEST_F(AnimationBuilderTest, BuildsFromCurrentValue)
{
    AnimationBuilder<float, std::string> b(50.0f, label, easings::linear, T0);
    EXPECT_EQ(b.build(), "box:50");
    EXPECT_FALSE(b.is_animating());
}

TEST_F(AnimationBuilderTest, DefaultEasingComesFromSettings)
{
    AnimationSettings::global().set_default_easing(easings::ease_out.quick());
    AnimationBuilder<float, std::string> b(0.0f, label, T0);
    EXPECT_EQ(b.easing(), easings::ease_out.quick());
    EXPECT_EQ(b.transition().duration(), Duration(200ms));
}

TEST_F(AnimationBuilderTest, AnimatesTowardNewValue)
{
    AnimationBuilder<float, std::string> b(0.0f, label, easings::linear, T0);
    b.set_value(100.0f, T0);
    EXPECT_TRUE(b.is_animating());

    EXPECT_TRUE(b.on_frame(T0 + 250ms));
    EXPECT_FLOAT_EQ(b.value(), 50.0f);
    EXPECT_EQ(b.build(), "box:50");

    EXPECT_FALSE(b.on_frame(T0 + 500ms));
    EXPECT_EQ(b.value(), 100.0f);
}

TEST_F(AnimationBuilderTest, ReversibleEasingReverses)
{
    AnimationBuilder<float, std::string> b(
        0.0f, label, easings::linear.with_reversible(true), T0);
    b.set_value(100.0f, T0);
    b.on_frame(T0 + 250ms);
    b.set_value(0.0f, T0 + 250ms);
    EXPECT_TRUE(b.transition().progress().is_reverse());
    EXPECT_FALSE(b.on_frame(T0 + 500ms));
    EXPECT_EQ(b.value(), 0.0f);
}

TEST_F(AnimationBuilderTest, NonReversibleEasingRestarts)
{
    AnimationBuilder<float, std::string> b(0.0f, label, easings::linear, T0);
    b.set_value(100.0f, T0);
    b.on_frame(T0 + 250ms);
    b.set_value(0.0f, T0 + 250ms);
    EXPECT_TRUE(b.transition().progress().is_forward());
    EXPECT_FLOAT_EQ(b.transition().initial(), 50.0f);
}

TEST_F(AnimationBuilderTest, DisabledAnimationsApplyImmediately)
{
    AnimationSettings::global().set_animations_enabled(false);
    AnimationBuilder<float, std::string> b(0.0f, label, easings::linear, T0);
    b.set_value(80.0f, T0);
    EXPECT_FALSE(b.is_animating());
    EXPECT_EQ(b.build(), "box:80");
}

TEST_F(AnimationBuilderTest, DurationScaleStretchesAnimation)
{
    AnimationSettings::global().set_duration_scale(2.0f);
    AnimationBuilder<float, std::string> b(0.0f, label, easings::linear, T0);
    b.set_value(100.0f, T0);
    b.on_frame(T0 + 250ms);
    EXPECT_FLOAT_EQ(b.value(), 25.0f);
}

TEST_F(AnimationBuilderTest, SettingsChangeAppliesToNextValue)
{
    AnimationBuilder<float, std::string> b(0.0f, label, easings::linear, T0);
    AnimationSettings::global().set_animations_enabled(false);
    b.set_value(10.0f, T0);
    EXPECT_FALSE(b.is_animating());
    EXPECT_EQ(b.value(), 10.0f);
}

TEST_F(AnimationBuilderTest, SettleJumpsToEnd)
{
    AnimationBuilder<float, std::string> b(0.0f, label, easings::linear, T0);
    b.set_value(42.0f, T0);
    b.settle();
    EXPECT_FALSE(b.is_animating());
    EXPECT_EQ(b.value(), 42.0f);
}

TEST_F(AnimationBuilderTest, LayoutHint)
{
    AnimationBuilder<Size, std::string> b(
        Size{10.0f, 10.0f},
        [](const Size& s) { return std::to_string(int(s.width)); },
        easings::linear,
        T0);
    EXPECT_FALSE(b.is_layout_animated());
    b.animates_layout(true);
    EXPECT_TRUE(b.is_layout_animated());
}

TEST_F(AnimationBuilderTest, WithEasingUpdatesTransition)
{
    AnimationBuilder<float, std::string> b(0.0f, label, easings::linear, T0);
    b.with_easing(easings::ease_in.very_quick());
    EXPECT_EQ(b.transition().curve(), Curve::ease_in());
    EXPECT_EQ(b.transition().duration(), Duration(100ms));
}
