#include <chrono>
#include <gtest/gtest.h>
#include <glide/animation_driver.hpp>
#include <string>
#include <vector>

using namespace glide;
using namespace std::chrono_literals;

static const Instant T0 = Instant{} + 1000s;

TEST(AnimationDriver, EmptyDriverIsIdle)
{
    AnimationDriver d;
    EXPECT_FALSE(d.tick(T0));
    EXPECT_FALSE(d.has_active_animations());
    EXPECT_EQ(d.size(), 0u);
}

TEST(AnimationDriver, TicksAttachedTransitions)
{
    Transition<float> width(0.0f, T0);
    Transition<Color> fill(colors::black, T0);

    AnimationDriver d;
    d.attach("width", width);
    d.attach("fill", fill);
    EXPECT_EQ(d.size(), 2u);
    EXPECT_EQ(d.active_count(), 0u);

    width.interrupt(100.0f, T0);
    fill.interrupt(colors::white, T0);
    EXPECT_EQ(d.active_count(), 2u);

    EXPECT_TRUE(d.tick(T0 + 250ms));
    EXPECT_FLOAT_EQ(width.value(), 50.0f);
    EXPECT_FLOAT_EQ(fill.value().r, 0.5f);

    EXPECT_FALSE(d.tick(T0 + 500ms));
    EXPECT_EQ(width.value(), 100.0f);
    EXPECT_EQ(fill.value(), colors::white);
}

TEST(AnimationDriver, RunsInAttachmentOrder)
{
    std::vector<std::string> order;
    AnimationDriver          d;
    for (const char* name : {"a", "b", "c"})
    {
        d.attach(
            name,
            [&order, name](Instant) { order.push_back(name); },
            [] {},
            [] { return true; });
    }

    d.tick(T0);
    EXPECT_EQ(order, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(d.names(), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(AnimationDriver, SkipsInactiveEntries)
{
    int             ticks = 0;
    AnimationDriver d;
    d.attach(
        "idle", [&](Instant) { ++ticks; }, [] {}, [] { return false; });
    EXPECT_FALSE(d.tick(T0));
    EXPECT_EQ(ticks, 0);
}

TEST(AnimationDriver, SettleAll)
{
    Transition<float> a(0.0f, T0);
    Transition<float> b(0.0f, T0);
    AnimationDriver   d;
    d.attach("a", a);
    d.attach("b", b);

    a.interrupt(1.0f, T0);
    b.interrupt(-1.0f, T0);
    d.settle_all();

    EXPECT_FALSE(d.has_active_animations());
    EXPECT_EQ(a.value(), 1.0f);
    EXPECT_EQ(b.value(), -1.0f);
}

TEST(AnimationDriver, DetachStopsTicking)
{
    Transition<float> a(0.0f, T0);
    AnimationDriver   d;
    auto              id = d.attach("a", a);

    a.interrupt(100.0f, T0);
    EXPECT_TRUE(d.detach(id));
    EXPECT_FALSE(d.tick(T0 + 250ms));
    EXPECT_FLOAT_EQ(a.value(), 0.0f);

    EXPECT_FALSE(d.detach(id));
}

TEST(AnimationDriver, IdsAreUnique)
{
    AnimationDriver d;
    auto            first  = d.attach("x", [](Instant) {}, [] {}, [] { return false; });
    auto            second = d.attach("x", [](Instant) {}, [] {}, [] { return false; });
    EXPECT_NE(first, second);

    d.clear();
    EXPECT_EQ(d.size(), 0u);
}
