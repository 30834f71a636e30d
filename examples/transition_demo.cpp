// Console walk-through of a transition being retargeted mid-flight.

#include <chrono>
#include <cstdio>
#include <glide/animation_driver.hpp>
#include <glide/logger.hpp>
#include <glide/settings.hpp>
#include <glide/transition.hpp>

using namespace glide;
using namespace std::chrono_literals;

int main()
{
    Logger::instance().set_level(LogLevel::Trace);
    Logger::instance().add_sink(sinks::console_sink());

    AnimationSettings& settings = AnimationSettings::global();
    if (settings.load(AnimationSettings::default_path()))
        settings.apply_log_level();

    auto width = Transition<float>(50.0f).with_easing(
        settings.apply_to(easings::ease_in_out.with_reversible(true)));
    auto fill = Transition<Color>(colors::blue).with_easing(settings.apply_to(easings::linear));

    AnimationDriver driver;
    driver.attach("width", width);
    driver.attach("fill", fill);

    // Simulated 60 Hz frame clock
    Instant now = Clock::now();
    width.update(Event<float>::target(300.0f, now));
    fill.update(Event<Color>::target(colors::red, now));

    int frame = 0;
    while (driver.tick(now))
    {
        std::printf("frame %3d  width %7.2f  fill (%.2f, %.2f, %.2f)\n",
                    frame,
                    width.value(),
                    fill.value().r,
                    fill.value().g,
                    fill.value().b);

        // Halfway through, go back to where we started.
        if (frame == 12)
            width.update(Event<float>::target(50.0f, now));

        now += 16ms;
        ++frame;
    }

    GLIDE_LOG_INFO("example", "Settled after {} frames at width {}", frame, width.value());
    return 0;
}
