// Highlights a snippet while cross-fading between two editor themes and
// prints the keyword color at each step as a 24-bit ANSI escape.

#include <chrono>
#include <cstdio>
#include <glide/highlight/highlighter.hpp>
#include <glide/logger.hpp>
#include <glide/transition.hpp>
#include <string>
#include <vector>

using namespace glide;
using namespace glide::highlight;
using namespace std::chrono_literals;

namespace
{

void print_line(const std::string& line, const std::vector<HighlightSpan>& spans)
{
    for (const auto& span : spans)
    {
        auto color = span.highlight.style().foreground;
        auto text  = line.substr(span.begin, span.end - span.begin);
        if (color)
            std::printf("\033[38;2;%d;%d;%dm%s\033[0m", color->r, color->g, color->b, text.c_str());
        else
            std::printf("%s", text.c_str());
    }
    std::printf("\n");
}

}   // anonymous namespace

int main()
{
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    const std::vector<std::string> source = {
        "/* blended theme */",
        "int main() {",
        "    return answer(42); // done",
        "}",
    };

    Instant now   = Clock::now();
    auto    theme = Transition<Theme>(Theme::Preset::SolarizedDark, now)
                     .with_easing(easings::ease_in_out.with_duration(400ms));
    theme.update(Event<Theme>::target(Theme::Preset::InspiredGitHub, now));

    Highlighter highlighter({theme.value(), "cpp"});

    for (int step = 0; step <= 5; ++step)
    {
        highlighter.update({theme.value(), "cpp"});
        std::printf("── %s (%.0f%%) ──\n",
                    theme.value().is_custom() ? "blend" : theme.value().to_string().c_str(),
                    theme.progress().value() * 100.0f);
        for (const auto& line : source)
            print_line(line, highlighter.highlight_line(line));

        now += 80ms;
        theme.update(Event<Theme>::tick(now));
    }

    GLIDE_LOG_INFO("example", "Final theme: {}", theme.value().to_string());
    return 0;
}
