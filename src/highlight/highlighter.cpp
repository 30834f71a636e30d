#include <algorithm>
#include <glide/highlight/highlighter.hpp>
#include <glide/logger.hpp>

namespace glide::highlight
{

// ─── Highlight ──────────────────────────────────────────────────────────────

std::optional<Color> Highlight::color() const
{
    if (!style_.foreground)
        return std::nullopt;
    return style_.foreground->to_color();
}

std::optional<Font> Highlight::font() const
{
    if (!style_.font_style)
        return std::nullopt;

    bool bold   = has_flag(*style_.font_style, FontStyle::Bold);
    bool italic = has_flag(*style_.font_style, FontStyle::Italic);
    if (!bold && !italic)
        return std::nullopt;

    Font font;
    font.weight = bold ? Font::Weight::Bold : Font::Weight::Normal;
    font.style  = italic ? Font::Style::Italic : Font::Style::Normal;
    return font;
}

// ─── Style resolution ───────────────────────────────────────────────────────

StyleModifier style_for_stack(const HighlightTheme& theme, const std::vector<std::string>& stack)
{
    std::vector<std::pair<size_t, const StyleModifier*>> matches;
    for (const auto& item : theme.scopes)
    {
        if (auto score = item.scope.match(stack))
            matches.emplace_back(*score, &item.style);
    }

    // Equal scores keep theme order, so later items win.
    std::stable_sort(matches.begin(),
                     matches.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    StyleModifier result;
    for (const auto& [score, style] : matches)
        result = result.apply(*style);
    return result;
}

// ─── Highlighter ────────────────────────────────────────────────────────────

Highlighter::Highlighter(const Settings& settings)
    : grammar_(&SyntaxSet::defaults().find_or_plain_text(settings.token)), theme_(settings.theme)
{
    caches_.emplace_back(ParseState(grammar_), ScopeStack());
    GLIDE_LOG_DEBUG("highlight",
                    "Highlighter for '{}' with theme '{}'",
                    grammar_->name(),
                    theme_.to_string());
}

void Highlighter::update(const Settings& settings)
{
    grammar_ = &SyntaxSet::defaults().find_or_plain_text(settings.token);
    theme_   = settings.theme;

    change_line(0);
}

void Highlighter::change_line(size_t line)
{
    size_t snapshot = line / LINES_PER_SNAPSHOT;

    if (snapshot <= caches_.size())
    {
        caches_.resize(snapshot);
        current_line_ = snapshot * LINES_PER_SNAPSHOT;
    }
    else
    {
        caches_.resize(1);
        current_line_ = 0;
    }

    Snapshot start =
        caches_.empty() ? Snapshot(ParseState(grammar_), ScopeStack()) : caches_.back();
    caches_.push_back(std::move(start));
}

std::vector<HighlightSpan> Highlighter::highlight_line(std::string_view line)
{
    if (current_line_ / LINES_PER_SNAPSHOT >= caches_.size())
    {
        Snapshot copy = caches_.back();
        caches_.push_back(std::move(copy));
    }

    ++current_line_;

    auto& [state, stack] = caches_.back();
    ScopeOps ops         = state.grammar->parse_line(line, state);

    const HighlightTheme&      theme = theme_.highlight_theme();
    std::vector<HighlightSpan> spans;

    // Range k runs from op k-1 to op k (line start and end at the ends) and
    // is styled by the stack after applying op k-1.
    size_t last = 0;
    for (size_t k = 0; k <= ops.size(); ++k)
    {
        size_t next = k == ops.size() ? line.size() : std::min(ops[k].first, line.size());
        if (k > 0)
            stack.apply(ops[k - 1].second);

        if (next > last)
            spans.push_back({last, next, Highlight(style_for_stack(theme, stack.scopes()))});
        last = std::max(last, next);
    }
    return spans;
}

}   // namespace glide::highlight
