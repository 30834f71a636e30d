#include <algorithm>
#include <cctype>
#include <glide/highlight/theme.hpp>
#include <glide/logger.hpp>

namespace glide::highlight
{

// ─── ScopeSelector ──────────────────────────────────────────────────────────

namespace
{

std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

bool prefix_matches(std::string_view prefix, std::string_view scope)
{
    if (scope.size() < prefix.size() || scope.compare(0, prefix.size(), prefix) != 0)
        return false;
    return scope.size() == prefix.size() || scope[prefix.size()] == '.';
}

}   // anonymous namespace

ScopeSelector::ScopeSelector(std::string_view text)
{
    while (!text.empty())
    {
        auto             comma = text.find(',');
        std::string_view part  = trim(text.substr(0, comma));
        if (!part.empty())
            prefixes_.emplace_back(part);
        if (comma == std::string_view::npos)
            break;
        text.remove_prefix(comma + 1);
    }
}

std::optional<size_t> ScopeSelector::match(const std::vector<std::string>& stack) const
{
    std::optional<size_t> best;
    for (size_t depth = 0; depth < stack.size(); ++depth)
    {
        for (const auto& prefix : prefixes_)
        {
            if (!prefix_matches(prefix, stack[depth]))
                continue;
            size_t score = (depth + 1) * 1024 + std::min<size_t>(prefix.size(), 1023);
            if (!best || score > *best)
                best = score;
        }
    }
    return best;
}

std::string ScopeSelector::to_string() const
{
    std::string out;
    for (size_t i = 0; i < prefixes_.size(); ++i)
    {
        if (i > 0)
            out += ", ";
        out += prefixes_[i];
    }
    return out;
}

// ─── StyleModifier ──────────────────────────────────────────────────────────

StyleModifier StyleModifier::apply(const StyleModifier& other) const
{
    StyleModifier result = *this;
    if (other.foreground)
        result.foreground = other.foreground;
    if (other.background)
        result.background = other.background;
    if (other.font_style)
        result.font_style = other.font_style;
    return result;
}

// ─── ThemeSet ───────────────────────────────────────────────────────────────

void ThemeSet::insert(std::string key, HighlightTheme theme)
{
    for (auto& [k, t] : themes_)
    {
        if (k == key)
        {
            t = std::move(theme);
            return;
        }
    }
    themes_.emplace_back(std::move(key), std::move(theme));
}

const HighlightTheme* ThemeSet::find(std::string_view key) const
{
    for (const auto& [k, t] : themes_)
    {
        if (k == key)
            return &t;
    }
    return nullptr;
}

std::vector<std::string> ThemeSet::keys() const
{
    std::vector<std::string> out;
    out.reserve(themes_.size());
    for (const auto& entry : themes_)
        out.push_back(entry.first);
    return out;
}

// ─── Theme ──────────────────────────────────────────────────────────────────

Theme::Theme(std::shared_ptr<const HighlightTheme> custom) : data_(std::move(custom))
{
    if (!std::get<1>(data_))
        data_ = std::make_shared<const HighlightTheme>();
}

Theme Theme::custom(HighlightTheme theme)
{
    return Theme(std::make_shared<const HighlightTheme>(std::move(theme)));
}

const std::vector<Theme>& Theme::presets()
{
    static const std::vector<Theme> all = {
        Preset::SolarizedDark,
        Preset::Base16Mocha,
        Preset::Base16Ocean,
        Preset::Base16Eighties,
        Preset::InspiredGitHub,
    };
    return all;
}

std::optional<Theme::Preset> Theme::preset() const
{
    if (const auto* p = std::get_if<Preset>(&data_))
        return *p;
    return std::nullopt;
}

std::string_view Theme::table_key(Preset preset)
{
    switch (preset)
    {
        case Preset::SolarizedDark:
            return "Solarized (dark)";
        case Preset::Base16Mocha:
            return "base16-mocha.dark";
        case Preset::Base16Ocean:
            return "base16-ocean.dark";
        case Preset::Base16Eighties:
            return "base16-eighties.dark";
        case Preset::InspiredGitHub:
            return "InspiredGitHub";
    }
    return "";
}

const HighlightTheme& Theme::highlight_theme() const
{
    if (const auto* custom = std::get_if<1>(&data_))
        return **custom;

    auto key = table_key(std::get<Preset>(data_));
    if (const auto* theme = ThemeSet::defaults().find(key))
        return *theme;

    GLIDE_LOG_ERROR("highlight", "Built-in theme '{}' is missing", key);
    static const HighlightTheme fallback;
    return fallback;
}

std::string Theme::to_string() const
{
    if (const auto* custom = std::get_if<1>(&data_))
        return (*custom)->name.value_or("");

    switch (std::get<Preset>(data_))
    {
        case Preset::SolarizedDark:
            return "Solarized Dark";
        case Preset::Base16Mocha:
            return "Mocha";
        case Preset::Base16Ocean:
            return "Ocean";
        case Preset::Base16Eighties:
            return "Eighties";
        case Preset::InspiredGitHub:
            return "Inspired GitHub";
    }
    return "";
}

bool Theme::operator==(const Theme& o) const
{
    if (data_.index() != o.data_.index())
        return false;
    if (const auto* p = std::get_if<Preset>(&data_))
        return *p == std::get<Preset>(o.data_);

    const auto& a = std::get<1>(data_);
    const auto& b = std::get<1>(o.data_);
    return a == b || *a == *b;
}

}   // namespace glide::highlight

namespace glide
{

using highlight::HighlightTheme;
using highlight::StyleModifier;
using highlight::Theme;
using highlight::ThemeItem;
using highlight::ThemeSettings;

// ─── StyleModifier ──────────────────────────────────────────────────────────

void Animate<StyleModifier>::apply(StyleModifier& value, DeltaCursor& deltas)
{
    Animate<std::optional<Color8>>::apply(value.foreground, deltas);
    Animate<std::optional<Color8>>::apply(value.background, deltas);
}

void Animate<StyleModifier>::lerp(StyleModifier&       value,
                                  const StyleModifier& start,
                                  const StyleModifier& end,
                                  float                t)
{
    Animate<std::optional<Color8>>::lerp(value.foreground, start.foreground, end.foreground, t);
    Animate<std::optional<Color8>>::lerp(value.background, start.background, end.background, t);
    value.font_style = t < 0.5f ? start.font_style : end.font_style;
}

void Animate<StyleModifier>::distance(const StyleModifier& from,
                                      const StyleModifier& to,
                                      std::vector<float>&  out)
{
    Animate<std::optional<Color8>>::distance(from.foreground, to.foreground, out);
    Animate<std::optional<Color8>>::distance(from.background, to.background, out);
}

// ─── ThemeItem ──────────────────────────────────────────────────────────────

void Animate<ThemeItem>::apply(ThemeItem& value, DeltaCursor& deltas)
{
    Animate<StyleModifier>::apply(value.style, deltas);
}

void Animate<ThemeItem>::lerp(ThemeItem&       value,
                              const ThemeItem& start,
                              const ThemeItem& end,
                              float            t)
{
    value.scope = start.scope;
    Animate<StyleModifier>::lerp(value.style, start.style, end.style, t);
}

void Animate<ThemeItem>::distance(const ThemeItem&    from,
                                  const ThemeItem&    to,
                                  std::vector<float>& out)
{
    Animate<StyleModifier>::distance(from.style, to.style, out);
}

// ─── ThemeSettings ──────────────────────────────────────────────────────────

namespace
{

// Visits the settings colors in component order.
template <typename Settings, typename Fn>
void for_each_setting(Settings& s, Fn&& fn)
{
    fn(s.foreground);
    fn(s.background);
    fn(s.caret);
    fn(s.selection);
    fn(s.line_highlight);
}

}   // anonymous namespace

void Animate<ThemeSettings>::apply(ThemeSettings& value, DeltaCursor& deltas)
{
    for_each_setting(value,
                     [&](std::optional<Color8>& c)
                     { Animate<std::optional<Color8>>::apply(c, deltas); });
}

void Animate<ThemeSettings>::lerp(ThemeSettings&       value,
                                  const ThemeSettings& start,
                                  const ThemeSettings& end,
                                  float                t)
{
    using Opt = Animate<std::optional<Color8>>;
    Opt::lerp(value.foreground, start.foreground, end.foreground, t);
    Opt::lerp(value.background, start.background, end.background, t);
    Opt::lerp(value.caret, start.caret, end.caret, t);
    Opt::lerp(value.selection, start.selection, end.selection, t);
    Opt::lerp(value.line_highlight, start.line_highlight, end.line_highlight, t);
}

void Animate<ThemeSettings>::distance(const ThemeSettings& from,
                                      const ThemeSettings& to,
                                      std::vector<float>&  out)
{
    using Opt = Animate<std::optional<Color8>>;
    Opt::distance(from.foreground, to.foreground, out);
    Opt::distance(from.background, to.background, out);
    Opt::distance(from.caret, to.caret, out);
    Opt::distance(from.selection, to.selection, out);
    Opt::distance(from.line_highlight, to.line_highlight, out);
}

// ─── HighlightTheme ─────────────────────────────────────────────────────────

void Animate<HighlightTheme>::apply(HighlightTheme& value, DeltaCursor& deltas)
{
    Animate<ThemeSettings>::apply(value.settings, deltas);

    size_t live = std::min(value.scopes.size(), highlight::MAX_THEME_SCOPES);
    for (size_t i = 0; i < live; ++i)
        Animate<ThemeItem>::apply(value.scopes[i], deltas);

    deltas.skip((highlight::MAX_THEME_SCOPES - live) * Animate<ThemeItem>::components());
}

void Animate<HighlightTheme>::lerp(HighlightTheme&       value,
                                   const HighlightTheme& start,
                                   const HighlightTheme& end,
                                   float                 t)
{
    // value may alias start or end
    HighlightTheme result = start;
    Animate<ThemeSettings>::lerp(result.settings, start.settings, end.settings, t);

    size_t shared =
        std::min({start.scopes.size(), end.scopes.size(), highlight::MAX_THEME_SCOPES});
    for (size_t i = 0; i < shared; ++i)
        Animate<ThemeItem>::lerp(result.scopes[i], start.scopes[i], end.scopes[i], t);

    value = std::move(result);
}

void Animate<HighlightTheme>::distance(const HighlightTheme& from,
                                       const HighlightTheme& to,
                                       std::vector<float>&   out)
{
    Animate<ThemeSettings>::distance(from.settings, to.settings, out);

    size_t shared = std::min({from.scopes.size(), to.scopes.size(), highlight::MAX_THEME_SCOPES});
    for (size_t i = 0; i < shared; ++i)
        Animate<ThemeItem>::distance(from.scopes[i], to.scopes[i], out);

    out.insert(out.end(),
               (highlight::MAX_THEME_SCOPES - shared) * Animate<ThemeItem>::components(),
               0.0f);
}

// ─── Theme ──────────────────────────────────────────────────────────────────

void Animate<Theme>::apply(Theme& value, DeltaCursor& deltas)
{
    HighlightTheme theme = value.highlight_theme();
    Animate<HighlightTheme>::apply(theme, deltas);
    value = Theme::custom(std::move(theme));
}

void Animate<Theme>::lerp(Theme& value, const Theme& start, const Theme& end, float t)
{
    if (!(t > 0.0f) || start == end)
    {
        value = start;
        return;
    }
    if (t >= 1.0f)
    {
        value = end;
        return;
    }

    HighlightTheme blended;
    Animate<HighlightTheme>::lerp(blended, start.highlight_theme(), end.highlight_theme(), t);
    value = Theme::custom(std::move(blended));
}

void Animate<Theme>::distance(const Theme& from, const Theme& to, std::vector<float>& out)
{
    Animate<HighlightTheme>::distance(from.highlight_theme(), to.highlight_theme(), out);
}

}   // namespace glide
