#pragma once

#include <cstdint>
#include <glide/animate.hpp>
#include <glide/color.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace glide::highlight
{

enum class FontStyle : uint8_t
{
    None      = 0,
    Bold      = 1 << 0,
    Underline = 1 << 1,
    Italic    = 1 << 2,
};

constexpr FontStyle operator|(FontStyle a, FontStyle b)
{
    return static_cast<FontStyle>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

constexpr FontStyle operator&(FontStyle a, FontStyle b)
{
    return static_cast<FontStyle>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

constexpr bool has_flag(FontStyle style, FontStyle flag)
{
    return (style & flag) == flag && flag != FontStyle::None;
}

// Comma-separated list of scope prefixes, e.g. "comment, string.quoted".
// A prefix matches a scope when it equals the scope or is followed by a dot
// in it ("string" matches "string.quoted.double").
class ScopeSelector
{
   public:
    ScopeSelector() = default;
    explicit ScopeSelector(std::string_view text);

    // Match score against a scope stack (outermost first), or nullopt.
    // Deeper stack positions and longer prefixes score higher.
    std::optional<size_t> match(const std::vector<std::string>& stack) const;

    const std::vector<std::string>& prefixes() const { return prefixes_; }
    std::string                     to_string() const;
    bool                            empty() const { return prefixes_.empty(); }

    bool operator==(const ScopeSelector& o) const { return prefixes_ == o.prefixes_; }
    bool operator!=(const ScopeSelector& o) const { return !(*this == o); }

   private:
    std::vector<std::string> prefixes_;
};

// Partial style: unset fields inherit from the surrounding style.
struct StyleModifier
{
    std::optional<Color8>    foreground;
    std::optional<Color8>    background;
    std::optional<FontStyle> font_style;

    // Fields set in other override fields set here.
    StyleModifier apply(const StyleModifier& other) const;

    bool operator==(const StyleModifier& o) const
    {
        return foreground == o.foreground && background == o.background
               && font_style == o.font_style;
    }
    bool operator!=(const StyleModifier& o) const { return !(*this == o); }
};

struct ThemeItem
{
    ScopeSelector scope;
    StyleModifier style;

    bool operator==(const ThemeItem& o) const { return scope == o.scope && style == o.style; }
    bool operator!=(const ThemeItem& o) const { return !(*this == o); }
};

// Editor-wide colors.
struct ThemeSettings
{
    std::optional<Color8> foreground;
    std::optional<Color8> background;
    std::optional<Color8> caret;
    std::optional<Color8> selection;
    std::optional<Color8> line_highlight;

    bool operator==(const ThemeSettings& o) const
    {
        return foreground == o.foreground && background == o.background && caret == o.caret
               && selection == o.selection && line_highlight == o.line_highlight;
    }
    bool operator!=(const ThemeSettings& o) const { return !(*this == o); }
};

// Scope items past this count are not animated.
inline constexpr size_t MAX_THEME_SCOPES = 150;

struct HighlightTheme
{
    std::optional<std::string> name;
    std::optional<std::string> author;
    ThemeSettings              settings;
    std::vector<ThemeItem>     scopes;

    bool operator==(const HighlightTheme& o) const
    {
        return name == o.name && author == o.author && settings == o.settings
               && scopes == o.scopes;
    }
    bool operator!=(const HighlightTheme& o) const { return !(*this == o); }
};

// ─── Built-in theme table ───────────────────────────────────────────────────

// Named collection of themes. defaults() is built once, on first use, and
// shared read-only afterwards.
class ThemeSet
{
   public:
    static const ThemeSet& defaults();

    void insert(std::string key, HighlightTheme theme);

    const HighlightTheme*    find(std::string_view key) const;
    std::vector<std::string> keys() const;
    size_t                   size() const { return themes_.size(); }

   private:
    std::vector<std::pair<std::string, HighlightTheme>> themes_;
};

// ─── Theme ──────────────────────────────────────────────────────────────────

// A named preset, or a custom theme shared between every holder.
class Theme
{
   public:
    enum class Preset
    {
        SolarizedDark,
        Base16Mocha,
        Base16Ocean,
        Base16Eighties,
        InspiredGitHub,
    };

    Theme(Preset preset) : data_(preset) {}
    explicit Theme(std::shared_ptr<const HighlightTheme> custom);

    static Theme custom(HighlightTheme theme);

    // Every preset, in declaration order.
    static const std::vector<Theme>& presets();

    bool                  is_custom() const { return data_.index() == 1; }
    std::optional<Preset> preset() const;

    // The resolved theme: the preset's table entry or the custom theme.
    const HighlightTheme& highlight_theme() const;

    // Display name ("Solarized Dark", "Mocha", ...). Custom themes use
    // their own name, or "" when unnamed.
    std::string to_string() const;

    // Key of a preset in ThemeSet::defaults().
    static std::string_view table_key(Preset preset);

    // Presets compare by tag, custom themes by content.
    bool operator==(const Theme& o) const;
    bool operator!=(const Theme& o) const { return !(*this == o); }

   private:
    std::variant<Preset, std::shared_ptr<const HighlightTheme>> data_;
};

}   // namespace glide::highlight

namespace glide
{

// ─── Animate specializations ────────────────────────────────────────────────

// foreground rgba, background rgba. The font style switches at t = 0.5.
template <>
struct Animate<highlight::StyleModifier>
{
    static constexpr size_t components() { return Animate<std::optional<Color8>>::components() * 2; }

    static void apply(highlight::StyleModifier& value, DeltaCursor& deltas);
    static void lerp(highlight::StyleModifier&       value,
                     const highlight::StyleModifier& start,
                     const highlight::StyleModifier& end,
                     float                           t);
    static void distance(const highlight::StyleModifier& from,
                         const highlight::StyleModifier& to,
                         std::vector<float>&             out);
};

// The style only; the selector is never blended.
template <>
struct Animate<highlight::ThemeItem>
{
    static constexpr size_t components()
    {
        return Animate<highlight::StyleModifier>::components();
    }

    static void apply(highlight::ThemeItem& value, DeltaCursor& deltas);
    static void lerp(highlight::ThemeItem&       value,
                     const highlight::ThemeItem& start,
                     const highlight::ThemeItem& end,
                     float                       t);
    static void distance(const highlight::ThemeItem& from,
                         const highlight::ThemeItem& to,
                         std::vector<float>&         out);
};

// foreground, background, caret, selection, line_highlight.
template <>
struct Animate<highlight::ThemeSettings>
{
    static constexpr size_t components() { return Animate<std::optional<Color8>>::components() * 5; }

    static void apply(highlight::ThemeSettings& value, DeltaCursor& deltas);
    static void lerp(highlight::ThemeSettings&       value,
                     const highlight::ThemeSettings& start,
                     const highlight::ThemeSettings& end,
                     float                           t);
    static void distance(const highlight::ThemeSettings& from,
                         const highlight::ThemeSettings& to,
                         std::vector<float>&             out);
};

// settings, then MAX_THEME_SCOPES scope items.
//
// Themes with fewer items skip the unused slots when deltas are applied, and
// items past the cap are left alone. distance() pairs items by index over
// the shorter list and zero-fills the rest. lerp() keeps the start theme's
// names, selectors and item count and blends the items both themes have;
// a Transition lands on the exact target theme when it completes.
template <>
struct Animate<highlight::HighlightTheme>
{
    static constexpr size_t components()
    {
        return Animate<highlight::ThemeSettings>::components()
               + Animate<highlight::ThemeItem>::components() * highlight::MAX_THEME_SCOPES;
    }

    static void apply(highlight::HighlightTheme& value, DeltaCursor& deltas);
    static void lerp(highlight::HighlightTheme&       value,
                     const highlight::HighlightTheme& start,
                     const highlight::HighlightTheme& end,
                     float                            t);
    static void distance(const highlight::HighlightTheme& from,
                         const highlight::HighlightTheme& to,
                         std::vector<float>&              out);
};

// Blends the resolved themes. Intermediate values are custom themes; the
// endpoints (t <= 0, t >= 1, or equal start and end) are kept as they are,
// so presets stay presets.
template <>
struct Animate<highlight::Theme>
{
    static constexpr size_t components()
    {
        return Animate<highlight::HighlightTheme>::components();
    }

    static void apply(highlight::Theme& value, DeltaCursor& deltas);
    static void lerp(highlight::Theme&       value,
                     const highlight::Theme& start,
                     const highlight::Theme& end,
                     float                   t);
    static void distance(const highlight::Theme& from,
                         const highlight::Theme& to,
                         std::vector<float>&     out);
};

}   // namespace glide
