#pragma once

#include <glide/color.hpp>
#include <glide/highlight/syntax.hpp>
#include <glide/highlight/theme.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace glide::highlight
{

struct Font
{
    enum class Weight
    {
        Normal,
        Bold,
    };
    enum class Style
    {
        Normal,
        Italic,
    };

    Weight weight = Weight::Normal;
    Style  style  = Style::Normal;

    bool operator==(const Font& o) const { return weight == o.weight && style == o.style; }
};

struct Format
{
    std::optional<Color> color;
    std::optional<Font>  font;
};

// Style of a highlighted range. Unset parts leave the editor's defaults
// untouched.
class Highlight
{
   public:
    Highlight() = default;
    explicit Highlight(StyleModifier style) : style_(style) {}

    std::optional<Color> color() const;

    // Set only when the style is bold or italic.
    std::optional<Font> font() const;

    Format to_format() const { return Format{color(), font()}; }

    const StyleModifier& style() const { return style_; }

   private:
    StyleModifier style_;
};

struct HighlightSpan
{
    size_t    begin = 0;   // byte offsets into the line
    size_t    end   = 0;
    Highlight highlight;
};

// Combined style of every theme item matching the stack, applied from the
// weakest match to the strongest.
StyleModifier style_for_stack(const HighlightTheme& theme, const std::vector<std::string>& stack);

// Line-by-line syntax highlighter for a text editor.
//
// The host feeds lines in order through highlight_line() and calls
// change_line() when an edit invalidates everything from a line onward.
// Parser state is snapshotted every LINES_PER_SNAPSHOT lines so that an
// edit only re-parses from the nearest snapshot.
class Highlighter
{
   public:
    static constexpr size_t LINES_PER_SNAPSHOT = 50;

    struct Settings
    {
        Theme       theme = Theme::Preset::SolarizedDark;
        std::string token;   // language name or file extension

        bool operator==(const Settings& o) const { return theme == o.theme && token == o.token; }
        bool operator!=(const Settings& o) const { return !(*this == o); }
    };

    explicit Highlighter(const Settings& settings);

    // New theme or language. Restarts from the first line.
    void update(const Settings& settings);

    // Next highlight_line() call refers to this line.
    void change_line(size_t line);

    // Highlights the current line and advances to the next one.
    std::vector<HighlightSpan> highlight_line(std::string_view line);

    size_t current_line() const { return current_line_; }

    const Grammar& grammar() const { return *grammar_; }
    const Theme&   theme() const { return theme_; }
    size_t         snapshot_count() const { return caches_.size(); }

   private:
    using Snapshot = std::pair<ParseState, ScopeStack>;

    const Grammar*        grammar_ = nullptr;
    Theme                 theme_;
    std::vector<Snapshot> caches_;
    size_t                current_line_ = 0;
};

}   // namespace glide::highlight
