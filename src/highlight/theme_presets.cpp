#include <glide/highlight/theme.hpp>
#include <glide/logger.hpp>
#include <initializer_list>

// Built-in highlight themes. Palettes follow the published Solarized, Base16
// and InspiredGitHub color schemes.

namespace glide::highlight
{

namespace
{

Color8 hex(uint32_t rgb)
{
    return Color8::from_hex(rgb, false);
}

struct ItemSpec
{
    const char*              scope;
    uint32_t                 foreground;
    std::optional<FontStyle> font_style = std::nullopt;
};

HighlightTheme make_theme(const char*                     name,
                          const char*                     author,
                          const ThemeSettings&            settings,
                          std::initializer_list<ItemSpec> items)
{
    HighlightTheme theme;
    theme.name     = name;
    theme.author   = author;
    theme.settings = settings;
    theme.scopes.reserve(items.size());
    for (const auto& item : items)
    {
        ThemeItem ti;
        ti.scope            = ScopeSelector(item.scope);
        ti.style.foreground = hex(item.foreground);
        ti.style.font_style = item.font_style;
        theme.scopes.push_back(std::move(ti));
    }
    return theme;
}

ThemeSettings make_settings(uint32_t fg, uint32_t bg, uint32_t caret, uint32_t selection,
                            uint32_t line_highlight)
{
    ThemeSettings s;
    s.foreground     = hex(fg);
    s.background     = hex(bg);
    s.caret          = hex(caret);
    s.selection      = hex(selection);
    s.line_highlight = hex(line_highlight);
    return s;
}

HighlightTheme solarized_dark()
{
    return make_theme("Solarized (dark)",
                      "Ethan Schoonover",
                      make_settings(0x839496, 0x002B36, 0x819090, 0x073642, 0x073642),
                      {
                          {"comment", 0x586E75, FontStyle::Italic},
                          {"string", 0x2AA198},
                          {"string.regexp", 0xD30102},
                          {"constant.numeric", 0xD33682},
                          {"constant.language", 0xB58900},
                          {"constant.character.escape", 0xCB4B16},
                          {"keyword", 0x859900},
                          {"keyword.operator", 0x859900},
                          {"storage", 0x93A1A1},
                          {"storage.type", 0x268BD2},
                          {"entity.name.function", 0x268BD2},
                          {"entity.name.type, entity.name.class", 0xCB4B16},
                          {"support.function", 0x859900},
                          {"support.type", 0x859900},
                          {"variable.parameter", 0x839496},
                          {"punctuation.definition.string", 0x2AA198},
                          {"meta.preprocessor", 0xCB4B16},
                          {"invalid", 0xDC322F, FontStyle::Underline},
                      });
}

HighlightTheme base16_mocha()
{
    return make_theme("Base16 Mocha Dark",
                      "Chris Kempson",
                      make_settings(0xD0C8C6, 0x3B3228, 0xD0C8C6, 0x645240, 0x534636),
                      {
                          {"comment", 0x7E705A},
                          {"string", 0xBEB55B},
                          {"constant.numeric", 0xD28B71},
                          {"constant.language", 0xD28B71},
                          {"constant.character.escape", 0x7BBDA4},
                          {"keyword", 0xA89BB9},
                          {"storage", 0xA89BB9},
                          {"storage.type", 0xF4BC87},
                          {"entity.name.function", 0x8AB3B5},
                          {"entity.name.type, entity.name.class", 0xF4BC87},
                          {"support.function", 0x7BBDA4},
                          {"variable", 0xCB6077},
                          {"punctuation", 0xB8AFAD},
                          {"invalid", 0xCB6077, FontStyle::Underline},
                      });
}

HighlightTheme base16_ocean()
{
    return make_theme("Base16 Ocean Dark",
                      "Chris Kempson",
                      make_settings(0xC0C5CE, 0x2B303B, 0xC0C5CE, 0x4F5B66, 0x343D46),
                      {
                          {"comment", 0x65737E},
                          {"string", 0xA3BE8C},
                          {"constant.numeric", 0xD08770},
                          {"constant.language", 0xD08770},
                          {"constant.character.escape", 0x96B5B4},
                          {"keyword", 0xB48EAD},
                          {"storage", 0xB48EAD},
                          {"storage.type", 0xEBCB8B},
                          {"entity.name.function", 0x8FA1B3},
                          {"entity.name.type, entity.name.class", 0xEBCB8B},
                          {"support.function", 0x96B5B4},
                          {"variable", 0xBF616A},
                          {"punctuation", 0xAB7967},
                          {"meta.preprocessor", 0xAB7967},
                          {"invalid", 0xBF616A, FontStyle::Underline},
                      });
}

HighlightTheme base16_eighties()
{
    return make_theme("Base16 Eighties Dark",
                      "Chris Kempson",
                      make_settings(0xD3D0C8, 0x2D2D2D, 0xD3D0C8, 0x515151, 0x393939),
                      {
                          {"comment", 0x747369},
                          {"string", 0x99CC99},
                          {"constant.numeric", 0xF99157},
                          {"constant.language", 0xF99157},
                          {"constant.character.escape", 0x66CCCC},
                          {"keyword", 0xCC99CC},
                          {"storage", 0xCC99CC},
                          {"storage.type", 0xFFCC66},
                          {"entity.name.function", 0x6699CC},
                          {"entity.name.type, entity.name.class", 0xFFCC66},
                          {"support.function", 0x66CCCC},
                          {"variable", 0xF2777A},
                          {"invalid", 0xF2777A, FontStyle::Underline},
                      });
}

HighlightTheme inspired_github()
{
    return make_theme("Inspired GitHub",
                      "sethlopezme",
                      make_settings(0x323232, 0xFFFFFF, 0x323232, 0xC8C8FA, 0xF5F5F5),
                      {
                          {"comment", 0x969896, FontStyle::Italic},
                          {"string", 0x183691},
                          {"string.regexp", 0x009926},
                          {"constant.numeric", 0x0086B3},
                          {"constant.language", 0x0086B3},
                          {"constant.character.escape", 0x0086B3},
                          {"keyword", 0xA71D5D, FontStyle::Bold},
                          {"keyword.operator", 0xA71D5D},
                          {"storage", 0xA71D5D, FontStyle::Bold},
                          {"storage.type", 0xA71D5D, FontStyle::Bold},
                          {"entity.name.function", 0x795DA3, FontStyle::Bold},
                          {"entity.name.type, entity.name.class", 0x0086B3},
                          {"support.function", 0x62A35C},
                          {"support.type", 0x0086B3},
                          {"variable.parameter", 0x323232},
                          {"meta.preprocessor", 0x63A35C},
                          {"invalid", 0xB52A1D, FontStyle::Bold | FontStyle::Italic},
                      });
}

}   // anonymous namespace

const ThemeSet& ThemeSet::defaults()
{
    static const ThemeSet set = []
    {
        ThemeSet s;
        s.insert(std::string(Theme::table_key(Theme::Preset::SolarizedDark)), solarized_dark());
        s.insert(std::string(Theme::table_key(Theme::Preset::Base16Mocha)), base16_mocha());
        s.insert(std::string(Theme::table_key(Theme::Preset::Base16Ocean)), base16_ocean());
        s.insert(std::string(Theme::table_key(Theme::Preset::Base16Eighties)), base16_eighties());
        s.insert(std::string(Theme::table_key(Theme::Preset::InspiredGitHub)), inspired_github());
        GLIDE_LOG_DEBUG("highlight", "Loaded {} built-in themes", s.size());
        return s;
    }();
    return set;
}

}   // namespace glide::highlight
