#include <gtest/gtest.h>
#include <glide/highlight/highlighter.hpp>
#include <glide/highlight/syntax.hpp>
#include <string>
#include <vector>

using namespace glide;
using namespace glide::highlight;

namespace
{

// Scope stack in effect over [begin, end) after running the ops of one line.
std::vector<std::string> scopes_at(const Grammar&     grammar,
                                   ParseState&        state,
                                   ScopeStack&        stack,
                                   std::string_view   line,
                                   size_t             offset)
{
    ScopeOps ops = grammar.parse_line(line, state);
    for (const auto& [pos, op] : ops)
    {
        if (pos > offset)
            break;
        stack.apply(op);
    }
    return stack.scopes();
}

bool has_scope(const std::vector<std::string>& stack, std::string_view prefix)
{
    for (const auto& s : stack)
    {
        if (s.compare(0, prefix.size(), prefix) == 0)
            return true;
    }
    return false;
}

const HighlightSpan* span_at(const std::vector<HighlightSpan>& spans, size_t offset)
{
    for (const auto& s : spans)
    {
        if (s.begin <= offset && offset < s.end)
            return &s;
    }
    return nullptr;
}

}   // namespace

// ─── SyntaxSet ──────────────────────────────────────────────────────────────

TEST(SyntaxSet, FindsByNameOrExtension)
{
    const auto& set = SyntaxSet::defaults();
    ASSERT_NE(set.find_by_token("rs"), nullptr);
    EXPECT_EQ(set.find_by_token("rs")->name(), "Rust");
    EXPECT_EQ(set.find_by_token("RUST")->name(), "Rust");
    EXPECT_EQ(set.find_by_token("hpp")->name(), "C++");
    EXPECT_EQ(set.find_by_token("Py")->name(), "Python");
    EXPECT_EQ(set.find_by_token("json")->name(), "JSON");
    EXPECT_EQ(set.find_by_token("txt")->name(), "Plain Text");
}

TEST(SyntaxSet, UnknownTokenFallsBackToPlainText)
{
    const auto& set = SyntaxSet::defaults();
    EXPECT_EQ(set.find_by_token("cobol"), nullptr);
    EXPECT_EQ(&set.find_or_plain_text("cobol"), &set.plain_text());
}

// ─── Grammars ───────────────────────────────────────────────────────────────

TEST(Grammar, FirstLinePushesTopLevelScope)
{
    const Grammar& rust = *SyntaxSet::defaults().find_by_token("rs");
    ParseState     state(&rust);
    ScopeOps       ops = rust.parse_line("", state);
    ASSERT_EQ(ops.size(), 1u);
    EXPECT_EQ(ops[0].second, ScopeStackOp::push("source.rust"));
    EXPECT_TRUE(rust.parse_line("", state).empty());
}

TEST(Grammar, CppTokens)
{
    const Grammar& cpp = *SyntaxSet::defaults().find_by_token("cpp");
    std::string    line = "return count(\"x\") + 42; // done";

    auto at = [&](size_t offset)
    {
        ParseState state(&cpp);
        ScopeStack stack;
        return scopes_at(cpp, state, stack, line, offset);
    };

    EXPECT_TRUE(has_scope(at(0), "keyword"));
    EXPECT_TRUE(has_scope(at(7), "entity.name.function"));
    EXPECT_TRUE(has_scope(at(13), "string.quoted.double"));
    EXPECT_TRUE(has_scope(at(line.find("42")), "constant.numeric"));
    EXPECT_TRUE(has_scope(at(line.find("//") + 3), "comment.line"));
    EXPECT_FALSE(has_scope(at(line.find("+")), "constant"));
}

TEST(Grammar, CppPreprocessor)
{
    const Grammar& cpp = *SyntaxSet::defaults().find_by_token("cpp");
    ParseState     state(&cpp);
    ScopeStack     stack;
    EXPECT_TRUE(has_scope(scopes_at(cpp, state, stack, "#include <x>", 2), "meta.preprocessor"));
}

TEST(Grammar, BlockCommentSpansLines)
{
    const Grammar& cpp = *SyntaxSet::defaults().find_by_token("cpp");
    ParseState     state(&cpp);
    ScopeStack     stack;

    for (const auto& [pos, op] : cpp.parse_line("int a; /* start", state))
        stack.apply(op);
    EXPECT_EQ(state.open_block_end, "*/");
    EXPECT_TRUE(has_scope(stack.scopes(), "comment.block"));

    ScopeOps middle = cpp.parse_line("still inside", state);
    EXPECT_TRUE(middle.empty());

    for (const auto& [pos, op] : cpp.parse_line("end */ int b;", state))
        stack.apply(op);
    EXPECT_TRUE(state.open_block_end.empty());
    EXPECT_FALSE(has_scope(stack.scopes(), "comment.block"));
}

TEST(Grammar, PythonTripleQuotedString)
{
    const Grammar& py = *SyntaxSet::defaults().find_by_token("py");
    ParseState     state(&py);
    py.parse_line("x = \"\"\"doc", state);
    EXPECT_EQ(state.open_block_end, "\"\"\"");
    py.parse_line("\"\"\"", state);
    EXPECT_TRUE(state.open_block_end.empty());
}

TEST(Grammar, JsonKeysAreProperties)
{
    const Grammar& json = *SyntaxSet::defaults().find_by_token("json");
    std::string    line = R"({"name": "glide", "ok": true})";

    ParseState state(&json);
    ScopeStack stack;
    EXPECT_TRUE(has_scope(scopes_at(json, state, stack, line, 2), "support.type.property-name"));

    ParseState state2(&json);
    ScopeStack stack2;
    EXPECT_TRUE(has_scope(scopes_at(json, state2, stack2, line, line.find("glide")),
                          "string.quoted.double"));
}

// ─── Highlighter ────────────────────────────────────────────────────────────

TEST(Highlighter, SpansCoverLine)
{
    Highlighter h({Theme::Preset::SolarizedDark, "cpp"});
    std::string line  = "int main() { return 0; }";
    auto        spans = h.highlight_line(line);

    ASSERT_FALSE(spans.empty());
    EXPECT_EQ(spans.front().begin, 0u);
    EXPECT_EQ(spans.back().end, line.size());
    for (size_t i = 1; i < spans.size(); ++i)
        EXPECT_EQ(spans[i].begin, spans[i - 1].end);
}

TEST(Highlighter, KeywordsGetThemeColor)
{
    Theme       theme = Theme::Preset::SolarizedDark;
    Highlighter h({theme, "rs"});
    auto        spans = h.highlight_line("fn main() {}");

    const HighlightSpan* kw = span_at(spans, 0);
    ASSERT_NE(kw, nullptr);
    auto color = kw->highlight.color();
    ASSERT_TRUE(color.has_value());

    auto expected = style_for_stack(theme.highlight_theme(), {"source.rust", "keyword.control"});
    EXPECT_EQ(*color, expected.foreground->to_color());
}

TEST(Highlighter, CommentFontIsItalic)
{
    Highlighter h({Theme::Preset::InspiredGitHub, "py"});
    auto        spans = h.highlight_line("# note");
    const auto* c     = span_at(spans, 2);
    ASSERT_NE(c, nullptr);
    auto font = c->highlight.font();
    ASSERT_TRUE(font.has_value());
    EXPECT_EQ(font->style, Font::Style::Italic);
    EXPECT_EQ(font->weight, Font::Weight::Normal);
    EXPECT_TRUE(c->highlight.to_format().color.has_value());
}

TEST(Highlighter, PlainTextHasNoStyle)
{
    Highlighter h({Theme::Preset::Base16Ocean, "unknown-language"});
    EXPECT_EQ(h.grammar().name(), "Plain Text");
    auto spans = h.highlight_line("hello");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_FALSE(spans[0].highlight.color().has_value());
    EXPECT_FALSE(spans[0].highlight.font().has_value());
}

TEST(Highlighter, EmptyLineHasNoSpans)
{
    Highlighter h({Theme::Preset::Base16Ocean, "cpp"});
    EXPECT_TRUE(h.highlight_line("").empty());
    EXPECT_EQ(h.current_line(), 1u);
}

TEST(Highlighter, CountsLines)
{
    Highlighter h({Theme::Preset::Base16Eighties, "py"});
    for (int i = 0; i < 3; ++i)
        h.highlight_line("pass");
    EXPECT_EQ(h.current_line(), 3u);
}

TEST(Highlighter, SnapshotsEveryFiftyLines)
{
    Highlighter h({Theme::Preset::Base16Mocha, "cpp"});
    EXPECT_EQ(h.snapshot_count(), 1u);
    for (size_t i = 0; i < 120; ++i)
        h.highlight_line("int x = 1;");
    EXPECT_EQ(h.snapshot_count(), 3u);

    h.change_line(75);
    EXPECT_EQ(h.current_line(), 50u);
    EXPECT_EQ(h.snapshot_count(), 2u);

    h.change_line(10);
    EXPECT_EQ(h.current_line(), 0u);
    EXPECT_EQ(h.snapshot_count(), 1u);
}

TEST(Highlighter, ChangeLinePastCacheRestarts)
{
    Highlighter h({Theme::Preset::Base16Mocha, "cpp"});
    h.highlight_line("int x;");
    h.change_line(500);
    EXPECT_EQ(h.current_line(), 0u);
}

TEST(Highlighter, BlockCommentCarriesAcrossLines)
{
    Highlighter h({Theme::Preset::SolarizedDark, "cpp"});
    h.highlight_line("/* open");
    auto spans = h.highlight_line("inside");
    ASSERT_EQ(spans.size(), 1u);

    auto expected = style_for_stack(Theme(Theme::Preset::SolarizedDark).highlight_theme(),
                                    {"source.c++", "comment.block"});
    EXPECT_EQ(spans[0].highlight.style(), expected);
}

TEST(Highlighter, ReHighlightAfterChangeLineIsStable)
{
    Highlighter h({Theme::Preset::SolarizedDark, "cpp"});
    h.highlight_line("/* open");
    auto first = h.highlight_line("inside");

    h.change_line(0);
    h.highlight_line("/* open");
    auto second = h.highlight_line("inside");
    ASSERT_EQ(first.size(), second.size());
    EXPECT_EQ(first[0].highlight.style(), second[0].highlight.style());
}

TEST(Highlighter, UpdateSwitchesLanguageAndRestarts)
{
    Highlighter h({Theme::Preset::SolarizedDark, "cpp"});
    h.highlight_line("int a;");
    h.update({Theme::Preset::InspiredGitHub, "json"});
    EXPECT_EQ(h.grammar().name(), "JSON");
    EXPECT_EQ(h.theme(), Theme(Theme::Preset::InspiredGitHub));
    EXPECT_EQ(h.current_line(), 0u);
}

TEST(StyleForStack, StrongerMatchWins)
{
    HighlightTheme theme;
    ThemeItem      general;
    general.scope            = ScopeSelector("string");
    general.style.foreground = Color8{1, 0, 0};
    general.style.font_style = FontStyle::Bold;
    ThemeItem specific;
    specific.scope            = ScopeSelector("string.quoted");
    specific.style.foreground = Color8{2, 0, 0};
    theme.scopes              = {specific, general};

    auto s = style_for_stack(theme, {"source.c++", "string.quoted.double"});
    EXPECT_EQ(s.foreground, Color8(2, 0, 0));
    EXPECT_EQ(s.font_style, FontStyle::Bold);
}
