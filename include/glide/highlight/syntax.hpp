#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace glide::highlight
{

// ─── Scope stack ────────────────────────────────────────────────────────────

struct ScopeStackOp
{
    enum class Kind
    {
        Noop,
        Push,
        Pop,
    };

    Kind        kind = Kind::Noop;
    std::string scope;   // Push only

    static ScopeStackOp noop() { return {}; }
    static ScopeStackOp push(std::string scope) { return {Kind::Push, std::move(scope)}; }
    static ScopeStackOp pop() { return {Kind::Pop, {}}; }

    bool operator==(const ScopeStackOp& o) const { return kind == o.kind && scope == o.scope; }
};

// Scopes enclosing the current position, outermost first.
class ScopeStack
{
   public:
    // Pop on an empty stack is ignored.
    void apply(const ScopeStackOp& op);

    const std::vector<std::string>& scopes() const { return scopes_; }
    size_t                          size() const { return scopes_.size(); }
    bool                            empty() const { return scopes_.empty(); }

    bool operator==(const ScopeStack& o) const { return scopes_ == o.scopes_; }

   private:
    std::vector<std::string> scopes_;
};

// Byte offset into the line at which an op takes effect.
using ScopeOps = std::vector<std::pair<size_t, ScopeStackOp>>;

class Grammar;

// Per-document parser state carried from one line to the next.
struct ParseState
{
    const Grammar* grammar = nullptr;
    bool           started = false;   // top-level scope pushed

    // Closing delimiter of a construct left open at the end of the previous
    // line (block comment, triple-quoted string); empty when none.
    std::string open_block_end;

    explicit ParseState(const Grammar* g = nullptr) : grammar(g) {}

    bool operator==(const ParseState& o) const
    {
        return grammar == o.grammar && started == o.started && open_block_end == o.open_block_end;
    }
};

// ─── Grammar ────────────────────────────────────────────────────────────────

class Grammar
{
   public:
    virtual ~Grammar() = default;

    virtual std::string_view                name() const       = 0;
    virtual std::string_view                scope() const      = 0;
    virtual const std::vector<std::string>& extensions() const = 0;

    // Scope ops for one line, ordered by offset. Updates state for the next
    // line.
    virtual ScopeOps parse_line(std::string_view line, ParseState& state) const = 0;
};

class PlainTextGrammar : public Grammar
{
   public:
    std::string_view                name() const override { return "Plain Text"; }
    std::string_view                scope() const override { return "text.plain"; }
    const std::vector<std::string>& extensions() const override { return extensions_; }

    ScopeOps parse_line(std::string_view line, ParseState& state) const override;

   private:
    std::vector<std::string> extensions_ = {"txt"};
};

// Lexical rules for a C-family or scripting language. Enough to color
// comments, strings, numbers, keywords, types and constants.
struct LanguageRules
{
    std::string              name;
    std::string              scope;
    std::vector<std::string> extensions;

    std::vector<std::string> line_comments;
    std::string              block_comment_begin;
    std::string              block_comment_end;

    std::vector<char>        string_quotes;        // single-line strings
    std::vector<std::string> multiline_strings;    // opening = closing delimiter

    std::vector<std::string> keywords;
    std::vector<std::string> types;
    std::vector<std::string> constants;

    bool preprocessor     = false;   // lines starting with '#' are directives
    bool highlight_calls  = true;    // identifiers followed by '(' are functions
    bool object_keys      = false;   // strings followed by ':' are property names
};

class KeywordGrammar : public Grammar
{
   public:
    explicit KeywordGrammar(LanguageRules rules);

    std::string_view                name() const override { return rules_.name; }
    std::string_view                scope() const override { return rules_.scope; }
    const std::vector<std::string>& extensions() const override { return rules_.extensions; }

    ScopeOps parse_line(std::string_view line, ParseState& state) const override;

    const LanguageRules& rules() const { return rules_; }

   private:
    LanguageRules rules_;
};

// ─── SyntaxSet ──────────────────────────────────────────────────────────────

class SyntaxSet
{
   public:
    // Plain text plus C++, Rust, Python and JSON. Built once on first use.
    static const SyntaxSet& defaults();

    void add(std::unique_ptr<Grammar> grammar);

    // Case-insensitive match on grammar name or file extension; nullptr if
    // none matches.
    const Grammar* find_by_token(std::string_view token) const;

    // find_by_token() falling back to plain text.
    const Grammar& find_or_plain_text(std::string_view token) const;

    const Grammar& plain_text() const { return plain_text_; }
    size_t         size() const { return grammars_.size() + 1; }

   private:
    PlainTextGrammar                      plain_text_;
    std::vector<std::unique_ptr<Grammar>> grammars_;
};

}   // namespace glide::highlight
