#include <algorithm>
#include <cctype>
#include <glide/highlight/syntax.hpp>

namespace glide::highlight
{

// ─── ScopeStack ─────────────────────────────────────────────────────────────

void ScopeStack::apply(const ScopeStackOp& op)
{
    switch (op.kind)
    {
        case ScopeStackOp::Kind::Push:
            scopes_.push_back(op.scope);
            break;
        case ScopeStackOp::Kind::Pop:
            if (!scopes_.empty())
                scopes_.pop_back();
            break;
        case ScopeStackOp::Kind::Noop:
            break;
    }
}

// ─── Plain text ─────────────────────────────────────────────────────────────

ScopeOps PlainTextGrammar::parse_line(std::string_view /*line*/, ParseState& state) const
{
    ScopeOps ops;
    if (!state.started)
    {
        ops.emplace_back(0, ScopeStackOp::push(std::string(scope())));
        state.started = true;
    }
    return ops;
}

// ─── Keyword grammars ───────────────────────────────────────────────────────

namespace
{

bool is_ident_start(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_digit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool starts_with_at(std::string_view line, size_t pos, std::string_view prefix)
{
    return !prefix.empty() && line.size() - pos >= prefix.size()
           && line.compare(pos, prefix.size(), prefix) == 0;
}

bool contains(const std::vector<std::string>& words, std::string_view word)
{
    return std::find(words.begin(), words.end(), word) != words.end();
}

size_t skip_spaces(std::string_view line, size_t pos)
{
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos])))
        ++pos;
    return pos;
}

// Index one past the closing quote, or the line length if unterminated.
size_t scan_string(std::string_view line, size_t open, char quote)
{
    size_t j = open + 1;
    while (j < line.size())
    {
        if (line[j] == '\\')
            j += 2;
        else if (line[j] == quote)
            return j + 1;
        else
            ++j;
    }
    return line.size();
}

size_t scan_number(std::string_view line, size_t start)
{
    bool   hex = starts_with_at(line, start, "0x") || starts_with_at(line, start, "0X");
    size_t j   = start;
    while (j < line.size())
    {
        char c = line[j];
        if (is_ident_char(c) || c == '.')
            ++j;
        else if ((c == '+' || c == '-') && !hex && j > start
                 && (line[j - 1] == 'e' || line[j - 1] == 'E'))
            ++j;
        else
            break;
    }
    return j;
}

void emit(ScopeOps& ops, size_t begin, size_t end, std::string scope)
{
    ops.emplace_back(begin, ScopeStackOp::push(std::move(scope)));
    ops.emplace_back(end, ScopeStackOp::pop());
}

}   // anonymous namespace

KeywordGrammar::KeywordGrammar(LanguageRules rules) : rules_(std::move(rules)) {}

ScopeOps KeywordGrammar::parse_line(std::string_view line, ParseState& state) const
{
    ScopeOps     ops;
    const size_t n = line.size();

    if (!state.started)
    {
        ops.emplace_back(0, ScopeStackOp::push(rules_.scope));
        state.started = true;
    }

    size_t i = 0;

    // Continue a block comment or triple-quoted string from the previous
    // line. Its scope is still on the stack.
    if (!state.open_block_end.empty())
    {
        auto end = line.find(state.open_block_end);
        if (end == std::string_view::npos)
            return ops;
        i = end + state.open_block_end.size();
        ops.emplace_back(i, ScopeStackOp::pop());
        state.open_block_end.clear();
    }

    const size_t first_token = skip_spaces(line, 0);

    while (i < n)
    {
        char c = line[i];

        if (std::isspace(static_cast<unsigned char>(c)))
        {
            ++i;
            continue;
        }

        if (std::any_of(rules_.line_comments.begin(),
                        rules_.line_comments.end(),
                        [&](const std::string& lc) { return starts_with_at(line, i, lc); }))
        {
            emit(ops, i, n, "comment.line");
            break;
        }

        if (starts_with_at(line, i, rules_.block_comment_begin))
        {
            ops.emplace_back(i, ScopeStackOp::push("comment.block"));
            auto end = line.find(rules_.block_comment_end, i + rules_.block_comment_begin.size());
            if (end == std::string_view::npos)
            {
                state.open_block_end = rules_.block_comment_end;
                return ops;
            }
            i = end + rules_.block_comment_end.size();
            ops.emplace_back(i, ScopeStackOp::pop());
            continue;
        }

        auto triple = std::find_if(rules_.multiline_strings.begin(),
                                   rules_.multiline_strings.end(),
                                   [&](const std::string& d) { return starts_with_at(line, i, d); });
        if (triple != rules_.multiline_strings.end())
        {
            ops.emplace_back(i, ScopeStackOp::push("string.quoted.triple"));
            auto end = line.find(*triple, i + triple->size());
            if (end == std::string_view::npos)
            {
                state.open_block_end = *triple;
                return ops;
            }
            i = end + triple->size();
            ops.emplace_back(i, ScopeStackOp::pop());
            continue;
        }

        if (std::find(rules_.string_quotes.begin(), rules_.string_quotes.end(), c)
            != rules_.string_quotes.end())
        {
            size_t      j = scan_string(line, i, c);
            std::string scope;
            if (rules_.object_keys && skip_spaces(line, j) < n && line[skip_spaces(line, j)] == ':')
                scope = "support.type.property-name";
            else
                scope = c == '\'' ? "string.quoted.single" : "string.quoted.double";
            emit(ops, i, j, std::move(scope));
            i = j;
            continue;
        }

        if (rules_.preprocessor && c == '#' && i == first_token)
        {
            size_t j = skip_spaces(line, i + 1);
            while (j < n && is_ident_char(line[j]))
                ++j;
            emit(ops, i, j, "meta.preprocessor");
            i = j;
            continue;
        }

        if (is_digit(c) || (c == '.' && i + 1 < n && is_digit(line[i + 1])))
        {
            size_t j = scan_number(line, i);
            emit(ops, i, j, "constant.numeric");
            i = j;
            continue;
        }

        if (is_ident_start(c))
        {
            size_t j = i;
            while (j < n && is_ident_char(line[j]))
                ++j;
            std::string_view word = line.substr(i, j - i);

            if (contains(rules_.keywords, word))
                emit(ops, i, j, "keyword.control");
            else if (contains(rules_.types, word))
                emit(ops, i, j, "storage.type");
            else if (contains(rules_.constants, word))
                emit(ops, i, j, "constant.language");
            else if (rules_.highlight_calls)
            {
                size_t k = skip_spaces(line, j);
                if (k < n && line[k] == '(')
                    emit(ops, i, j, "entity.name.function");
            }
            i = j;
            continue;
        }

        ++i;
    }

    return ops;
}

}   // namespace glide::highlight
