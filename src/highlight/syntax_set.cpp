#include <algorithm>
#include <cctype>
#include <glide/highlight/syntax.hpp>
#include <glide/logger.hpp>

namespace glide::highlight
{

namespace
{

bool iequals(std::string_view a, std::string_view b)
{
    return a.size() == b.size()
           && std::equal(a.begin(),
                         a.end(),
                         b.begin(),
                         [](char x, char y)
                         {
                             return std::tolower(static_cast<unsigned char>(x))
                                    == std::tolower(static_cast<unsigned char>(y));
                         });
}

bool matches_token(const Grammar& grammar, std::string_view token)
{
    if (iequals(grammar.name(), token))
        return true;
    const auto& exts = grammar.extensions();
    return std::any_of(exts.begin(),
                       exts.end(),
                       [&](const std::string& ext) { return iequals(ext, token); });
}

LanguageRules cpp_rules()
{
    LanguageRules r;
    r.name                = "C++";
    r.scope               = "source.c++";
    r.extensions          = {"cpp", "cc", "cxx", "c++", "hpp", "hh", "hxx", "h", "inl"};
    r.line_comments       = {"//"};
    r.block_comment_begin = "/*";
    r.block_comment_end   = "*/";
    r.string_quotes       = {'"', '\''};
    r.preprocessor        = true;
    r.keywords            = {"alignas",   "alignof",  "break",     "case",         "catch",
                             "class",     "co_await", "co_return", "co_yield",     "concept",
                             "const",     "consteval","constexpr", "constinit",    "const_cast",
                             "continue",  "decltype", "default",   "delete",       "do",
                             "dynamic_cast", "else",  "enum",      "explicit",     "export",
                             "extern",    "final",    "for",       "friend",       "goto",
                             "if",        "inline",   "mutable",   "namespace",    "new",
                             "noexcept",  "operator", "override",  "private",      "protected",
                             "public",    "reinterpret_cast",      "requires",     "return",
                             "sizeof",    "static",   "static_assert",             "static_cast",
                             "struct",    "switch",   "template",  "this",         "throw",
                             "try",       "typedef",  "typename",  "union",        "using",
                             "virtual",   "volatile", "while"};
    r.types               = {"auto",     "bool",     "char",     "char8_t",  "char16_t",
                             "char32_t", "double",   "float",    "int",      "long",
                             "short",    "signed",   "unsigned", "void",     "wchar_t",
                             "size_t",   "int8_t",   "int16_t",  "int32_t",  "int64_t",
                             "uint8_t",  "uint16_t", "uint32_t", "uint64_t"};
    r.constants           = {"true", "false", "nullptr", "NULL"};
    return r;
}

LanguageRules rust_rules()
{
    LanguageRules r;
    r.name                = "Rust";
    r.scope               = "source.rust";
    r.extensions          = {"rs"};
    r.line_comments       = {"//"};
    r.block_comment_begin = "/*";
    r.block_comment_end   = "*/";
    r.string_quotes       = {'"'};
    r.keywords            = {"as",     "async", "await",  "break", "const",  "continue",
                             "crate",  "dyn",   "else",   "enum",  "extern", "fn",
                             "for",    "if",    "impl",   "in",    "let",    "loop",
                             "match",  "mod",   "move",   "mut",   "pub",    "ref",
                             "return", "self",  "static", "struct", "super", "trait",
                             "type",   "unsafe", "use",   "where", "while"};
    r.types               = {"bool",  "char",  "f32",   "f64",  "i8",    "i16",   "i32",
                             "i64",   "i128",  "isize", "u8",   "u16",   "u32",   "u64",
                             "u128",  "usize", "str",   "String", "Self", "Vec",  "Option",
                             "Result", "Box"};
    r.constants           = {"true", "false", "None", "Some", "Ok", "Err"};
    return r;
}

LanguageRules python_rules()
{
    LanguageRules r;
    r.name              = "Python";
    r.scope             = "source.python";
    r.extensions        = {"py", "pyw", "pyi"};
    r.line_comments     = {"#"};
    r.string_quotes     = {'"', '\''};
    r.multiline_strings = {"\"\"\"", "'''"};
    r.keywords          = {"and",    "as",     "assert", "async",  "await",    "break",
                           "class",  "continue", "def",  "del",    "elif",     "else",
                           "except", "finally", "for",   "from",   "global",   "if",
                           "import", "in",     "is",     "lambda", "nonlocal", "not",
                           "or",     "pass",   "raise",  "return", "try",      "while",
                           "with",   "yield"};
    r.types             = {"int", "float", "str", "bytes", "bool", "list", "dict", "set",
                           "tuple", "object"};
    r.constants         = {"True", "False", "None"};
    return r;
}

LanguageRules json_rules()
{
    LanguageRules r;
    r.name            = "JSON";
    r.scope           = "source.json";
    r.extensions      = {"json"};
    r.string_quotes   = {'"'};
    r.constants       = {"true", "false", "null"};
    r.highlight_calls = false;
    r.object_keys     = true;
    return r;
}

}   // anonymous namespace

const SyntaxSet& SyntaxSet::defaults()
{
    static const SyntaxSet set = []
    {
        SyntaxSet s;
        s.add(std::make_unique<KeywordGrammar>(cpp_rules()));
        s.add(std::make_unique<KeywordGrammar>(rust_rules()));
        s.add(std::make_unique<KeywordGrammar>(python_rules()));
        s.add(std::make_unique<KeywordGrammar>(json_rules()));
        return s;
    }();
    return set;
}

void SyntaxSet::add(std::unique_ptr<Grammar> grammar)
{
    if (grammar)
        grammars_.push_back(std::move(grammar));
}

const Grammar* SyntaxSet::find_by_token(std::string_view token) const
{
    if (matches_token(plain_text_, token))
        return &plain_text_;
    for (const auto& g : grammars_)
    {
        if (matches_token(*g, token))
            return g.get();
    }
    return nullptr;
}

const Grammar& SyntaxSet::find_or_plain_text(std::string_view token) const
{
    if (const Grammar* g = find_by_token(token))
        return *g;
    GLIDE_LOG_DEBUG("highlight", "No grammar for '{}', using plain text", token);
    return plain_text_;
}

}   // namespace glide::highlight
