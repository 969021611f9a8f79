#include "crossfig/expander.hpp"
#include "crossfig/diagnostics.hpp"
#include "crossfig/expression_parser.hpp"
#include "crossfig/switch.hpp"
#include "crossfig/syntax.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <vector>

namespace crossfig
{
    namespace
    {
        constexpr auto npos = std::string_view::npos;

        bool is_blank(std::string_view s)
        {
            return std::all_of(s.begin(), s.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
        }

        // Multi-line fragments lose the line break after '{' and the line
        // holding '}'. Inline fragments are trimmed.
        Fragment trim_fragment(Fragment f)
        {
            std::string_view t   = f.text;
            size_t           off = f.offset;

            const auto firstNl = t.find('\n');
            if (firstNl != npos && is_blank(t.substr(0, firstNl)))
            {
                t.remove_prefix(firstNl + 1);
                off += firstNl + 1;

                const auto lastNl = t.rfind('\n');
                if (lastNl != npos && is_blank(t.substr(lastNl + 1)))
                    t = t.substr(0, lastNl);
                else if (is_blank(t))
                    t = {};
                return Fragment {t, off};
            }

            while (!t.empty() && std::isspace(static_cast<unsigned char>(t.front())))
            {
                t.remove_prefix(1);
                ++off;
            }
            while (!t.empty() && std::isspace(static_cast<unsigned char>(t.back())))
                t.remove_suffix(1);
            return Fragment {t, off};
        }

        std::string describe(const Token& t)
        {
            std::string s = token_kind_name(t.kind);
            if (t.kind == Token::eIdent)
                s += " `" + t.text + "`";
            return s;
        }

        class Expander
        {
        public:
            Expander(CompilationUnit& unit, const UnitGraph& graph, std::string_view src, const ExpandOptions& opt) :
                m_Unit(unit), m_Scope(graph, unit), m_Src(src), m_Path(unit.virtualPath()), m_Options(opt)
            {}

            Result<void> run() { return expandRange(0, m_Src.size(), 0); }

            ExpandResult& result() { return m_Result; }

        private:
            Error errorAt(size_t offset, ErrorCode code, const std::string& msg) const
            {
                return source_error(code, m_Path, m_Src, offset, msg);
            }

            template<typename T>
            Result<T> fail(size_t offset, ErrorCode code, const std::string& msg) const
            {
                return Result<T>::err(errorAt(offset, code, msg));
            }

            void note(size_t offset, const std::string& msg)
            {
                const auto loc = locate(m_Src, offset);
                m_Result.log += m_Path + ":" + std::to_string(loc.line) + ":" + std::to_string(loc.column) + ": " +
                                msg + "\n";
            }

            size_t skipWs(size_t i, size_t end) const
            {
                while (i < end && std::isspace(static_cast<unsigned char>(m_Src[i])))
                    ++i;
                return i;
            }

            Result<size_t> closeOf(size_t open, size_t end, const char* what) const
            {
                const size_t close = find_matching_brace(m_Src.substr(0, end), open);
                if (close == npos)
                    return fail<size_t>(open, ErrorCode::eParseError, std::string("unterminated '{' of ") + what);
                return Result<size_t>::ok(close);
            }

            // String and char literals and comments are copied as they are.
            size_t copyVerbatim(size_t i, size_t end)
            {
                const char c = m_Src[i];
                size_t     j = i;
                if (c == '\'')
                {
                    j = skip_char_literal(m_Src.substr(0, end), i);
                    if (j == i)
                        return i;
                }
                else if (c == '"')
                {
                    ++j;
                    while (j < end && m_Src[j] != '"')
                        j += (m_Src[j] == '\\') ? 2 : 1;
                    j = std::min(j + 1, end);
                }
                else if (c == '/' && i + 1 < end && m_Src[i + 1] == '/')
                {
                    while (j < end && m_Src[j] != '\n')
                        ++j;
                }
                else if (c == '/' && i + 1 < end && m_Src[i + 1] == '*')
                {
                    const auto e = m_Src.find("*/", i + 2);
                    j            = (e == npos || e + 2 > end) ? end : e + 2;
                }
                else
                {
                    return i;
                }

                m_Result.output.append(m_Src.substr(i, j - i));
                return j;
            }

            Result<void> expandFragment(const Fragment& f, size_t depth)
            {
                return expandRange(f.offset, f.offset + f.text.size(), depth + 1);
            }

            Result<void> expandRange(size_t begin, size_t end, size_t depth)
            {
                if (depth > m_Options.maxNesting)
                    return Result<void>::err(errorAt(begin,
                                                     ErrorCode::eParseError,
                                                     "directive nesting exceeds " +
                                                         std::to_string(m_Options.maxNesting) + " levels"));

                size_t i = begin;
                while (i < end)
                {
                    const size_t v = copyVerbatim(i, end);
                    if (v != i)
                    {
                        i = v;
                        continue;
                    }

                    if (m_Src[i] != '@')
                    {
                        m_Result.output.push_back(m_Src[i]);
                        ++i;
                        continue;
                    }

                    if (i + 1 < end && m_Src[i + 1] == '@')
                    {
                        m_Result.output.push_back('@');
                        i += 2;
                        continue;
                    }

                    // @path
                    size_t                   j = i + 1;
                    std::vector<std::string> segments;
                    while (j < end && Lexer::isIdentStart(m_Src[j]))
                    {
                        size_t k = j;
                        while (k < end && Lexer::isIdentChar(m_Src[k]))
                            ++k;
                        segments.emplace_back(m_Src.substr(j, k - j));
                        j = k;

                        if (j + 2 < end && m_Src[j] == ':' && m_Src[j + 1] == ':' && Lexer::isIdentStart(m_Src[j + 2]))
                            j += 2;
                        else
                            break;
                    }

                    const size_t open = skipWs(j, end);
                    if (segments.empty() || open >= end || (m_Src[open] != '{' && m_Src[open] != '('))
                    {
                        // not a directive
                        const size_t stop = std::max(j, i + 1);
                        m_Result.output.append(m_Src.substr(i, stop - i));
                        i = stop;
                        continue;
                    }

                    auto r = dispatch(i, segments, open, end, depth);
                    if (!r.isOk())
                        return Result<void>::err(r.error());
                    i = r.value();
                }
                return Result<void>::ok();
            }

            Result<size_t>
            dispatch(size_t at, const std::vector<std::string>& segments, size_t open, size_t end, size_t depth)
            {
                const bool brace = m_Src[open] == '{';
                if (segments.size() == 1 && segments[0] == "switch" && brace)
                    return expandSwitch(at, open, end, depth);
                if (segments.size() == 1 && segments[0] == "alias" && brace)
                    return defineAliases(open, end);
                return expandInvocation(at, segments, open, end, depth);
            }

            // @switch { ... }
            Result<size_t> expandSwitch(size_t at, size_t open, size_t end, size_t depth)
            {
                auto c = closeOf(open, end, "@switch");
                if (!c.isOk())
                    return c;
                const size_t close = c.value();
                ++m_Result.switchCount;

                size_t bodyBegin = open + 1;
                size_t bodyEnd   = close;

                // @switch {{ ... }}: result wrapped in braces
                bool wrapped = false;
                {
                    const size_t a = skipWs(bodyBegin, bodyEnd);
                    if (a < bodyEnd && m_Src[a] == '{')
                    {
                        const size_t inner = find_matching_brace(m_Src.substr(0, bodyEnd), a);
                        if (inner != npos && skipWs(inner + 1, bodyEnd) == bodyEnd)
                        {
                            wrapped   = true;
                            bodyBegin = a + 1;
                            bodyEnd   = inner;
                        }
                    }
                }

                const std::string_view body = m_Src.substr(0, bodyEnd);

                Switch sw;
                Lexer  lex {body, bodyBegin};
                while (true)
                {
                    const Token tok = lex.peek();
                    if (tok.kind == Token::eEnd)
                        break;

                    if (sw.hasWildcard())
                    {
                        std::string_view rest = m_Src.substr(tok.offset, bodyEnd - tok.offset);
                        while (!rest.empty() && std::isspace(static_cast<unsigned char>(rest.back())))
                            rest.remove_suffix(1);
                        return fail<size_t>(tok.offset,
                                            ErrorCode::eDefinitionError,
                                            "patterns after a wildcard are ignored: `" + std::string(rest) + "`");
                    }

                    bool       isWildcard = false;
                    Expression cond;
                    if (tok.kind == Token::eIdent && tok.text == "_")
                    {
                        lex.next();
                        isWildcard = true;
                    }
                    else
                    {
                        size_t pos = tok.offset;
                        auto   e   = parse_pattern_at(body, pos, m_Path);
                        if (!e.isOk())
                            return Result<size_t>::forward(e);
                        cond  = std::move(e.value());
                        lex.i = pos;
                    }

                    const Token arrow = lex.next();
                    if (arrow.kind != Token::eFatArrow)
                        return fail<size_t>(arrow.offset,
                                            ErrorCode::eParseError,
                                            "expected '=>' after switch pattern, found " + describe(arrow));

                    const Token lb = lex.next();
                    if (lb.kind != Token::eLBrace)
                        return fail<size_t>(lb.offset,
                                            ErrorCode::eParseError,
                                            "expected '{' to start the arm fragment, found " + describe(lb));

                    auto fc = closeOf(lb.offset, bodyEnd, "switch arm");
                    if (!fc.isOk())
                        return fc;

                    const Fragment frag = trim_fragment(
                        Fragment {m_Src.substr(lb.offset + 1, fc.value() - lb.offset - 1), lb.offset + 1});
                    lex.i = fc.value() + 1;
                    if (lex.peek().kind == Token::eComma)
                        lex.next();

                    auto added = isWildcard ? sw.setWildcard(frag) : sw.addArm(std::move(cond), frag);
                    if (!added.isOk())
                        return fail<size_t>(tok.offset, added.error().code, added.error().message);
                }

                // alias paths in the patterns are looked up only when reached
                auto picked = select_branch(sw, m_Unit.oracle(), m_Scope);
                if (!picked.isOk())
                {
                    const Error& e = picked.error();
                    return fail<size_t>(e.offset.value_or(at), e.code, e.message);
                }

                const Selection& sel = picked.value();
                switch (sel.kind)
                {
                    case Selection::Kind::eArm:
                        note(at,
                             "switch -> arm " + std::to_string(sel.armIndex + 1) + " (" +
                                 sw.arms()[sel.armIndex].condition.to_string() + ")");
                        break;
                    case Selection::Kind::eWildcard:
                        note(at, "switch -> _");
                        break;
                    case Selection::Kind::eNone:
                        note(at, "switch -> no output");
                        break;
                }

                if (wrapped)
                    m_Result.output.push_back('{');
                if (sel.hasOutput())
                {
                    auto r = expandFragment(*sel.fragment, depth);
                    if (!r.isOk())
                        return Result<size_t>::forward(r);
                }
                if (wrapped)
                    m_Result.output.push_back('}');

                return Result<size_t>::ok(close + 1);
            }

            // @alias { [pub] name: { expr }, ... }
            Result<size_t> defineAliases(size_t open, size_t end)
            {
                auto c = closeOf(open, end, "@alias");
                if (!c.isOk())
                    return c;
                const size_t close = c.value();

                Lexer lex {m_Src.substr(0, close), open + 1};
                while (true)
                {
                    Token tok = lex.next();
                    if (tok.kind == Token::eEnd)
                        break;

                    Visibility vis = Visibility::ePrivate;
                    if (tok.kind == Token::eIdent && tok.text == "pub" && lex.peek().kind == Token::eIdent)
                    {
                        vis = Visibility::ePublic;
                        tok = lex.next();
                    }

                    if (tok.kind != Token::eIdent)
                        return fail<size_t>(tok.offset, ErrorCode::eParseError, "expected alias name, found " + describe(tok));

                    const Token name = tok;
                    if (name.text == "switch" || name.text == "alias" || name.text == "self" || name.text == "_")
                        return fail<size_t>(name.offset,
                                            ErrorCode::eDefinitionError,
                                            "`" + name.text + "` is reserved and cannot name an alias");

                    const Token colon = lex.next();
                    if (colon.kind != Token::eColon)
                        return fail<size_t>(colon.offset,
                                            ErrorCode::eParseError,
                                            "expected ':' after alias name, found " + describe(colon));

                    const Token lb = lex.next();
                    if (lb.kind != Token::eLBrace)
                        return fail<size_t>(lb.offset,
                                            ErrorCode::eParseError,
                                            "expected '{' to start the alias condition, found " + describe(lb));

                    auto bc = closeOf(lb.offset, close, "alias condition");
                    if (!bc.isOk())
                        return bc;

                    const std::string_view condText = m_Src.substr(0, bc.value());
                    if ((Lexer {condText, lb.offset + 1}).peek().kind == Token::eEnd)
                        return fail<size_t>(lb.offset,
                                            ErrorCode::eParseError,
                                            "alias `" + name.text + "` requires a condition");

                    size_t pos = lb.offset + 1;
                    auto   e   = parse_expression_at(condText, pos, m_Scope, m_Path);
                    if (!e.isOk())
                        return Result<size_t>::err(e.error());

                    const Token trailing = (Lexer {condText, pos}).peek();
                    if (trailing.kind != Token::eEnd)
                        return fail<size_t>(trailing.offset,
                                            ErrorCode::eParseError,
                                            "expected '}' after alias condition, found " + describe(trailing));

                    auto d = m_Unit.registry().define(name.text, vis, std::move(e.value()));
                    if (!d.isOk())
                        return fail<size_t>(name.offset, d.error().code, d.error().message);

                    const Alias* alias = d.value();
                    ++m_Result.aliasCount;
                    note(name.offset,
                         std::string("alias ") + (alias->isPublic() ? "pub " : "") + alias->name() + " = " +
                             (alias->value() ? "true" : "false") + " (" + alias->body().to_string() + ")");

                    lex.i            = bc.value() + 1;
                    const Token sep  = lex.peek();
                    if (sep.kind == Token::eComma)
                        lex.next();
                    else if (sep.kind != Token::eEnd)
                        return fail<size_t>(sep.offset,
                                            ErrorCode::eParseError,
                                            "expected ',' between aliases, found " + describe(sep));
                }

                return Result<size_t>::ok(close + 1);
            }

            // @path() / @path { ... } / @path { if { ... } else { ... } }
            Result<size_t> expandInvocation(size_t                          at,
                                            const std::vector<std::string>& segments,
                                            size_t                          open,
                                            size_t                          end,
                                            size_t                          depth)
            {
                auto h = m_Scope.resolve(segments);
                if (!h.isOk())
                    return fail<size_t>(at, h.error().code, h.error().message);

                const Alias&      alias = *h.value().alias();
                const std::string path  = join_path(segments);
                ++m_Result.invocationCount;

                if (m_Src[open] == '(')
                {
                    Lexer       lex {m_Src.substr(0, end), open + 1};
                    const Token t = lex.next();
                    if (t.kind != Token::eRParen)
                        return fail<size_t>(t.offset,
                                            ErrorCode::eParseError,
                                            "alias query `@" + path + "()` takes no arguments, found " + describe(t));

                    const bool v = alias.value();
                    m_Result.output += v ? "true" : "false";
                    note(at, "query " + path + " -> " + (v ? "true" : "false"));
                    return Result<size_t>::ok(t.offset + 1);
                }

                auto c = closeOf(open, end, ("@" + path).c_str());
                if (!c.isOk())
                    return c;
                const size_t close = c.value();

                // if { A } else { B }
                std::optional<Fragment> thenFrag;
                std::optional<Fragment> elseFrag;
                {
                    const std::string_view body = m_Src.substr(0, close);
                    Lexer                  lex {body, open + 1};
                    const Token            kwIf = lex.next();
                    const Token            lb1  = lex.next();
                    if (kwIf.kind == Token::eIdent && kwIf.text == "if" && lb1.kind == Token::eLBrace)
                    {
                        const size_t c1 = find_matching_brace(body, lb1.offset);
                        if (c1 != npos)
                        {
                            lex.i              = c1 + 1;
                            const Token kwElse = lex.next();
                            const Token lb2    = lex.next();
                            if (kwElse.kind == Token::eIdent && kwElse.text == "else" && lb2.kind == Token::eLBrace)
                            {
                                const size_t c2 = find_matching_brace(body, lb2.offset);
                                if (c2 != npos)
                                {
                                    lex.i = c2 + 1;
                                    if (lex.next().kind == Token::eEnd)
                                    {
                                        thenFrag = trim_fragment(
                                            Fragment {m_Src.substr(lb1.offset + 1, c1 - lb1.offset - 1), lb1.offset + 1});
                                        elseFrag = trim_fragment(
                                            Fragment {m_Src.substr(lb2.offset + 1, c2 - lb2.offset - 1), lb2.offset + 1});
                                    }
                                }
                            }
                        }
                    }
                }

                std::optional<Fragment> chosen;
                if (thenFrag && elseFrag)
                {
                    chosen = alias_if_else(alias, *thenFrag, *elseFrag);
                    note(at, path + " { if } -> " + (chosen->offset == thenFrag->offset ? "if" : "else"));
                }
                else
                {
                    chosen = alias_guard(alias, trim_fragment(Fragment {m_Src.substr(open + 1, close - open - 1), open + 1}));
                    note(at, path + " { } -> " + (chosen ? "emitted" : "suppressed"));
                }

                if (chosen)
                {
                    auto r = expandFragment(*chosen, depth);
                    if (!r.isOk())
                        return Result<size_t>::err(r.error());
                }
                return Result<size_t>::ok(close + 1);
            }

            CompilationUnit&     m_Unit;
            UnitScope            m_Scope;
            std::string_view     m_Src;
            std::string          m_Path;
            const ExpandOptions& m_Options;
            ExpandResult         m_Result;
        };
    } // namespace

    Result<ExpandResult> expand_unit(CompilationUnit&     unit,
                                     const UnitGraph&     graph,
                                     std::string_view     source,
                                     const ExpandOptions& options)
    {
        Expander ex(unit, graph, source, options);
        auto     r = ex.run();
        if (!r.isOk())
            return Result<ExpandResult>::err(r.error());
        return Result<ExpandResult>::ok(std::move(ex.result()));
    }
} // namespace crossfig
