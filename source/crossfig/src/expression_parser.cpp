#include "crossfig/expression_parser.hpp"
#include "crossfig/diagnostics.hpp"
#include "crossfig/syntax.hpp"

#include <string>
#include <vector>

namespace crossfig
{
    namespace
    {
        struct Parser
        {
            Lexer                lex;
            Token                cur;
            std::string_view     path;
            const AliasResolver* resolver; // null: paths stay deferred
            size_t               depth = 0;

            Parser(std::string_view text, size_t pos, std::string_view p, const AliasResolver* r) :
                lex {Lexer {text, pos}}, path(p), resolver(r)
            {
                cur = lex.next();
            }

            void consume() { cur = lex.next(); }

            Error errorAt(size_t offset, ErrorCode code, const std::string& msg) const
            {
                return source_error(code, path, lex.s, offset, msg);
            }

            Error unexpected(const std::string& expected) const
            {
                if (cur.kind == Token::eInvalid)
                {
                    const std::string what =
                        cur.text.size() == 1 ? "unexpected character '" + cur.text + "'" : cur.text;
                    return errorAt(cur.offset, ErrorCode::eParseError, what);
                }
                return errorAt(cur.offset,
                               ErrorCode::eParseError,
                               "expected " + expected + ", found " + token_kind_name(cur.kind) +
                                   (cur.kind == Token::eIdent ? " `" + cur.text + "`" : std::string()));
            }

            bool atOperator(std::string_view name) const
            {
                return cur.kind == Token::eIdent && cur.text == name && lex.peek().kind == Token::eLParen;
            }

            Result<void> expect(Token::Kind k)
            {
                if (cur.kind != k)
                    return Result<void>::err(unexpected(token_kind_name(k)));
                consume();
                return Result<void>::ok();
            }

            // Parses "( item (, item)* [,] )" after the operator name.
            template<typename F>
            Result<std::vector<Expression>> parseList(F&& item)
            {
                auto open = expect(Token::eLParen);
                if (!open.isOk())
                    return Result<std::vector<Expression>>::err(open.error());

                std::vector<Expression> items;
                while (cur.kind != Token::eRParen)
                {
                    auto r = item();
                    if (!r.isOk())
                        return Result<std::vector<Expression>>::err(r.error());
                    items.push_back(std::move(r.value()));

                    if (cur.kind == Token::eComma)
                    {
                        consume();
                        continue;
                    }
                    if (cur.kind != Token::eRParen)
                        return Result<std::vector<Expression>>::err(unexpected("',' or ')'"));
                }
                consume(); // ')'
                return Result<std::vector<Expression>>::ok(std::move(items));
            }

            Result<Expression> parseNot(bool inCfg)
            {
                const size_t at = cur.offset;
                consume(); // not
                auto ops = parseList([&] { return inCfg ? parseCfgExpr() : parseExpr(); });
                if (!ops.isOk())
                    return Result<Expression>::err(ops.error());
                if (ops.value().size() != 1)
                    return Result<Expression>::err(errorAt(at,
                                                           ErrorCode::eParseError,
                                                           "not() takes exactly one operand, found " +
                                                               std::to_string(ops.value().size())));
                return Result<Expression>::ok(Expression::negation(std::move(ops.value().front())));
            }

            Result<Expression> parseVariadic(bool isAll, bool inCfg)
            {
                consume(); // all / any
                auto ops = parseList([&] { return inCfg ? parseCfgExpr() : parseExpr(); });
                if (!ops.isOk())
                    return Result<Expression>::err(ops.error());
                return Result<Expression>::ok(isAll ? Expression::all(std::move(ops.value())) :
                                                      Expression::any(std::move(ops.value())));
            }

            Result<Expression> enter()
            {
                if (++depth > kMaxExpressionDepth)
                    return Result<Expression>::err(errorAt(cur.offset,
                                                           ErrorCode::eParseError,
                                                           "expression nesting exceeds " +
                                                               std::to_string(kMaxExpressionDepth) + " levels"));
                return Result<Expression>::ok({});
            }

            // cfgexpr := not(..) | all(..) | any(..) | IDENT [ '=' STRING ]
            Result<Expression> parseCfgExpr()
            {
                auto guard = enter();
                if (!guard.isOk())
                    return guard;
                auto r = parseCfgExprInner();
                --depth;
                return r;
            }

            Result<Expression> parseCfgExprInner()
            {
                if (atOperator("not"))
                    return parseNot(true);
                if (atOperator("all"))
                    return parseVariadic(true, true);
                if (atOperator("any"))
                    return parseVariadic(false, true);

                if (cur.kind != Token::eIdent)
                    return Result<Expression>::err(unexpected("predicate"));
                if (cur.text == "_")
                    return Result<Expression>::err(
                        errorAt(cur.offset, ErrorCode::eParseError, "`_` is not a valid predicate name"));
                if (lex.peek().kind == Token::eLParen)
                    return Result<Expression>::err(
                        errorAt(cur.offset, ErrorCode::eParseError, "unknown cfg operator `" + cur.text + "(...)`"));

                Predicate p;
                p.name = cur.text;
                consume();

                if (cur.kind == Token::ePathSep)
                    return Result<Expression>::err(
                        errorAt(cur.offset, ErrorCode::eParseError, "alias paths are not allowed inside cfg(...)"));

                if (cur.kind == Token::eEq)
                {
                    consume();
                    if (cur.kind != Token::eString)
                        return Result<Expression>::err(unexpected("string literal"));
                    p.value = cur.text;
                    consume();
                }
                return Result<Expression>::ok(Expression::leaf(std::move(p)));
            }

            Result<Expression> parseExpr()
            {
                auto guard = enter();
                if (!guard.isOk())
                    return guard;
                auto r = parseExprInner();
                --depth;
                return r;
            }

            Result<Expression> parseExprInner()
            {
                if (atOperator("not"))
                    return parseNot(false);
                if (atOperator("all"))
                    return parseVariadic(true, false);
                if (atOperator("any"))
                    return parseVariadic(false, false);

                if (atOperator("cfg"))
                {
                    const size_t at = cur.offset;
                    consume(); // cfg
                    auto ops = parseList([&] { return parseCfgExpr(); });
                    if (!ops.isOk())
                        return Result<Expression>::err(ops.error());
                    if (ops.value().size() != 1)
                        return Result<Expression>::err(
                            errorAt(at, ErrorCode::eParseError, "cfg() takes exactly one predicate"));
                    return Result<Expression>::ok(std::move(ops.value().front()));
                }

                if (cur.kind != Token::eIdent)
                    return Result<Expression>::err(unexpected("condition"));

                if (cur.text == "_")
                    return Result<Expression>::err(errorAt(
                        cur.offset, ErrorCode::eParseError, "wildcard `_` is only valid as a whole switch pattern"));

                if (lex.peek().kind == Token::eLParen)
                    return Result<Expression>::err(
                        errorAt(cur.offset, ErrorCode::eParseError, "unknown operator `" + cur.text + "(...)`"));

                // alias path
                const size_t             at = cur.offset;
                std::vector<std::string> segments;
                segments.push_back(cur.text);
                consume();
                while (cur.kind == Token::ePathSep)
                {
                    consume();
                    if (cur.kind != Token::eIdent)
                        return Result<Expression>::err(unexpected("identifier after '::'"));
                    segments.push_back(cur.text);
                    consume();
                }

                if (!resolver)
                    return Result<Expression>::ok(Expression::alias_ref(AliasHandle::deferred(std::move(segments), at)));

                auto h = resolver->resolve(segments);
                if (!h.isOk())
                    return Result<Expression>::err(errorAt(at, h.error().code, h.error().message));
                return Result<Expression>::ok(Expression::alias_ref(std::move(h.value())));
            }
        };
    } // namespace

    Result<Expression>
    parse_expression_at(std::string_view text, size_t& pos, const AliasResolver& resolver, std::string_view path)
    {
        Parser p(text, pos, path, &resolver);
        auto   r = p.parseExpr();
        if (!r.isOk())
            return r;

        pos = p.cur.offset;
        return r;
    }

    Result<Expression> parse_expression(std::string_view text, const AliasResolver& resolver, std::string_view path)
    {
        Parser p(text, 0, path, &resolver);
        if (p.cur.kind == Token::eEnd)
            return Result<Expression>::err(p.errorAt(0, ErrorCode::eParseError, "empty expression"));

        auto r = p.parseExpr();
        if (!r.isOk())
            return r;

        // Ensure full consumption
        if (p.cur.kind != Token::eEnd)
            return Result<Expression>::err(p.unexpected("end of expression"));

        return r;
    }

    Result<Expression> parse_pattern_at(std::string_view text, size_t& pos, std::string_view path)
    {
        Parser p(text, pos, path, nullptr);
        auto   r = p.parseExpr();
        if (!r.isOk())
            return r;

        pos = p.cur.offset;
        return r;
    }
} // namespace crossfig
