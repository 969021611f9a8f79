#pragma once

#include "crossfig/alias.hpp"
#include "crossfig/expression.hpp"
#include "crossfig/result.hpp"

#include <cstddef>
#include <string_view>

namespace crossfig
{
    // Recursive-descent parser for condition expressions.
    //
    //   expr    := 'not' '(' expr ')'
    //            | 'all' '(' [ expr (',' expr)* [','] ] ')'
    //            | 'any' '(' [ expr (',' expr)* [','] ] ')'
    //            | 'cfg' '(' cfgexpr ')'
    //            | path
    //   cfgexpr := 'not' '(' cfgexpr ')'
    //            | 'all' '(' ... ')' | 'any' '(' ... ')'
    //            | IDENT [ '=' STRING ]
    //   path    := IDENT ( '::' IDENT )*
    //
    // parse_expression resolves paths to aliases while parsing, so an
    // unknown alias is reported at the point of definition. parse_pattern_at
    // leaves them deferred for select_branch to look up on demand.

    inline constexpr size_t kMaxExpressionDepth = 256;

    // Parses one expression starting at pos inside text. On success pos is
    // left at the first token after the expression. Errors point into text
    // and are prefixed with path.
    Result<Expression> parse_expression_at(std::string_view     text,
                                           size_t&              pos,
                                           const AliasResolver& resolver,
                                           std::string_view     path = {});

    // Switch pattern: like parse_expression_at, with every alias path kept
    // as a deferred reference.
    Result<Expression> parse_pattern_at(std::string_view text, size_t& pos, std::string_view path = {});

    // Parses a whole string; trailing tokens are an error.
    Result<Expression>
    parse_expression(std::string_view text, const AliasResolver& resolver, std::string_view path = {});
} // namespace crossfig
