#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace crossfig
{
    struct Token
    {
        enum Kind
        {
            eEnd,
            eIdent,
            eString,
            eLParen,
            eRParen,
            eLBrace,
            eRBrace,
            eComma,
            eColon,
            ePathSep,  // ::
            eEq,       // =
            eFatArrow, // =>
            eInvalid,
        } kind = eEnd;

        std::string text;       // identifier name or unescaped string contents
        size_t      offset = 0; // byte offset of the token start
    };

    const char* token_kind_name(Token::Kind kind);

    // Tokenizer for directive headers: expressions, alias lists, switch
    // patterns. Whitespace and // or /* */ comments are skipped.
    struct Lexer
    {
        std::string_view s;
        size_t           i = 0;

        static bool isIdentStart(char c);
        static bool isIdentChar(char c);

        void  skipWsAndComments();
        Token next();
        Token peek() const;
    };

    // Longest escape accepted inside a char literal: \u{10FFFF}.
    inline constexpr size_t kMaxEscapeLength = 10;

    // Given the offset of a '\'', returns the offset just past the char
    // literal starting there, or quote itself when it does not start one
    // (a lifetime such as 'a).
    size_t skip_char_literal(std::string_view text, size_t quote);

    // Given the offset of a '{', returns the offset of its matching '}', or
    // npos when unbalanced. Braces inside string literals, char literals
    // and comments do not count.
    size_t find_matching_brace(std::string_view text, size_t open);
} // namespace crossfig
