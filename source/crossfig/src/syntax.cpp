#include "crossfig/syntax.hpp"

#include <cctype>

namespace crossfig
{
    const char* token_kind_name(Token::Kind kind)
    {
        switch (kind)
        {
            case Token::eEnd:
                return "end of input";
            case Token::eIdent:
                return "identifier";
            case Token::eString:
                return "string literal";
            case Token::eLParen:
                return "'('";
            case Token::eRParen:
                return "')'";
            case Token::eLBrace:
                return "'{'";
            case Token::eRBrace:
                return "'}'";
            case Token::eComma:
                return "','";
            case Token::eColon:
                return "':'";
            case Token::ePathSep:
                return "'::'";
            case Token::eEq:
                return "'='";
            case Token::eFatArrow:
                return "'=>'";
            case Token::eInvalid:
                return "invalid character";
        }
        return "token";
    }

    bool Lexer::isIdentStart(char c) { return (std::isalpha(static_cast<unsigned char>(c)) != 0) || c == '_'; }
    bool Lexer::isIdentChar(char c) { return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_'; }

    void Lexer::skipWsAndComments()
    {
        while (i < s.size())
        {
            if (std::isspace(static_cast<unsigned char>(s[i])) != 0)
            {
                ++i;
                continue;
            }
            if (s[i] == '/' && i + 1 < s.size() && s[i + 1] == '/')
            {
                while (i < s.size() && s[i] != '\n')
                    ++i;
                continue;
            }
            if (s[i] == '/' && i + 1 < s.size() && s[i + 1] == '*')
            {
                const auto end = s.find("*/", i + 2);
                i              = (end == std::string_view::npos) ? s.size() : end + 2;
                continue;
            }
            break;
        }
    }

    Token Lexer::next()
    {
        skipWsAndComments();
        if (i >= s.size())
            return Token {Token::eEnd, {}, s.size()};

        const size_t start = i;
        const char   c     = s[i];

        auto single = [&](Token::Kind k) {
            ++i;
            return Token {k, std::string(1, c), start};
        };

        switch (c)
        {
            case '(':
                return single(Token::eLParen);
            case ')':
                return single(Token::eRParen);
            case '{':
                return single(Token::eLBrace);
            case '}':
                return single(Token::eRBrace);
            case ',':
                return single(Token::eComma);
            default:
                break;
        }

        if (c == ':')
        {
            if (i + 1 < s.size() && s[i + 1] == ':')
            {
                i += 2;
                return Token {Token::ePathSep, "::", start};
            }
            return single(Token::eColon);
        }

        if (c == '=')
        {
            if (i + 1 < s.size() && s[i + 1] == '>')
            {
                i += 2;
                return Token {Token::eFatArrow, "=>", start};
            }
            return single(Token::eEq);
        }

        // string literal
        if (c == '"')
        {
            ++i;
            std::string value;
            while (i < s.size() && s[i] != '"')
            {
                if (s[i] == '\\' && i + 1 < s.size())
                    ++i;
                value.push_back(s[i]);
                ++i;
            }
            if (i >= s.size())
            {
                i = start + 1;
                return Token {Token::eInvalid, "unterminated string literal", start};
            }
            ++i; // closing quote
            return Token {Token::eString, std::move(value), start};
        }

        // ident
        if (isIdentStart(c))
        {
            ++i;
            while (i < s.size() && isIdentChar(s[i]))
                ++i;
            return Token {Token::eIdent, std::string(s.substr(start, i - start)), start};
        }

        // unknown char
        ++i;
        return Token {Token::eInvalid, std::string(1, c), start};
    }

    Token Lexer::peek() const
    {
        Lexer copy = *this;
        return copy.next();
    }

    size_t skip_char_literal(std::string_view text, size_t quote)
    {
        if (quote + 2 >= text.size() || text[quote] != '\'')
            return quote;

        size_t i = quote + 1;
        if (text[i] == '\\')
        {
            // '\n', '\'', '\x7f', '\u{1F600}'
            i += 2;
            while (i < text.size() && i - quote <= kMaxEscapeLength && text[i] != '\'' && text[i] != '\n')
                ++i;
        }
        else
        {
            const auto lead = static_cast<unsigned char>(text[i]);
            if (lead == '\'' || lead == '\n')
                return quote;

            // one UTF-8 encoded code point
            if (lead >= 0xF0)
                i += 4;
            else if (lead >= 0xE0)
                i += 3;
            else if (lead >= 0xC0)
                i += 2;
            else
                i += 1;
        }

        if (i < text.size() && text[i] == '\'')
            return i + 1;
        return quote; // a lifetime such as 'a, or a stray quote
    }

    size_t find_matching_brace(std::string_view text, size_t open)
    {
        if (open >= text.size() || text[open] != '{')
            return std::string_view::npos;

        size_t depth = 0;
        size_t i     = open;
        while (i < text.size())
        {
            const char c = text[i];

            if (c == '\'')
            {
                const size_t after = skip_char_literal(text, i);
                if (after != i)
                {
                    i = after;
                    continue;
                }
            }

            if (c == '"')
            {
                ++i;
                while (i < text.size() && text[i] != '"')
                {
                    if (text[i] == '\\')
                        ++i;
                    ++i;
                }
                ++i;
                continue;
            }

            if (c == '/' && i + 1 < text.size() && text[i + 1] == '/')
            {
                while (i < text.size() && text[i] != '\n')
                    ++i;
                continue;
            }

            if (c == '/' && i + 1 < text.size() && text[i + 1] == '*')
            {
                const auto end = text.find("*/", i + 2);
                if (end == std::string_view::npos)
                    return std::string_view::npos;
                i = end + 2;
                continue;
            }

            if (c == '{')
            {
                ++depth;
            }
            else if (c == '}')
            {
                --depth;
                if (depth == 0)
                    return i;
            }
            ++i;
        }
        return std::string_view::npos;
    }
} // namespace crossfig
