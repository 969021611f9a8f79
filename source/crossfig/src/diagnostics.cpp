#include "crossfig/diagnostics.hpp"

#include <algorithm>

namespace crossfig
{
    const char* error_code_name(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::eOk:
                return "ok";
            case ErrorCode::eIO:
                return "io";
            case ErrorCode::eInvalidArgument:
                return "invalid-argument";
            case ErrorCode::eParseError:
                return "parse";
            case ErrorCode::eResolveError:
                return "resolve";
            case ErrorCode::eDefinitionError:
                return "definition";
            case ErrorCode::eDependencyError:
                return "dependency";
        }
        return "unknown";
    }

    SourceLocation locate(std::string_view text, size_t offset)
    {
        SourceLocation loc;
        offset = std::min(offset, text.size());
        for (size_t i = 0; i < offset; ++i)
        {
            if (text[i] == '\n')
            {
                ++loc.line;
                loc.column = 1;
            }
            else
            {
                ++loc.column;
            }
        }
        return loc;
    }

    std::string
    format_diagnostic(std::string_view path, std::string_view text, size_t offset, std::string_view message)
    {
        offset                   = std::min(offset, text.size());
        const SourceLocation loc = locate(text, offset);

        std::string out;
        out += path.empty() ? std::string_view("<input>") : path;
        out += ":" + std::to_string(loc.line) + ":" + std::to_string(loc.column) + ": ";
        out += message;

        size_t lineStart = offset;
        while (lineStart > 0 && text[lineStart - 1] != '\n')
            --lineStart;
        size_t lineEnd = text.find('\n', offset);
        if (lineEnd == std::string_view::npos)
            lineEnd = text.size();

        const std::string_view line = text.substr(lineStart, lineEnd - lineStart);
        if (line.empty())
            return out;

        out += "\n    ";
        out += line;
        out += "\n    ";
        for (size_t i = lineStart; i < offset; ++i)
            out.push_back(text[i] == '\t' ? '\t' : ' ');
        out.push_back('^');
        return out;
    }
} // namespace crossfig
