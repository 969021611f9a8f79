#pragma once

#include "crossfig/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace crossfig
{
    // 1-based line/column of a byte offset inside a source text.
    struct SourceLocation
    {
        uint32_t line   = 1;
        uint32_t column = 1;
    };

    SourceLocation locate(std::string_view text, size_t offset);

    // Formats:
    //
    //   path:line:col: message
    //       <offending source line>
    //       ^
    std::string format_diagnostic(std::string_view path,
                                  std::string_view text,
                                  size_t           offset,
                                  std::string_view message);

    inline Error
    source_error(ErrorCode code, std::string_view path, std::string_view text, size_t offset, std::string_view message)
    {
        return {code, format_diagnostic(path, text, offset, message)};
    }
} // namespace crossfig
