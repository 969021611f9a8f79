#pragma once

#include "crossfig/result.hpp"

#include <string>
#include <string_view>

namespace crossfig
{
    Result<std::string> read_text_file(const std::string& path);

    // Writes to a temp file next to path, then renames over it. Parent
    // directories are created.
    Result<void> write_text_file(const std::string& path, std::string_view text);

    // Leaves path untouched when its content hashes (xxHash64) the same as
    // text. Returns whether the file was written.
    Result<bool> write_text_file_if_changed(const std::string& path, std::string_view text);
} // namespace crossfig
