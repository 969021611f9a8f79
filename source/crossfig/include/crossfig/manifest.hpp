#pragma once

#include "crossfig/result.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace crossfig
{
    // ------------------------------------------------------------
    // <project>.vunits
    //
    // Lists the units of one build. Each [unit] block describes one
    // template; paths are relative to the manifest file.
    //
    //   # comment
    //   [unit]
    //   name=foo
    //   input=foo/lib.rs.in
    //   config=foo/foo.vcfg          (optional)
    //   output=out/foo/lib.rs
    //   deps=bar;baz                 (optional, ';' or ',' separated)
    //   defines=feature=std;unix     (optional, same syntax as -D)
    // ------------------------------------------------------------

    struct UnitEntry
    {
        std::string              name;
        std::string              input;
        std::string              config; // empty: no config file
        std::string              output;
        std::vector<std::string> deps;
        std::vector<std::string> defines;
        size_t                   line = 0; // line of the [unit] header
    };

    struct UnitManifest
    {
        std::string            path;
        std::vector<UnitEntry> units;
    };

    // baseDir is prepended to relative paths.
    Result<UnitManifest> parse_units_manifest(std::string_view text, std::string_view path, const std::string& baseDir);
    Result<UnitManifest> load_units_manifest(const std::string& path);

    void split_list(std::string_view s, std::vector<std::string>& out);
} // namespace crossfig
