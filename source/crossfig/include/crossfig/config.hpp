#pragma once

#include "crossfig/result.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>

namespace crossfig
{
    // ------------------------------------------------------------
    // <unit>.vcfg
    //
    // A tiny, line-oriented text format holding the configuration
    // snapshot one unit is built with.
    //
    // Lines:
    //   - Comments start with '#'
    //   - Flag (predicate cfg(NAME) is true):
    //       flag <NAME>
    //     Examples:
    //       flag unix
    //       flag debug_assertions
    //
    //   - Key/value (predicate cfg(KEY = "VALUE") is true). A key may be
    //     set several times; each value matches:
    //       set <KEY>=<VALUE>
    //     Examples:
    //       set feature=std
    //       set feature="multi_threading"
    //       set target_os=linux
    //
    // Keys that are never set evaluate to false for every value.
    // ------------------------------------------------------------

    struct ConfigFile
    {
        std::set<std::string, std::less<>>                   flags;
        std::multimap<std::string, std::string, std::less<>> values; // KEY -> VALUE (unquoted)

        bool hasFlag(std::string_view name) const;
        bool hasValue(std::string_view key, std::string_view value) const;

        // Adds every flag and value of other.
        void merge(const ConfigFile& other);
    };

    Result<ConfigFile> parse_config_vcfg(std::string_view text, std::string_view path = {});
    Result<ConfigFile> load_config_vcfg(const std::string& filePath);

    // Applies a command line define: "NAME" sets a flag, "KEY=VALUE" a value.
    Result<void> apply_define(ConfigFile& config, std::string_view define);

    // Stable 64-bit fingerprint of the snapshot (xxHash64 over the sorted
    // canonical serialization). Identical snapshots hash identically.
    uint64_t config_fingerprint(const ConfigFile& config);

    bool is_identifier(std::string_view s);
} // namespace crossfig
