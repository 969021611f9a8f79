#pragma once

#include "crossfig/config.hpp"
#include "crossfig/expander.hpp"
#include "crossfig/manifest.hpp"
#include "crossfig/result.hpp"
#include "crossfig/unit.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace crossfig
{
    struct UnitSource
    {
        std::string              name;
        std::string              virtualPath; // used in diagnostics
        std::string              sourceText;
        ConfigFile               config;
        std::vector<std::string> deps;
    };

    struct BuildRequest
    {
        std::vector<UnitSource> units;
        ExpandOptions           options;
    };

    struct UnitOutput
    {
        std::string name;
        std::string virtualPath;
        std::string text;
        std::string log;

        uint64_t configHash  = 0; // fingerprint of the unit configuration
        uint64_t contentHash = 0; // xxHash64 of text

        size_t switchCount     = 0;
        size_t invocationCount = 0;
        size_t aliasCount      = 0;
    };

    struct BuildResult
    {
        UnitGraph               graph;   // units with the aliases they defined
        std::vector<UnitOutput> outputs; // dependency order, leaves first

        const UnitOutput* find(std::string_view name) const;
    };

    // Expands every unit after the units it depends on.
    Result<BuildResult> build_units(const BuildRequest& req);

    // Reads the inputs and config files a manifest names. The defines of an
    // entry are applied on top of its config file.
    Result<BuildRequest> make_build_request(const UnitManifest& manifest);
} // namespace crossfig
