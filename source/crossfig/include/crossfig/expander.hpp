#pragma once

#include "crossfig/result.hpp"
#include "crossfig/unit.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace crossfig
{
    // ------------------------------------------------------------
    // Template expansion
    //
    // Directives (everything else is copied verbatim):
    //
    //   @alias { [pub] name: { expr }, ... }
    //       Defines aliases in the unit. Produces no output.
    //
    //   @switch { expr => { ... } ... _ => { ... } }
    //   @switch {{ ... }}
    //       Emits the fragment of the first matching arm. The doubled
    //       braces form wraps the result in { }.
    //
    //   @path()                       emits `true` or `false`
    //   @path { ... }                 emits the body if the alias holds
    //   @path { if { ... } else { ... } }
    //
    //   @@                            emits a literal '@'
    //
    // A directive is only recognized when its name is followed by '{' or
    // '('. Text inside "string literals" and comments is never scanned
    // for directives. Fragments of arms that are not selected are neither
    // scanned nor resolved.
    // ------------------------------------------------------------

    struct ExpandOptions
    {
        // Maximum depth of directives nested inside selected fragments.
        size_t maxNesting = 128;
    };

    struct ExpandResult
    {
        std::string output;
        std::string log; // one line per decision

        size_t switchCount     = 0;
        size_t invocationCount = 0;
        size_t aliasCount      = 0; // aliases defined
    };

    // Expands source as the template of unit. Aliases it defines are added
    // to the unit's registry, so units expanded later can reference them.
    Result<ExpandResult> expand_unit(CompilationUnit&     unit,
                                     const UnitGraph&     graph,
                                     std::string_view     source,
                                     const ExpandOptions& options = {});
} // namespace crossfig
