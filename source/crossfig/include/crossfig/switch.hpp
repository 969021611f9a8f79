#pragma once

#include "crossfig/expression.hpp"
#include "crossfig/oracle.hpp"
#include "crossfig/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace crossfig
{
    class AliasResolver;

    // Opaque payload of a switch arm. The selector never looks inside; the
    // text is only handed on once the arm has been chosen.
    struct Fragment
    {
        std::string_view text;
        size_t           offset = 0; // position of text inside its unit source (diagnostics)
    };

    struct SwitchArm
    {
        Expression condition;
        Fragment   fragment;
    };

    // ------------------------------------------------------------
    // Switch
    //
    // Ordered (condition => fragment) arms with an optional trailing
    // wildcard. The wildcard is terminal: adding anything after it is a
    // definition error.
    // ------------------------------------------------------------
    class Switch
    {
    public:
        Switch() = default;

        // Two-arm form: condition => then, _ => otherwise (when given).
        static Switch conditional(Expression condition, Fragment then, std::optional<Fragment> otherwise = std::nullopt);

        Result<void> addArm(Expression condition, Fragment fragment);
        Result<void> setWildcard(Fragment fragment);

        bool                           empty() const { return m_Arms.empty() && !m_Wildcard; }
        bool                           hasWildcard() const { return m_Wildcard.has_value(); }
        const std::vector<SwitchArm>&  arms() const { return m_Arms; }
        const std::optional<Fragment>& wildcard() const { return m_Wildcard; }

    private:
        std::vector<SwitchArm>  m_Arms;
        std::optional<Fragment> m_Wildcard;
    };

    struct Selection
    {
        enum class Kind : uint8_t
        {
            eNone = 0,
            eArm,
            eWildcard
        };

        Kind            kind     = Kind::eNone;
        size_t          armIndex = 0;
        const Fragment* fragment = nullptr; // points into the Switch; null when nothing matched

        bool hasOutput() const { return fragment != nullptr; }
    };

    // Tries the arms top to bottom and commits to the first true one. Arms
    // after it, and the wildcard, are not evaluated. No match and no
    // wildcard selects nothing.
    Selection select_branch(const Switch& sw, const ConditionOracle& oracle);

    // Same, for arms whose patterns hold deferred alias paths. A path is
    // looked up only when its arm is tried and evaluation reaches it.
    Result<Selection> select_branch(const Switch& sw, const ConditionOracle& oracle, const AliasResolver& resolver);
} // namespace crossfig
