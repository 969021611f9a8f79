#include "crossfig/switch.hpp"
#include "crossfig/evaluator.hpp"

#include <string>

namespace crossfig
{
    Switch Switch::conditional(Expression condition, Fragment then, std::optional<Fragment> otherwise)
    {
        Switch sw;
        sw.m_Arms.push_back(SwitchArm {std::move(condition), then});
        sw.m_Wildcard = otherwise;
        return sw;
    }

    Result<void> Switch::addArm(Expression condition, Fragment fragment)
    {
        if (m_Wildcard)
            return Result<void>::err({ErrorCode::eDefinitionError,
                                      "patterns after a wildcard are ignored: `" + condition.to_string() + "`"});

        m_Arms.push_back(SwitchArm {std::move(condition), fragment});
        return Result<void>::ok();
    }

    Result<void> Switch::setWildcard(Fragment fragment)
    {
        if (m_Wildcard)
            return Result<void>::err({ErrorCode::eDefinitionError, "patterns after a wildcard are ignored: `_`"});

        m_Wildcard = fragment;
        return Result<void>::ok();
    }

    namespace
    {
        Selection arm_selection(const Switch& sw, size_t i)
        {
            Selection sel;
            sel.kind     = Selection::Kind::eArm;
            sel.armIndex = i;
            sel.fragment = &sw.arms()[i].fragment;
            return sel;
        }

        Selection fallback_selection(const Switch& sw)
        {
            Selection sel;
            if (sw.wildcard())
            {
                sel.kind     = Selection::Kind::eWildcard;
                sel.armIndex = sw.arms().size();
                sel.fragment = &*sw.wildcard();
            }
            return sel;
        }
    } // namespace

    Selection select_branch(const Switch& sw, const ConditionOracle& oracle)
    {
        const auto& arms = sw.arms();
        for (size_t i = 0; i < arms.size(); ++i)
        {
            if (evaluate(arms[i].condition, oracle))
                return arm_selection(sw, i);
        }
        return fallback_selection(sw);
    }

    Result<Selection> select_branch(const Switch& sw, const ConditionOracle& oracle, const AliasResolver& resolver)
    {
        const auto& arms = sw.arms();
        for (size_t i = 0; i < arms.size(); ++i)
        {
            auto hit = evaluate(arms[i].condition, oracle, resolver);
            if (!hit.isOk())
                return Result<Selection>::forward(hit);
            if (hit.value())
                return Result<Selection>::ok(arm_selection(sw, i));
        }
        return Result<Selection>::ok(fallback_selection(sw));
    }
} // namespace crossfig
