#pragma once

#include <crossfig/config.hpp>
#include <crossfig/expression.hpp>
#include <crossfig/oracle.hpp>

#include <set>
#include <string>
#include <vector>

namespace crossfig::test
{
    // Oracle answering from a set of predicate spellings ("unix",
    // "feature = \"std\"") and recording every lookup it receives.
    class RecordingOracle final : public ConditionOracle
    {
    public:
        explicit RecordingOracle(std::set<std::string> holds = {}) : m_Holds(std::move(holds)) {}

        const std::vector<std::string>& queried() const { return m_Queried; }

    protected:
        bool lookup(const Predicate& predicate) const override
        {
            const auto key = predicate.to_string();
            m_Queried.push_back(key);
            return m_Holds.count(key) != 0;
        }

    private:
        std::set<std::string>            m_Holds;
        mutable std::vector<std::string> m_Queried;
    };

    inline Expression flag(const std::string& name) { return Expression::leaf({name, {}}); }

    inline Expression key_value(const std::string& key, const std::string& value)
    {
        return Expression::leaf({key, value});
    }

    inline ConfigFile make_config(std::vector<std::string> flags, std::vector<std::pair<std::string, std::string>> values = {})
    {
        ConfigFile c;
        for (auto& f : flags)
            c.flags.insert(std::move(f));
        for (auto& kv : values)
            c.values.emplace(std::move(kv.first), std::move(kv.second));
        return c;
    }
} // namespace crossfig::test
