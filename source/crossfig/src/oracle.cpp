#include "crossfig/oracle.hpp"

namespace crossfig
{
    std::string Predicate::to_string() const
    {
        if (!value)
            return name;
        return name + " = \"" + *value + "\"";
    }

    bool operator==(const Predicate& a, const Predicate& b) { return a.name == b.name && a.value == b.value; }

    bool ConditionOracle::query(const Predicate& predicate) const
    {
        if (predicate.isConstant())
            return predicate.name == "true";
        return lookup(predicate);
    }

    ConfigOracle::ConfigOracle(ConfigFile config) :
        m_Config(std::move(config)), m_Fingerprint(config_fingerprint(m_Config))
    {}

    bool ConfigOracle::lookup(const Predicate& predicate) const
    {
        if (predicate.value)
            return m_Config.hasValue(predicate.name, *predicate.value);
        return m_Config.hasFlag(predicate.name);
    }

    std::shared_ptr<const ConfigOracle> make_config_oracle(ConfigFile config)
    {
        return std::make_shared<const ConfigOracle>(std::move(config));
    }
} // namespace crossfig
