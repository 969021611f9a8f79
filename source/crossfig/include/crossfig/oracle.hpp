#pragma once

#include "crossfig/config.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace crossfig
{
    // A primitive named condition: cfg(name) or cfg(name = "value").
    // The names "true" and "false" (without value) are constants.
    struct Predicate
    {
        std::string                name;
        std::optional<std::string> value;

        bool isConstant() const { return !value && (name == "true" || name == "false"); }

        std::string to_string() const;
    };

    bool operator==(const Predicate& a, const Predicate& b);

    // ------------------------------------------------------------
    // ConditionOracle
    //
    // Answers whether a primitive predicate holds for one unit. The
    // answers never change during a build run.
    // ------------------------------------------------------------
    class ConditionOracle
    {
    public:
        virtual ~ConditionOracle() = default;

        // Constants are answered here and never reach lookup().
        bool query(const Predicate& predicate) const;

    protected:
        virtual bool lookup(const Predicate& predicate) const = 0;
    };

    // Oracle backed by an immutable configuration snapshot.
    class ConfigOracle final : public ConditionOracle
    {
    public:
        explicit ConfigOracle(ConfigFile config);

        const ConfigFile& config() const { return m_Config; }
        uint64_t          fingerprint() const { return m_Fingerprint; }

    protected:
        bool lookup(const Predicate& predicate) const override;

    private:
        ConfigFile m_Config;
        uint64_t   m_Fingerprint = 0;
    };

    std::shared_ptr<const ConfigOracle> make_config_oracle(ConfigFile config);
} // namespace crossfig
