#pragma once

#include "crossfig/expression.hpp"
#include "crossfig/oracle.hpp"
#include "crossfig/result.hpp"
#include "crossfig/switch.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace crossfig
{
    enum class Visibility : uint8_t
    {
        ePrivate = 0,
        ePublic  = 1
    };

    // Name of the unit owning the built-in aliases.
    inline constexpr std::string_view kBuiltinUnit = "crossfig";

    // ------------------------------------------------------------
    // Alias
    //
    // A named expression bound to the configuration of the unit that
    // defined it. The oracle is captured at definition, so the value is
    // the same from whichever unit the alias is referenced.
    // ------------------------------------------------------------
    class Alias
    {
    public:
        Alias(std::string                            name,
              std::string                            unit,
              Visibility                             visibility,
              Expression                             body,
              std::shared_ptr<const ConditionOracle> context);

        const std::string&     name() const { return m_Name; }
        const std::string&     unit() const { return m_Unit; }
        std::string            qualifiedName() const { return m_Unit + "::" + m_Name; }
        Visibility             visibility() const { return m_Visibility; }
        bool                   isPublic() const { return m_Visibility == Visibility::ePublic; }
        const Expression&      body() const { return m_Body; }
        const ConditionOracle& context() const { return *m_Context; }

        // Call shape 1: the boolean value.
        bool value() const;

        // Bound reference to this alias, spelled as path.
        AliasHandle handle(std::string path) const;

    private:
        std::string                            m_Name;
        std::string                            m_Unit;
        Visibility                             m_Visibility;
        Expression                             m_Body;
        std::shared_ptr<const ConditionOracle> m_Context;
    };

    // Call shape 2: fragment when the alias holds, nothing otherwise.
    std::optional<Fragment> alias_guard(const Alias& alias, Fragment fragment);

    // Call shape 3: then when the alias holds, otherwise the else fragment.
    Fragment alias_if_else(const Alias& alias, Fragment then, Fragment otherwise);

    // ------------------------------------------------------------
    // AliasRegistry
    //
    // The aliases one unit defines, in definition order. A body may only
    // reference aliases defined before it, which rules out cycles; its
    // references are therefore always bound.
    // ------------------------------------------------------------
    class AliasRegistry
    {
    public:
        AliasRegistry(std::string unitName, std::shared_ptr<const ConditionOracle> context);

        AliasRegistry(const AliasRegistry&)            = delete;
        AliasRegistry& operator=(const AliasRegistry&) = delete;

        Result<const Alias*> define(std::string name, Visibility visibility, Expression body);

        // fromOtherUnit: private aliases are only visible to their own unit.
        Result<AliasHandle> reference(std::string_view name, bool fromOtherUnit) const;

        const Alias* find(std::string_view name) const;

        const std::string&                         unitName() const { return m_UnitName; }
        const std::vector<std::unique_ptr<Alias>>& aliases() const { return m_Aliases; }

        static std::unique_ptr<AliasRegistry> make_builtins();

    private:
        const Alias& insert(std::string name, Visibility visibility, Expression body);

        std::string                                   m_UnitName;
        std::shared_ptr<const ConditionOracle>        m_Context;
        std::vector<std::unique_ptr<Alias>>           m_Aliases;
        std::unordered_map<std::string, const Alias*> m_ByName;
    };

    // crossfig::enabled (always true) and crossfig::disabled (always false).
    const AliasRegistry& builtin_aliases();

    // ------------------------------------------------------------
    // AliasResolver
    //
    // Turns a path (`name` or `unit::name`) into a bound handle, either
    // while an expression is parsed or when a deferred reference is first
    // evaluated.
    // ------------------------------------------------------------
    class AliasResolver
    {
    public:
        virtual ~AliasResolver() = default;

        virtual Result<AliasHandle> resolve(const std::vector<std::string>& path) const = 0;
    };

    std::string join_path(const std::vector<std::string>& path);

    // Resolves `name` in one registry (when given) then the built-ins, and
    // `crossfig::name` in the built-ins.
    class RegistryResolver : public AliasResolver
    {
    public:
        explicit RegistryResolver(const AliasRegistry* registry = nullptr) : m_Registry(registry) {}

        Result<AliasHandle> resolve(const std::vector<std::string>& path) const override;

    private:
        const AliasRegistry* m_Registry;
    };
} // namespace crossfig
