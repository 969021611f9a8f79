#include "crossfig/alias.hpp"
#include "crossfig/config.hpp"
#include "crossfig/evaluator.hpp"

namespace crossfig
{
    Alias::Alias(std::string                            name,
                 std::string                            unit,
                 Visibility                             visibility,
                 Expression                             body,
                 std::shared_ptr<const ConditionOracle> context) :
        m_Name(std::move(name)),
        m_Unit(std::move(unit)), m_Visibility(visibility), m_Body(std::move(body)), m_Context(std::move(context))
    {}

    bool Alias::value() const { return evaluate(m_Body, *m_Context); }

    AliasHandle Alias::handle(std::string path) const
    {
        AliasHandle h;
        h.m_Alias = this;
        h.m_Path  = std::move(path);
        return h;
    }

    static Switch alias_switch(const Alias& alias, Fragment then, std::optional<Fragment> otherwise)
    {
        return Switch::conditional(Expression::alias_ref(alias.handle(alias.qualifiedName())), then, otherwise);
    }

    std::optional<Fragment> alias_guard(const Alias& alias, Fragment fragment)
    {
        const Switch sw  = alias_switch(alias, fragment, std::nullopt);
        const auto   sel = select_branch(sw, alias.context());
        if (!sel.hasOutput())
            return std::nullopt;
        return *sel.fragment;
    }

    Fragment alias_if_else(const Alias& alias, Fragment then, Fragment otherwise)
    {
        const Switch sw  = alias_switch(alias, then, otherwise);
        const auto   sel = select_branch(sw, alias.context());
        return *sel.fragment;
    }

    AliasRegistry::AliasRegistry(std::string unitName, std::shared_ptr<const ConditionOracle> context) :
        m_UnitName(std::move(unitName)), m_Context(std::move(context))
    {}

    Result<const Alias*> AliasRegistry::define(std::string name, Visibility visibility, Expression body)
    {
        if (!is_identifier(name) || name == "_")
            return Result<const Alias*>::err({ErrorCode::eDefinitionError, "invalid alias name: '" + name + "'"});

        if (!body.isBound())
            return Result<const Alias*>::err(ErrorCode::eDefinitionError,
                                             "alias `" + name + "` references an unresolved path");

        if (m_ByName.find(name) != m_ByName.end())
            return Result<const Alias*>::err(
                {ErrorCode::eDefinitionError, "alias `" + name + "` is defined multiple times in unit `" + m_UnitName + "`"});

        return Result<const Alias*>::ok(&insert(std::move(name), visibility, std::move(body)));
    }

    const Alias& AliasRegistry::insert(std::string name, Visibility visibility, Expression body)
    {
        auto        alias = std::make_unique<Alias>(name, m_UnitName, visibility, std::move(body), m_Context);
        const auto* ptr   = alias.get();
        m_Aliases.push_back(std::move(alias));
        m_ByName.emplace(std::move(name), ptr);
        return *ptr;
    }

    Result<AliasHandle> AliasRegistry::reference(std::string_view name, bool fromOtherUnit) const
    {
        const Alias* alias = find(name);
        if (!alias)
            return Result<AliasHandle>::err({ErrorCode::eResolveError,
                                             "cannot find alias `" + std::string(name) + "` in unit `" + m_UnitName +
                                                 "`"});

        if (fromOtherUnit && !alias->isPublic())
            return Result<AliasHandle>::err(
                {ErrorCode::eResolveError, "alias `" + alias->qualifiedName() + "` is private"});

        return Result<AliasHandle>::ok(alias->handle(fromOtherUnit ? alias->qualifiedName() : alias->name()));
    }

    const Alias* AliasRegistry::find(std::string_view name) const
    {
        auto it = m_ByName.find(std::string(name));
        return it != m_ByName.end() ? it->second : nullptr;
    }

    std::unique_ptr<AliasRegistry> AliasRegistry::make_builtins()
    {
        auto r = std::make_unique<AliasRegistry>(std::string(kBuiltinUnit), make_config_oracle({}));
        r->insert("enabled", Visibility::ePublic, Expression::always());
        r->insert("disabled", Visibility::ePublic, Expression::never());
        return r;
    }

    const AliasRegistry& builtin_aliases()
    {
        static const std::unique_ptr<AliasRegistry> registry = AliasRegistry::make_builtins();
        return *registry;
    }

    std::string join_path(const std::vector<std::string>& path)
    {
        std::string s;
        for (size_t i = 0; i < path.size(); ++i)
        {
            if (i)
                s += "::";
            s += path[i];
        }
        return s;
    }

    Result<AliasHandle> RegistryResolver::resolve(const std::vector<std::string>& path) const
    {
        if (path.size() == 1)
        {
            if (m_Registry && m_Registry->find(path[0]))
                return m_Registry->reference(path[0], false);
            if (builtin_aliases().find(path[0]))
                return builtin_aliases().reference(path[0], true);
            return Result<AliasHandle>::err({ErrorCode::eResolveError, "cannot find alias `" + path[0] + "` in this scope"});
        }

        if (path.size() == 2 && path[0] == kBuiltinUnit)
            return builtin_aliases().reference(path[1], true);

        return Result<AliasHandle>::err({ErrorCode::eResolveError, "cannot resolve alias path `" + join_path(path) + "`"});
    }
} // namespace crossfig
