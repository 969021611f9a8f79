#include "crossfig/unit.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <unordered_map>

namespace crossfig
{
    CompilationUnit::CompilationUnit(std::string              name,
                                     std::string              virtualPath,
                                     ConfigFile               config,
                                     std::vector<std::string> deps) :
        m_Name(std::move(name)),
        m_VirtualPath(std::move(virtualPath)), m_Deps(std::move(deps)),
        m_Oracle(make_config_oracle(std::move(config))), m_Registry(m_Name, m_Oracle)
    {}

    bool CompilationUnit::dependsOn(std::string_view unit) const
    {
        return std::find(m_Deps.begin(), m_Deps.end(), unit) != m_Deps.end();
    }

    Result<CompilationUnit*>
    UnitGraph::addUnit(std::string name, std::string virtualPath, ConfigFile config, std::vector<std::string> deps)
    {
        if (!is_identifier(name) || name == "_" || name == "self")
            return Result<CompilationUnit*>::err({ErrorCode::eInvalidArgument, "invalid unit name: '" + name + "'"});
        if (name == kBuiltinUnit)
            return Result<CompilationUnit*>::err(
                {ErrorCode::eInvalidArgument, "unit name '" + name + "' is reserved for built-in aliases"});
        if (find(name))
            return Result<CompilationUnit*>::err({ErrorCode::eInvalidArgument, "duplicate unit name: '" + name + "'"});

        for (const auto& d : deps)
        {
            if (d == name)
                return Result<CompilationUnit*>::err(
                    {ErrorCode::eDependencyError, "unit '" + name + "' depends on itself"});
        }

        m_Units.push_back(
            std::make_unique<CompilationUnit>(std::move(name), std::move(virtualPath), std::move(config), std::move(deps)));
        return Result<CompilationUnit*>::ok(m_Units.back().get());
    }

    CompilationUnit* UnitGraph::find(std::string_view name)
    {
        for (auto& u : m_Units)
            if (u->name() == name)
                return u.get();
        return nullptr;
    }

    const CompilationUnit* UnitGraph::find(std::string_view name) const
    {
        for (const auto& u : m_Units)
            if (u->name() == name)
                return u.get();
        return nullptr;
    }

    Result<std::vector<CompilationUnit*>> UnitGraph::dependencyOrder()
    {
        enum class Mark : uint8_t
        {
            eNone = 0,
            eVisiting,
            eDone
        };

        std::unordered_map<const CompilationUnit*, Mark> marks;
        std::vector<CompilationUnit*>                    order;
        std::vector<std::string>                         stack;
        order.reserve(m_Units.size());

        // Recursive DFS; unit graphs are small.
        std::function<Result<void>(CompilationUnit*)> visit = [&](CompilationUnit* u) -> Result<void> {
            auto& m = marks[u];
            if (m == Mark::eDone)
                return Result<void>::ok();
            if (m == Mark::eVisiting)
            {
                std::string cycle;
                auto        it = std::find(stack.begin(), stack.end(), u->name());
                for (; it != stack.end(); ++it)
                    cycle += *it + " -> ";
                cycle += u->name();
                return Result<void>::err({ErrorCode::eDependencyError, "dependency cycle: " + cycle});
            }

            m = Mark::eVisiting;
            stack.push_back(u->name());
            for (const auto& depName : u->deps())
            {
                CompilationUnit* dep = find(depName);
                if (!dep)
                    return Result<void>::err({ErrorCode::eDependencyError,
                                              "unit '" + u->name() + "' depends on unknown unit '" + depName + "'"});
                auto r = visit(dep);
                if (!r.isOk())
                    return r;
            }
            stack.pop_back();
            marks[u] = Mark::eDone;
            order.push_back(u);
            return Result<void>::ok();
        };

        for (const auto& u : m_Units)
        {
            auto r = visit(u.get());
            if (!r.isOk())
                return Result<std::vector<CompilationUnit*>>::err(r.error());
        }
        return Result<std::vector<CompilationUnit*>>::ok(std::move(order));
    }

    Result<AliasHandle> UnitScope::resolve(const std::vector<std::string>& path) const
    {
        const auto& own = m_Unit.registry();

        if (path.size() == 1)
        {
            if (own.find(path[0]))
                return own.reference(path[0], false);
            if (builtin_aliases().find(path[0]))
                return builtin_aliases().reference(path[0], true);
            return Result<AliasHandle>::err({ErrorCode::eResolveError,
                                             "cannot find alias `" + path[0] + "` in unit `" + m_Unit.name() + "`"});
        }

        if (path.size() != 2)
            return Result<AliasHandle>::err(
                {ErrorCode::eResolveError, "alias path `" + join_path(path) + "` has too many segments"});

        const auto& unitName  = path[0];
        const auto& aliasName = path[1];

        if (unitName == kBuiltinUnit)
            return builtin_aliases().reference(aliasName, true);

        if (unitName == "self")
            return own.reference(aliasName, false);

        // a unit naming itself sees what it exports, as its dependents do
        if (unitName == m_Unit.name())
            return own.reference(aliasName, true);

        const CompilationUnit* dep = m_Graph.find(unitName);
        if (!dep)
            return Result<AliasHandle>::err({ErrorCode::eResolveError, "unknown unit `" + unitName + "`"});
        if (!m_Unit.dependsOn(unitName))
            return Result<AliasHandle>::err({ErrorCode::eResolveError,
                                             "unit `" + unitName + "` is not a dependency of `" + m_Unit.name() +
                                                 "`"});

        return dep->registry().reference(aliasName, true);
    }
} // namespace crossfig
