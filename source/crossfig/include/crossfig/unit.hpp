#pragma once

#include "crossfig/alias.hpp"
#include "crossfig/config.hpp"
#include "crossfig/oracle.hpp"
#include "crossfig/result.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace crossfig
{
    // ------------------------------------------------------------
    // CompilationUnit
    //
    // One defining unit: its own configuration snapshot (oracle), the
    // aliases it defines, and the units it may reference.
    // ------------------------------------------------------------
    class CompilationUnit
    {
    public:
        CompilationUnit(std::string name, std::string virtualPath, ConfigFile config, std::vector<std::string> deps);

        CompilationUnit(const CompilationUnit&)            = delete;
        CompilationUnit& operator=(const CompilationUnit&) = delete;

        const std::string&              name() const { return m_Name; }
        const std::string&              virtualPath() const { return m_VirtualPath; }
        const std::vector<std::string>& deps() const { return m_Deps; }
        bool                            dependsOn(std::string_view unit) const;

        const ConfigOracle&                        oracle() const { return *m_Oracle; }
        const std::shared_ptr<const ConfigOracle>& oraclePtr() const { return m_Oracle; }

        AliasRegistry&       registry() { return m_Registry; }
        const AliasRegistry& registry() const { return m_Registry; }

    private:
        std::string                         m_Name;
        std::string                         m_VirtualPath;
        std::vector<std::string>            m_Deps;
        std::shared_ptr<const ConfigOracle> m_Oracle;
        AliasRegistry                       m_Registry;
    };

    class UnitGraph
    {
    public:
        Result<CompilationUnit*>
        addUnit(std::string name, std::string virtualPath, ConfigFile config, std::vector<std::string> deps = {});

        CompilationUnit*       find(std::string_view name);
        const CompilationUnit* find(std::string_view name) const;

        const std::vector<std::unique_ptr<CompilationUnit>>& units() const { return m_Units; }

        // Leaves first. Fails on unknown dependencies and on cycles.
        Result<std::vector<CompilationUnit*>> dependencyOrder();

    private:
        std::vector<std::unique_ptr<CompilationUnit>> m_Units;
    };

    // Alias lookup as seen from one unit:
    //   name              own aliases (any visibility), then built-ins
    //   self::name        own aliases
    //   crossfig::name    built-ins
    //   dep::name         exported aliases of a declared dependency
    //   own::name         exported aliases of this unit
    class UnitScope : public AliasResolver
    {
    public:
        UnitScope(const UnitGraph& graph, const CompilationUnit& unit) : m_Graph(graph), m_Unit(unit) {}

        Result<AliasHandle> resolve(const std::vector<std::string>& path) const override;

    private:
        const UnitGraph&       m_Graph;
        const CompilationUnit& m_Unit;
    };
} // namespace crossfig
