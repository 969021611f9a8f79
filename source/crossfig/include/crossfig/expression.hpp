#pragma once

#include "crossfig/oracle.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace crossfig
{
    class Alias;

    // Reference to an alias. A bound handle points at an alias owned by
    // some unit's registry; only Alias::handle() creates one. A deferred
    // handle holds the path as written and is looked up when it is first
    // evaluated.
    class AliasHandle
    {
    public:
        AliasHandle() = default;

        static AliasHandle deferred(std::vector<std::string> segments, size_t offset = 0);

        bool                            isBound() const { return m_Alias != nullptr; }
        const Alias*                    alias() const { return m_Alias; }
        const std::string&              path() const { return m_Path; }
        const std::vector<std::string>& segments() const { return m_Segments; }
        size_t                          offset() const { return m_Offset; } // of the path in its source

    private:
        friend class Alias;

        const Alias*             m_Alias = nullptr;
        std::string              m_Path;
        std::vector<std::string> m_Segments;
        size_t                   m_Offset = 0;
    };

    // ------------------------------------------------------------
    // Expression
    //
    //   Leaf(Predicate)
    //   Not(Expression)
    //   All(Expression...)   empty: true
    //   Any(Expression...)   empty: false
    //   AliasRef(AliasHandle)
    // ------------------------------------------------------------
    class Expression
    {
    public:
        enum class Kind : uint8_t
        {
            eLeaf = 0,
            eNot,
            eAll,
            eAny,
            eAliasRef
        };

        Expression() = default;

        static Expression leaf(Predicate predicate);
        static Expression negation(Expression operand);
        static Expression all(std::vector<Expression> operands);
        static Expression any(std::vector<Expression> operands);
        static Expression alias_ref(AliasHandle handle);

        // Shorthands for cfg(true) / cfg(false).
        static Expression always() { return leaf({"true", {}}); }
        static Expression never() { return leaf({"false", {}}); }

        Kind                           kind() const { return m_Kind; }
        const Predicate&               predicate() const { return m_Predicate; }
        const std::vector<Expression>& operands() const { return m_Operands; }
        const AliasHandle&             alias() const { return m_Alias; }

        // False when an alias reference somewhere in the tree is deferred.
        bool isBound() const;

        // Canonical text, parseable again by parse_expression().
        std::string to_string() const;

    private:
        Kind                    m_Kind = Kind::eAll;
        Predicate               m_Predicate;
        std::vector<Expression> m_Operands;
        AliasHandle             m_Alias;
    };
} // namespace crossfig
