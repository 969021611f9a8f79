#include "crossfig/expression.hpp"
#include "crossfig/alias.hpp"

namespace crossfig
{
    AliasHandle AliasHandle::deferred(std::vector<std::string> segments, size_t offset)
    {
        AliasHandle h;
        h.m_Path     = join_path(segments);
        h.m_Segments = std::move(segments);
        h.m_Offset   = offset;
        return h;
    }

    Expression Expression::leaf(Predicate predicate)
    {
        Expression e;
        e.m_Kind      = Kind::eLeaf;
        e.m_Predicate = std::move(predicate);
        return e;
    }

    Expression Expression::negation(Expression operand)
    {
        Expression e;
        e.m_Kind = Kind::eNot;
        e.m_Operands.push_back(std::move(operand));
        return e;
    }

    Expression Expression::all(std::vector<Expression> operands)
    {
        Expression e;
        e.m_Kind     = Kind::eAll;
        e.m_Operands = std::move(operands);
        return e;
    }

    Expression Expression::any(std::vector<Expression> operands)
    {
        Expression e;
        e.m_Kind     = Kind::eAny;
        e.m_Operands = std::move(operands);
        return e;
    }

    Expression Expression::alias_ref(AliasHandle handle)
    {
        Expression e;
        e.m_Kind  = Kind::eAliasRef;
        e.m_Alias = std::move(handle);
        return e;
    }

    bool Expression::isBound() const
    {
        if (m_Kind == Kind::eAliasRef)
            return m_Alias.isBound();
        for (const auto& op : m_Operands)
        {
            if (!op.isBound())
                return false;
        }
        return true;
    }

    std::string Expression::to_string() const
    {
        auto join = [this](const char* op) {
            std::string s = op;
            s.push_back('(');
            for (size_t i = 0; i < m_Operands.size(); ++i)
            {
                if (i)
                    s += ", ";
                s += m_Operands[i].to_string();
            }
            s.push_back(')');
            return s;
        };

        switch (m_Kind)
        {
            case Kind::eLeaf:
                return "cfg(" + m_Predicate.to_string() + ")";
            case Kind::eNot:
                return join("not");
            case Kind::eAll:
                return join("all");
            case Kind::eAny:
                return join("any");
            case Kind::eAliasRef:
                return m_Alias.path();
        }
        return {};
    }
} // namespace crossfig
