#include "crossfig/evaluator.hpp"

namespace crossfig
{
    namespace
    {
        Result<bool> reduce(const Expression& expr, const ConditionOracle& oracle, const AliasResolver* resolver)
        {
            switch (expr.kind())
            {
                case Expression::Kind::eLeaf:
                    return Result<bool>::ok(oracle.query(expr.predicate()));

                case Expression::Kind::eNot:
                {
                    auto r = reduce(expr.operands().front(), oracle, resolver);
                    if (!r.isOk())
                        return r;
                    return Result<bool>::ok(!r.value());
                }

                case Expression::Kind::eAll:
                case Expression::Kind::eAny:
                {
                    // all(): first false decides; any(): first true decides
                    const bool decider = expr.kind() == Expression::Kind::eAny;
                    for (const auto& op : expr.operands())
                    {
                        auto r = reduce(op, oracle, resolver);
                        if (!r.isOk() || r.value() == decider)
                            return r;
                    }
                    return Result<bool>::ok(!decider);
                }

                case Expression::Kind::eAliasRef:
                {
                    const AliasHandle& h = expr.alias();
                    if (h.isBound())
                        return Result<bool>::ok(h.alias()->value());
                    if (!resolver)
                        return Result<bool>::ok(false);

                    auto bound = resolver->resolve(h.segments());
                    if (!bound.isOk())
                        return Result<bool>::err(Error::at(h.offset(), bound.error().code, bound.error().message));
                    return Result<bool>::ok(bound.value().alias()->value());
                }
            }
            return Result<bool>::ok(false);
        }
    } // namespace

    bool evaluate(const Expression& expr, const ConditionOracle& oracle)
    {
        // without a resolver nothing can fail
        return reduce(expr, oracle, nullptr).value();
    }

    Result<bool> evaluate(const Expression& expr, const ConditionOracle& oracle, const AliasResolver& resolver)
    {
        return reduce(expr, oracle, &resolver);
    }
} // namespace crossfig
