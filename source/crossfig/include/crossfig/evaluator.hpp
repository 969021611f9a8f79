#pragma once

#include "crossfig/alias.hpp"
#include "crossfig/expression.hpp"
#include "crossfig/oracle.hpp"
#include "crossfig/result.hpp"

namespace crossfig
{
    // Reduces an expression to a bool against the given oracle.
    //
    // all() and any() stop at the first deciding operand; operands after it
    // are never evaluated and their predicates never queried.
    //
    // Alias references are evaluated against the oracle of the unit that
    // defined the alias, not against the oracle passed here. A deferred
    // reference names no alias yet and holds false, like an unset predicate.
    bool evaluate(const Expression& expr, const ConditionOracle& oracle);

    // As above, but deferred references are looked up through resolver when
    // evaluation reaches them. Operands skipped by short-circuiting are never
    // looked up. A failed lookup is an eResolveError carrying the offset of
    // the path.
    Result<bool> evaluate(const Expression& expr, const ConditionOracle& oracle, const AliasResolver& resolver);
} // namespace crossfig
