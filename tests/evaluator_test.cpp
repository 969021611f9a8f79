#include "test_support.hpp"

#include <crossfig/alias.hpp>
#include <crossfig/evaluator.hpp>

#include <gtest/gtest.h>

using namespace crossfig;
using namespace crossfig::test;

TEST(EvaluatorTest, VacuousAllAndAny)
{
    RecordingOracle oracle;
    EXPECT_TRUE(evaluate(Expression::all({}), oracle));
    EXPECT_FALSE(evaluate(Expression::any({}), oracle));
    EXPECT_TRUE(oracle.queried().empty());
}

TEST(EvaluatorTest, DefaultExpressionIsVacuousAll)
{
    RecordingOracle oracle;
    EXPECT_TRUE(evaluate(Expression {}, oracle));
}

TEST(EvaluatorTest, DoubleNegation)
{
    RecordingOracle oracle({"unix"});
    EXPECT_TRUE(evaluate(Expression::negation(Expression::negation(flag("unix"))), oracle));
    EXPECT_FALSE(evaluate(Expression::negation(Expression::negation(flag("windows"))), oracle));
    EXPECT_TRUE(evaluate(Expression::negation(flag("windows")), oracle));
}

TEST(EvaluatorTest, AllStopsAtFirstFalse)
{
    RecordingOracle oracle({"a", "c"});
    EXPECT_FALSE(evaluate(Expression::all({flag("a"), flag("b"), flag("c")}), oracle));
    EXPECT_EQ(oracle.queried(), (std::vector<std::string> {"a", "b"}));
}

TEST(EvaluatorTest, AnyStopsAtFirstTrue)
{
    RecordingOracle oracle({"b"});
    EXPECT_TRUE(evaluate(Expression::any({flag("a"), flag("b"), flag("c")}), oracle));
    EXPECT_EQ(oracle.queried(), (std::vector<std::string> {"a", "b"}));
}

TEST(EvaluatorTest, ConstantsNeverReachTheOracle)
{
    RecordingOracle oracle;
    EXPECT_TRUE(evaluate(Expression::always(), oracle));
    EXPECT_FALSE(evaluate(Expression::never(), oracle));
    EXPECT_TRUE(evaluate(Expression::any({Expression::never(), Expression::always(), flag("x")}), oracle));
    EXPECT_TRUE(oracle.queried().empty());
}

TEST(EvaluatorTest, KeyValuePredicates)
{
    const auto oracle = make_config_oracle(make_config({"unix"}, {{"feature", "std"}, {"feature", "log"}}));
    EXPECT_TRUE(evaluate(key_value("feature", "std"), *oracle));
    EXPECT_TRUE(evaluate(key_value("feature", "log"), *oracle));
    EXPECT_FALSE(evaluate(key_value("feature", "alloc"), *oracle));
    EXPECT_FALSE(evaluate(key_value("target_os", "linux"), *oracle));
    EXPECT_TRUE(evaluate(flag("unix"), *oracle));

    // a flag and a key of the same name are distinct predicates
    EXPECT_FALSE(evaluate(flag("feature"), *oracle));
}

TEST(EvaluatorTest, AliasUsesDefiningOracle)
{
    AliasRegistry registry("dep", make_config_oracle(make_config({"fast"})));
    auto          def = registry.define("fast", Visibility::ePublic, flag("fast"));
    ASSERT_TRUE(def.isOk());

    auto handle = registry.reference("fast", true);
    ASSERT_TRUE(handle.isOk());

    RecordingOracle caller;
    EXPECT_TRUE(evaluate(Expression::alias_ref(handle.value()), caller));
    EXPECT_FALSE(evaluate(Expression::negation(Expression::alias_ref(handle.value())), caller));
    EXPECT_TRUE(caller.queried().empty());
}

TEST(EvaluatorTest, DeferredReferenceIsLookedUpWhenReached)
{
    AliasRegistry registry("app", make_config_oracle(make_config({"fast"})));
    ASSERT_TRUE(registry.define("fast", Visibility::ePrivate, flag("fast")).isOk());
    const RegistryResolver resolver(&registry);

    auto deferred = [](std::string name, size_t offset) {
        return Expression::alias_ref(AliasHandle::deferred({std::move(name)}, offset));
    };

    RecordingOracle oracle;

    // skipped operands are never looked up
    auto skippedAny = evaluate(Expression::any({Expression::always(), deferred("missing", 4)}), oracle, resolver);
    ASSERT_TRUE(skippedAny.isOk()) << skippedAny.error().message;
    EXPECT_TRUE(skippedAny.value());

    auto skippedAll = evaluate(Expression::all({Expression::never(), deferred("missing", 4)}), oracle, resolver);
    ASSERT_TRUE(skippedAll.isOk()) << skippedAll.error().message;
    EXPECT_FALSE(skippedAll.value());

    auto found = evaluate(Expression::negation(deferred("fast", 0)), oracle, resolver);
    ASSERT_TRUE(found.isOk()) << found.error().message;
    EXPECT_FALSE(found.value());

    auto reached = evaluate(Expression::any({Expression::never(), deferred("missing", 17)}), oracle, resolver);
    ASSERT_FALSE(reached.isOk());
    EXPECT_EQ(reached.error().code, ErrorCode::eResolveError);
    ASSERT_TRUE(reached.error().offset.has_value());
    EXPECT_EQ(*reached.error().offset, 17u);
    EXPECT_NE(reached.error().message.find("cannot find alias `missing`"), std::string::npos);
}

TEST(EvaluatorTest, UnboundReferenceWithoutResolver)
{
    const Expression unbound = Expression::alias_ref(AliasHandle {});
    EXPECT_FALSE(unbound.isBound());
    EXPECT_FALSE(Expression::all({Expression::always(), unbound}).isBound());
    EXPECT_TRUE(Expression::all({Expression::always()}).isBound());

    RecordingOracle oracle;
    EXPECT_FALSE(evaluate(unbound, oracle));
    EXPECT_TRUE(evaluate(Expression::negation(unbound), oracle));

    auto r = evaluate(unbound, oracle, RegistryResolver());
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eResolveError);
}
