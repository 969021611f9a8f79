#include "test_support.hpp"

#include <crossfig/alias.hpp>
#include <crossfig/switch.hpp>

#include <gtest/gtest.h>

using namespace crossfig;
using namespace crossfig::test;

TEST(SwitchTest, FirstTrueArmWins)
{
    Switch sw;
    ASSERT_TRUE(sw.addArm(flag("a"), Fragment {"first", 0}).isOk());
    ASSERT_TRUE(sw.addArm(flag("b"), Fragment {"second", 10}).isOk());
    ASSERT_TRUE(sw.addArm(flag("c"), Fragment {"third", 20}).isOk());
    ASSERT_TRUE(sw.setWildcard(Fragment {"fallback", 30}).isOk());

    RecordingOracle oracle({"b", "c"});
    const auto      sel = select_branch(sw, oracle);

    ASSERT_TRUE(sel.hasOutput());
    EXPECT_EQ(sel.kind, Selection::Kind::eArm);
    EXPECT_EQ(sel.armIndex, 1u);
    EXPECT_EQ(sel.fragment->text, "second");
    EXPECT_EQ(sel.fragment->offset, 10u);

    // arms after the chosen one are never evaluated
    EXPECT_EQ(oracle.queried(), (std::vector<std::string> {"a", "b"}));
}

TEST(SwitchTest, FallsBackToWildcard)
{
    Switch sw;
    ASSERT_TRUE(sw.addArm(flag("a"), Fragment {"a", 0}).isOk());
    ASSERT_TRUE(sw.setWildcard(Fragment {"other", 0}).isOk());

    RecordingOracle oracle;
    const auto      sel = select_branch(sw, oracle);
    EXPECT_EQ(sel.kind, Selection::Kind::eWildcard);
    ASSERT_TRUE(sel.hasOutput());
    EXPECT_EQ(sel.fragment->text, "other");
}

TEST(SwitchTest, NoMatchWithoutWildcardSelectsNothing)
{
    Switch sw;
    ASSERT_TRUE(sw.addArm(flag("a"), Fragment {"a", 0}).isOk());

    RecordingOracle oracle;
    const auto      sel = select_branch(sw, oracle);
    EXPECT_EQ(sel.kind, Selection::Kind::eNone);
    EXPECT_FALSE(sel.hasOutput());

    Switch empty;
    EXPECT_TRUE(empty.empty());
    EXPECT_FALSE(select_branch(empty, oracle).hasOutput());
}

TEST(SwitchTest, WildcardOnlyNeverQueries)
{
    Switch sw;
    ASSERT_TRUE(sw.setWildcard(Fragment {"always", 0}).isOk());

    RecordingOracle oracle;
    const auto      sel = select_branch(sw, oracle);
    ASSERT_TRUE(sel.hasOutput());
    EXPECT_EQ(sel.fragment->text, "always");
    EXPECT_TRUE(oracle.queried().empty());
}

TEST(SwitchTest, ArmAfterWildcardIsRejected)
{
    Switch sw;
    ASSERT_TRUE(sw.setWildcard(Fragment {"w", 0}).isOk());

    // rejected whatever the condition would evaluate to
    auto r = sw.addArm(Expression::always(), Fragment {"late", 0});
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eDefinitionError);
    EXPECT_EQ(r.error().message, "patterns after a wildcard are ignored: `cfg(true)`");

    auto again = sw.setWildcard(Fragment {"w2", 0});
    ASSERT_FALSE(again.isOk());
    EXPECT_EQ(again.error().code, ErrorCode::eDefinitionError);

    EXPECT_TRUE(sw.arms().empty());
    EXPECT_EQ(sw.wildcard()->text, "w");
}

TEST(SwitchTest, ConditionalForm)
{
    RecordingOracle oracle({"x"});

    const auto withElse = Switch::conditional(flag("x"), Fragment {"then", 0}, Fragment {"else", 0});
    EXPECT_EQ(select_branch(withElse, oracle).fragment->text, "then");

    const auto negated = Switch::conditional(Expression::negation(flag("x")), Fragment {"then", 0}, Fragment {"else", 0});
    EXPECT_EQ(select_branch(negated, oracle).fragment->text, "else");

    const auto guard = Switch::conditional(flag("y"), Fragment {"then", 0});
    EXPECT_FALSE(guard.hasWildcard());
    EXPECT_FALSE(select_branch(guard, oracle).hasOutput());
}

TEST(SwitchTest, DeferredPatternsResolveOnlyWhenTried)
{
    AliasRegistry registry("app", make_config_oracle(make_config({})));
    const RegistryResolver resolver(&registry);

    Switch sw;
    ASSERT_TRUE(sw.addArm(flag("a"), Fragment {"a", 0}).isOk());
    ASSERT_TRUE(sw.addArm(Expression::alias_ref(AliasHandle::deferred({"missing"}, 12)), Fragment {"b", 0}).isOk());
    ASSERT_TRUE(sw.setWildcard(Fragment {"other", 0}).isOk());

    RecordingOracle hit({"a"});
    auto            first = select_branch(sw, hit, resolver);
    ASSERT_TRUE(first.isOk()) << first.error().message;
    EXPECT_EQ(first.value().armIndex, 0u);
    EXPECT_EQ(first.value().fragment->text, "a");

    RecordingOracle miss;
    auto            second = select_branch(sw, miss, resolver);
    ASSERT_FALSE(second.isOk());
    EXPECT_EQ(second.error().code, ErrorCode::eResolveError);
    ASSERT_TRUE(second.error().offset.has_value());
    EXPECT_EQ(*second.error().offset, 12u);
}
