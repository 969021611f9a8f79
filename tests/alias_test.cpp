#include "test_support.hpp"

#include <crossfig/alias.hpp>

#include <gtest/gtest.h>

using namespace crossfig;
using namespace crossfig::test;

class AliasRegistryTest : public ::testing::Test
{
protected:
    AliasRegistryTest() : registry("net", make_config_oracle(make_config({"tls"}, {{"feature", "std"}}))) {}

    AliasRegistry registry;
};

TEST_F(AliasRegistryTest, DefineAndQuery)
{
    auto tls = registry.define("tls", Visibility::ePublic, flag("tls"));
    ASSERT_TRUE(tls.isOk());
    EXPECT_TRUE(tls.value()->value());
    EXPECT_EQ(tls.value()->qualifiedName(), "net::tls");
    EXPECT_TRUE(tls.value()->isPublic());

    auto noStd = registry.define("no_std", Visibility::ePrivate, Expression::negation(key_value("feature", "std")));
    ASSERT_TRUE(noStd.isOk());
    EXPECT_FALSE(noStd.value()->value());

    EXPECT_EQ(registry.aliases().size(), 2u);
    EXPECT_EQ(registry.find("tls"), tls.value());
    EXPECT_EQ(registry.find("missing"), nullptr);
}

TEST_F(AliasRegistryTest, DuplicateNameIsRejected)
{
    ASSERT_TRUE(registry.define("tls", Visibility::ePublic, flag("tls")).isOk());

    auto dup = registry.define("tls", Visibility::ePrivate, Expression::never());
    ASSERT_FALSE(dup.isOk());
    EXPECT_EQ(dup.error().code, ErrorCode::eDefinitionError);
    EXPECT_NE(dup.error().message.find("defined multiple times"), std::string::npos);

    // the first definition is kept
    EXPECT_TRUE(registry.find("tls")->value());
}

TEST_F(AliasRegistryTest, InvalidNames)
{
    EXPECT_FALSE(registry.define("", Visibility::ePrivate, Expression::always()).isOk());
    EXPECT_FALSE(registry.define("_", Visibility::ePrivate, Expression::always()).isOk());
    EXPECT_FALSE(registry.define("9lives", Visibility::ePrivate, Expression::always()).isOk());
}

TEST_F(AliasRegistryTest, PrivateAliasesStayInTheirUnit)
{
    ASSERT_TRUE(registry.define("internal", Visibility::ePrivate, flag("tls")).isOk());

    auto own = registry.reference("internal", false);
    ASSERT_TRUE(own.isOk());
    EXPECT_EQ(own.value().path(), "internal");

    auto foreign = registry.reference("internal", true);
    ASSERT_FALSE(foreign.isOk());
    EXPECT_EQ(foreign.error().code, ErrorCode::eResolveError);
    EXPECT_NE(foreign.error().message.find("is private"), std::string::npos);

    auto missing = registry.reference("nope", false);
    ASSERT_FALSE(missing.isOk());
    EXPECT_EQ(missing.error().code, ErrorCode::eResolveError);
}

TEST_F(AliasRegistryTest, CallShapes)
{
    auto tls  = registry.define("tls", Visibility::ePublic, flag("tls"));
    auto quic = registry.define("quic", Visibility::ePublic, flag("quic"));
    ASSERT_TRUE(tls.isOk());
    ASSERT_TRUE(quic.isOk());

    const Fragment body {"body", 4};
    const Fragment other {"other", 9};

    auto guarded = alias_guard(*tls.value(), body);
    ASSERT_TRUE(guarded.has_value());
    EXPECT_EQ(guarded->text, "body");
    EXPECT_EQ(guarded->offset, 4u);

    EXPECT_FALSE(alias_guard(*quic.value(), body).has_value());

    EXPECT_EQ(alias_if_else(*tls.value(), body, other).text, "body");
    EXPECT_EQ(alias_if_else(*quic.value(), body, other).text, "other");
}

TEST(BuiltinAliasesTest, EnabledAndDisabled)
{
    const auto& builtins = builtin_aliases();
    EXPECT_EQ(builtins.unitName(), "crossfig");

    const Alias* enabled  = builtins.find("enabled");
    const Alias* disabled = builtins.find("disabled");
    ASSERT_NE(enabled, nullptr);
    ASSERT_NE(disabled, nullptr);
    EXPECT_TRUE(enabled->value());
    EXPECT_FALSE(disabled->value());
    EXPECT_TRUE(enabled->isPublic());
    EXPECT_EQ(enabled->qualifiedName(), "crossfig::enabled");
}

TEST(JoinPathTest, JoinsSegments)
{
    EXPECT_EQ(join_path({"a"}), "a");
    EXPECT_EQ(join_path({"dep", "alias"}), "dep::alias");
}

TEST_F(AliasRegistryTest, BodyMustBeBound)
{
    auto r = registry.define("later", Visibility::ePrivate, Expression::alias_ref(AliasHandle::deferred({"tls"})));
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eDefinitionError);
    EXPECT_EQ(registry.find("later"), nullptr);
}
