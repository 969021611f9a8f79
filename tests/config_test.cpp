#include <crossfig/config.hpp>
#include <crossfig/oracle.hpp>

#include <gtest/gtest.h>

using namespace crossfig;

TEST(ConfigTest, ParsesFlagsAndValues)
{
    const char* text = "# unit configuration\n"
                       "flag unix\n"
                       "\n"
                       "set feature=std\n"
                       "set feature = \"log\"\n"
                       "set target_os=linux\n";

    auto r = parse_config_vcfg(text, "net.vcfg");
    ASSERT_TRUE(r.isOk()) << r.error().message;

    const auto& cfg = r.value();
    EXPECT_TRUE(cfg.hasFlag("unix"));
    EXPECT_FALSE(cfg.hasFlag("windows"));
    EXPECT_TRUE(cfg.hasValue("feature", "std"));
    EXPECT_TRUE(cfg.hasValue("feature", "log"));
    EXPECT_TRUE(cfg.hasValue("target_os", "linux"));
    EXPECT_FALSE(cfg.hasValue("feature", "alloc"));
    EXPECT_FALSE(cfg.hasValue("unknown", "std"));
}

TEST(ConfigTest, ReportsLineOfBadDirective)
{
    auto unknown = parse_config_vcfg("flag a\nenable b\n", "x.vcfg");
    ASSERT_FALSE(unknown.isOk());
    EXPECT_EQ(unknown.error().code, ErrorCode::eParseError);
    EXPECT_EQ(unknown.error().message.rfind("x.vcfg:2: ", 0), 0u) << unknown.error().message;

    EXPECT_FALSE(parse_config_vcfg("flag 1st\n").isOk());
    EXPECT_FALSE(parse_config_vcfg("flag\n").isOk());
    EXPECT_FALSE(parse_config_vcfg("set novalue\n").isOk());
    EXPECT_FALSE(parse_config_vcfg("set bad-key=1\n").isOk());
}

TEST(ConfigTest, MissingFileIsAnIoError)
{
    auto r = load_config_vcfg("/nonexistent/dir/none.vcfg");
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eIO);
}

TEST(ConfigTest, Defines)
{
    ConfigFile cfg;
    ASSERT_TRUE(apply_define(cfg, "debug_assertions").isOk());
    ASSERT_TRUE(apply_define(cfg, "feature=std").isOk());
    ASSERT_TRUE(apply_define(cfg, " feature=\"std\" ").isOk());

    EXPECT_TRUE(cfg.hasFlag("debug_assertions"));
    EXPECT_TRUE(cfg.hasValue("feature", "std"));
    EXPECT_EQ(cfg.values.count("feature"), 1u);

    auto bad = apply_define(cfg, "not a flag");
    ASSERT_FALSE(bad.isOk());
    EXPECT_EQ(bad.error().code, ErrorCode::eInvalidArgument);
}

TEST(ConfigTest, MergeAddsMissingEntries)
{
    auto a = parse_config_vcfg("flag unix\nset feature=std\n");
    auto b = parse_config_vcfg("flag debug\nset feature=std\nset feature=log\n");
    ASSERT_TRUE(a.isOk());
    ASSERT_TRUE(b.isOk());

    a.value().merge(b.value());
    EXPECT_TRUE(a.value().hasFlag("unix"));
    EXPECT_TRUE(a.value().hasFlag("debug"));
    EXPECT_EQ(a.value().values.count("feature"), 2u);
}

TEST(ConfigTest, FingerprintIgnoresOrder)
{
    auto a = parse_config_vcfg("flag unix\nset feature=std\nset feature=log\n");
    auto b = parse_config_vcfg("set feature=log\nflag unix\nset feature=std\n");
    auto c = parse_config_vcfg("flag unix\nset feature=std\n");
    ASSERT_TRUE(a.isOk());
    ASSERT_TRUE(b.isOk());
    ASSERT_TRUE(c.isOk());

    EXPECT_EQ(config_fingerprint(a.value()), config_fingerprint(b.value()));
    EXPECT_NE(config_fingerprint(a.value()), config_fingerprint(c.value()));
    EXPECT_EQ(make_config_oracle(a.value())->fingerprint(), config_fingerprint(a.value()));
}

TEST(ConfigTest, OracleAnswersFromSnapshot)
{
    auto cfg = parse_config_vcfg("flag unix\nset feature=std\n");
    ASSERT_TRUE(cfg.isOk());
    const auto oracle = make_config_oracle(cfg.value());

    EXPECT_TRUE(oracle->query({"unix", {}}));
    EXPECT_TRUE(oracle->query({"feature", std::string("std")}));
    EXPECT_FALSE(oracle->query({"feature", std::string("log")}));
    EXPECT_TRUE(oracle->query({"true", {}}));
    EXPECT_FALSE(oracle->query({"false", {}}));

    // with a value, "true" is an ordinary key
    EXPECT_FALSE(oracle->query({"true", std::string("x")}));
}

TEST(ConfigTest, Identifiers)
{
    EXPECT_TRUE(is_identifier("feature"));
    EXPECT_TRUE(is_identifier("_private"));
    EXPECT_TRUE(is_identifier("target_os2"));
    EXPECT_FALSE(is_identifier(""));
    EXPECT_FALSE(is_identifier("2x"));
    EXPECT_FALSE(is_identifier("a-b"));
}
