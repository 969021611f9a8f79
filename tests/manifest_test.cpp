#include <crossfig/manifest.hpp>

#include <gtest/gtest.h>

using namespace crossfig;

TEST(ManifestTest, ParsesUnitBlocks)
{
    const char* text = "# workspace\n"
                       "[unit]\n"
                       "name=net\n"
                       "input=net/lib.rs.in\n"
                       "config=net/net.vcfg\n"
                       "output=out/net/lib.rs\n"
                       "defines=feature=std;unix\n"
                       "\n"
                       "[unit]\n"
                       "name = app\n"
                       "input = app\\main.rs.in\n"
                       "output = /abs/app/main.rs\n"
                       "deps = net, log ;\n";

    auto r = parse_units_manifest(text, "proj/workspace.vunits", "proj");
    ASSERT_TRUE(r.isOk()) << r.error().message;

    const auto& m = r.value();
    ASSERT_EQ(m.units.size(), 2u);

    const auto& net = m.units[0];
    EXPECT_EQ(net.name, "net");
    EXPECT_EQ(net.input, "proj/net/lib.rs.in");
    EXPECT_EQ(net.config, "proj/net/net.vcfg");
    EXPECT_EQ(net.output, "proj/out/net/lib.rs");
    EXPECT_EQ(net.defines, (std::vector<std::string> {"feature=std", "unix"}));
    EXPECT_TRUE(net.deps.empty());
    EXPECT_EQ(net.line, 2u);

    const auto& app = m.units[1];
    EXPECT_EQ(app.name, "app");
    EXPECT_EQ(app.input, "proj/app/main.rs.in");
    EXPECT_EQ(app.output, "/abs/app/main.rs");
    EXPECT_TRUE(app.config.empty());
    EXPECT_EQ(app.deps, (std::vector<std::string> {"net", "log"}));
}

TEST(ManifestTest, RequiredKeys)
{
    auto noInput = parse_units_manifest("[unit]\nname=a\noutput=a.out\n", "m.vunits", "");
    ASSERT_FALSE(noInput.isOk());
    EXPECT_EQ(noInput.error().code, ErrorCode::eParseError);
    EXPECT_NE(noInput.error().message.find("missing 'input'"), std::string::npos);

    auto noName = parse_units_manifest("[unit]\ninput=a.in\noutput=a.out\n", "m.vunits", "");
    ASSERT_FALSE(noName.isOk());
    EXPECT_NE(noName.error().message.find("missing 'name'"), std::string::npos);

    auto noOutput = parse_units_manifest("[unit]\nname=a\ninput=a.in\n", "m.vunits", "");
    ASSERT_FALSE(noOutput.isOk());
    EXPECT_NE(noOutput.error().message.find("missing 'output'"), std::string::npos);
}

TEST(ManifestTest, RejectsMalformedLines)
{
    auto outside = parse_units_manifest("name=a\n", "m.vunits", "");
    ASSERT_FALSE(outside.isOk());
    EXPECT_NE(outside.error().message.find("m.vunits:1: key only valid inside [unit]"), std::string::npos);

    auto unknownKey = parse_units_manifest("[unit]\nname=a\nstage=frag\n", "m.vunits", "");
    ASSERT_FALSE(unknownKey.isOk());
    EXPECT_NE(unknownKey.error().message.find("m.vunits:3: unknown key: stage"), std::string::npos);

    auto noEq = parse_units_manifest("[unit]\nname\n", "m.vunits", "");
    ASSERT_FALSE(noEq.isOk());
    EXPECT_NE(noEq.error().message.find("expected key=value"), std::string::npos);

    auto section = parse_units_manifest("[target]\n", "m.vunits", "");
    ASSERT_FALSE(section.isOk());
    EXPECT_NE(section.error().message.find("unknown section"), std::string::npos);

    auto empty = parse_units_manifest("# nothing\n", "m.vunits", "");
    ASSERT_FALSE(empty.isOk());
    EXPECT_NE(empty.error().message.find("no [unit] blocks"), std::string::npos);
}

TEST(ManifestTest, MissingFile)
{
    auto r = load_units_manifest("/nonexistent/dir/none.vunits");
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eIO);
}

TEST(ManifestTest, SplitList)
{
    std::vector<std::string> out {"stale"};
    split_list(" a; b ,,c ;", out);
    EXPECT_EQ(out, (std::vector<std::string> {"a", "b", "c"}));

    split_list("", out);
    EXPECT_TRUE(out.empty());
}
