/**
 * @file test_line.cpp
 * @brief Unit tests for line classification (GoogleTest)
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "ovini/Line.hpp"

using namespace ovini;

// ============================================================================
// trim_comment / is_empty_line
// ============================================================================

TEST(TrimComment, InlineComment) {
    EXPECT_EQ(trim_comment("path = /tmp/; comment"), "path = /tmp/");
    EXPECT_EQ(trim_comment("[http] ;; section"), "[http]");
}

TEST(TrimComment, FullLineComment) {
    EXPECT_EQ(trim_comment("; comment line"), "");
    EXPECT_EQ(trim_comment("                ;      comment line"), "");
    EXPECT_EQ(trim_comment(";;;"), "");
}

TEST(TrimComment, NoComment) {
    EXPECT_EQ(trim_comment("  enabled = no \r"), "enabled = no");
}

TEST(TrimComment, SemicolonInsideQuotesStillStarts) {
    EXPECT_EQ(trim_comment("name = \"a;b\""), "name = \"a");
}

TEST(IsEmptyLine, Whitespace) {
    EXPECT_TRUE(is_empty_line(""));
    EXPECT_TRUE(is_empty_line(" \t\r"));
    EXPECT_FALSE(is_empty_line(" x "));
}

// ============================================================================
// parse_group_name
// ============================================================================

TEST(ParseGroupName, Valid) {
    EXPECT_EQ(parse_group_name("[http]"), "http");
    EXPECT_EQ(parse_group_name("[  spaced name ]"), "spaced name");
}

TEST(ParseGroupName, GreedyCapture) {
    EXPECT_EQ(parse_group_name("[a]b]"), "a]b");
}

TEST(ParseGroupName, NotAHeader) {
    EXPECT_FALSE(parse_group_name("http").has_value());
    EXPECT_FALSE(parse_group_name("[http").has_value());
    EXPECT_FALSE(parse_group_name("[http] trailing").has_value());
}

TEST(ParseGroupName, EmptyName) {
    EXPECT_FALSE(parse_group_name("[]").has_value());
    EXPECT_FALSE(parse_group_name("[   ]").has_value());
}

// ============================================================================
// parse_setting
// ============================================================================

TEST(ParseSetting, WithSpaces) {
    auto s = parse_setting("path = /tmp/");
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->key, "path");
    EXPECT_EQ(s->value, "/tmp/");
}

TEST(ParseSetting, WithoutSpaces) {
    auto s = parse_setting("path=/tmp/");
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->key, "path");
    EXPECT_EQ(s->value, "/tmp/");
}

TEST(ParseSetting, ExtraSpacesAreTrimmed) {
    auto s = parse_setting("basic_size_limit   =    26214400");
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->key, "basic_size_limit");
    EXPECT_EQ(s->value, "26214400");
}

TEST(ParseSetting, OverrideStaysInKey) {
    auto s = parse_setting("path<staging> = /srv/uploads/");
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->key, "path<staging>");
    EXPECT_EQ(s->value, "/srv/uploads/");
}

TEST(ParseSetting, GreedyKeySplitsAtLastEquals) {
    auto s = parse_setting("a = b = c");
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->key, "a = b");
    EXPECT_EQ(s->value, "c");
}

TEST(ParseSetting, RequiresKeyAndValue) {
    EXPECT_FALSE(parse_setting("=1").has_value());
    EXPECT_FALSE(parse_setting("key =").has_value());
    EXPECT_FALSE(parse_setting("[group]").has_value());
    EXPECT_FALSE(parse_setting("just words").has_value());
}

// ============================================================================
// parse_setting_override
// ============================================================================

TEST(ParseSettingOverride, Valid) {
    auto o = parse_setting_override("path<production> = /srv/var/tmp/");
    ASSERT_TRUE(o.has_value());
    EXPECT_EQ(o->key, "path");
    EXPECT_EQ(o->override_name, "production");
    EXPECT_EQ(o->value, "/srv/var/tmp/");
}

TEST(ParseSettingOverride, WithoutSpaces) {
    auto o = parse_setting_override("path<ubuntu>=/etc/var/uploads");
    ASSERT_TRUE(o.has_value());
    EXPECT_EQ(o->key, "path");
    EXPECT_EQ(o->override_name, "ubuntu");
    EXPECT_EQ(o->value, "/etc/var/uploads");
}

TEST(ParseSettingOverride, PlainSettingIsNotOverride) {
    EXPECT_FALSE(parse_setting_override("path = /srv/var/tmp/").has_value());
    EXPECT_FALSE(parse_setting_override("path<> = x").has_value());
    EXPECT_FALSE(parse_setting_override("<prod> = x").has_value());
}

// ============================================================================
// classify_line
// ============================================================================

TEST(ClassifyLine, Kinds) {
    EXPECT_EQ(classify_line(""), LineKind::Blank);
    EXPECT_EQ(classify_line("[ftp]"), LineKind::Group);
    EXPECT_EQ(classify_line("path = /tmp/"), LineKind::Setting);
    EXPECT_EQ(classify_line("path<production> = /srv/"), LineKind::Setting);
    EXPECT_EQ(classify_line("garbage"), LineKind::Invalid);
    EXPECT_EQ(classify_line("[]"), LineKind::Invalid);
}

TEST(ClassifyLine, Names) {
    EXPECT_STREQ(to_string(LineKind::Group), "group");
    EXPECT_STREQ(to_string(LineKind::Invalid), "invalid");
}

// ============================================================================
// Greedy captures and long lines
// ============================================================================

TEST(ParseSettingOverride, ValueMayHoldEquals) {
    auto o = parse_setting_override("url<prod> = http://host/?a=b");
    ASSERT_TRUE(o.has_value());
    EXPECT_EQ(o->key, "url");
    EXPECT_EQ(o->override_name, "prod");
    EXPECT_EQ(o->value, "http://host/?a=b");
}

TEST(ParseSettingOverride, GreedyKeyAndName) {
    auto o = parse_setting_override("a<b><c> = v");
    ASSERT_TRUE(o.has_value());
    EXPECT_EQ(o->key, "a<b>");
    EXPECT_EQ(o->override_name, "c");

    auto nested = parse_setting_override("k<x>y> = v");
    ASSERT_TRUE(nested.has_value());
    EXPECT_EQ(nested->key, "k");
    EXPECT_EQ(nested->override_name, "x>y");
}

TEST(ParseSettingOverride, RequiresValue) {
    EXPECT_FALSE(parse_setting_override("path<prod> =").has_value());
    EXPECT_FALSE(parse_setting_override("path<prod>  = x").has_value());
}

TEST(ParseSetting, LineTerminatorInsideIsNotASetting) {
    EXPECT_FALSE(parse_setting("a = b\rc").has_value());
    EXPECT_FALSE(parse_group_name("[a\rb]").has_value());
}

TEST(LongLines, SettingWithHugeValue) {
    const std::string value(200000, 'x');
    auto s = parse_setting("k = " + value);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->key, "k");
    EXPECT_EQ(s->value, value);
}

TEST(LongLines, OverrideWithHugeValue) {
    const std::string value(200000, 'x');
    auto o = parse_setting_override("k<prod> = " + value);
    ASSERT_TRUE(o.has_value());
    EXPECT_EQ(o->override_name, "prod");
    EXPECT_EQ(o->value, value);
}

TEST(LongLines, GroupWithHugeName) {
    const std::string name(200000, 'g');
    EXPECT_EQ(parse_group_name("[" + name + "]"), name);
}

TEST(LongLines, InvalidHugeLine) {
    EXPECT_EQ(classify_line(std::string(200000, 'x')), LineKind::Invalid);
}
