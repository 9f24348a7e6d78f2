//! # TOML Reader Tests

#include "config/toml.hpp"

#include <gtest/gtest.h>
#include <limits>

using namespace devkit;
using namespace devkit::config;

class TomlTest : public ::testing::Test {
protected:
    TomlDocument parse_ok(const std::string& input) {
        auto result = parse_toml(input);
        if (is_err(result)) {
            const auto& error = unwrap_err(result);
            ADD_FAILURE() << "line " << error.line << ": " << error.message;
            return TomlDocument{};
        }
        return std::move(unwrap(result));
    }

    TomlError parse_err(const std::string& input) {
        auto result = parse_toml(input);
        EXPECT_TRUE(is_err(result)) << "expected an error for:\n" << input;
        return is_err(result) ? unwrap_err(result) : TomlError{};
    }
};

// ============================================================================
// Values
// ============================================================================

TEST_F(TomlTest, RootKeysAndSections) {
    auto doc = parse_ok(R"(
title = "devkit"

[project]
name = "acme"   # trailing comment
port = 8080
enabled = true
)");

    EXPECT_EQ(doc.root().get_string("title"), "devkit");

    const auto* project = doc.find({"project"});
    ASSERT_NE(project, nullptr);
    EXPECT_EQ(project->get_string("name"), "acme");
    EXPECT_EQ(project->get_integer("port"), 8080);
    EXPECT_EQ(project->line, 4);
    ASSERT_NE(project->find("enabled"), nullptr);
    EXPECT_TRUE(std::get<bool>(*project->find("enabled")));
}

TEST_F(TomlTest, StringForms) {
    auto doc = parse_ok(R"(
basic = "tab\there \"quoted\""
literal = 'C:\path\{name}'
unicode = "\u00e9"
)");

    EXPECT_EQ(doc.root().get_string("basic"), "tab\there \"quoted\"");
    EXPECT_EQ(doc.root().get_string("literal"), "C:\\path\\{name}");
    EXPECT_EQ(doc.root().get_string("unicode"), "\xC3\xA9");
}

TEST_F(TomlTest, MultiLineStringArray) {
    auto doc = parse_ok(R"(
[workspaces]
packages = [
    "packages/*",   # JavaScript
    "crates/*",
]
)");

    auto packages = doc.find({"workspaces"})->get_string_array("packages");
    ASSERT_TRUE(packages.has_value());
    EXPECT_EQ(*packages, (std::vector<std::string>{"packages/*", "crates/*"}));
}

TEST_F(TomlTest, TypeMismatchReturnsNullopt) {
    auto doc = parse_ok("a = 1\nb = \"x\"\n");
    EXPECT_FALSE(doc.root().get_string("a").has_value());
    EXPECT_FALSE(doc.root().get_integer("b").has_value());
    EXPECT_FALSE(doc.root().get_string_array("b").has_value());
    EXPECT_FALSE(doc.root().get_string("missing").has_value());
}

TEST_F(TomlTest, KeyOrderPreserved) {
    auto doc = parse_ok("[cmd]\nzeta = \"z\"\nalpha = \"a\"\n");
    EXPECT_EQ(doc.find({"cmd"})->key_order, (std::vector<std::string>{"zeta", "alpha"}));
}

// ============================================================================
// Nested Tables
// ============================================================================

TEST_F(TomlTest, DottedAndQuotedSections) {
    auto doc = parse_ok(R"(
[cmd]
lint = "eslint ."

[cmd.build]
default = "cargo build"
release = "cargo build --release"

[cmd."db:migrate"]
default = "sqlx migrate run"
)");

    auto children = doc.children({"cmd"});
    ASSERT_EQ(children.size(), 2u);
    EXPECT_EQ(children[0]->path, (std::vector<std::string>{"cmd", "build"}));
    EXPECT_EQ(children[1]->path, (std::vector<std::string>{"cmd", "db:migrate"}));
    EXPECT_EQ(children[0]->get_string("release"), "cargo build --release");
}

TEST_F(TomlTest, InlineTableBecomesChildSection) {
    auto doc = parse_ok(R"(
[cmd]
test = { default = "cargo test", deps = ["core"] }
)");

    const auto* test = doc.find({"cmd", "test"});
    ASSERT_NE(test, nullptr);
    EXPECT_EQ(test->get_string("default"), "cargo test");
    EXPECT_EQ(test->get_string_array("deps"), (std::vector<std::string>{"core"}));
    EXPECT_EQ(doc.find({"cmd"})->find("test"), nullptr);
}

TEST_F(TomlTest, DottedKeyAssignment) {
    auto doc = parse_ok("[cmd]\nbuild.default = \"make\"\n");
    const auto* build = doc.find({"cmd", "build"});
    ASSERT_NE(build, nullptr);
    EXPECT_EQ(build->get_string("default"), "make");
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(TomlTest, DuplicateKey) {
    auto error = parse_err("[cmd]\nbuild = \"a\"\nbuild = \"b\"\n");
    EXPECT_EQ(error.message, "duplicate key 'build'");
    EXPECT_EQ(error.line, 3);
}

TEST_F(TomlTest, DuplicateSection) {
    auto error = parse_err("[a]\nx = 1\n[a]\n");
    EXPECT_EQ(error.message, "duplicate section");
}

TEST_F(TomlTest, UnsupportedConstructs) {
    EXPECT_EQ(parse_err("[[bin]]\n").message, "arrays of tables are not supported");
    EXPECT_EQ(parse_err("x = 1.5\n").message, "floating point values are not supported");
    EXPECT_EQ(parse_err("x = [1, 2]\n").message, "only arrays of strings are supported");
}

TEST_F(TomlTest, IntegerLimits) {
    auto doc = parse_ok("max = 9223372036854775807\nmin = -9223372036854775808\nsep = 1_000\n");
    EXPECT_EQ(doc.root().get_integer("max"), std::numeric_limits<int64_t>::max());
    EXPECT_EQ(doc.root().get_integer("min"), std::numeric_limits<int64_t>::min());
    EXPECT_EQ(doc.root().get_integer("sep"), 1000);
}

TEST_F(TomlTest, IntegerOutOfRange) {
    auto error = parse_err("[services]\npostgres = 99999999999999999999\n");
    EXPECT_EQ(error.message, "integer out of range");
    EXPECT_EQ(error.line, 2);

    EXPECT_EQ(parse_err("a = 9223372036854775808\n").message, "integer out of range");
    EXPECT_EQ(parse_err("a = -9223372036854775809\n").message, "integer out of range");
}

TEST_F(TomlTest, UnterminatedString) {
    auto error = parse_err("name = \"oops\n");
    EXPECT_EQ(error.message, "unterminated string");
    EXPECT_EQ(error.line, 1);
}

TEST_F(TomlTest, GarbageAfterValue) {
    auto error = parse_err("name = \"x\" y\n");
    EXPECT_EQ(error.message, "expected end of line, found 'y'");
}
