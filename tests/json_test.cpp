//! # JSON Reader Tests
//!
//! Parser coverage for the subset of JSON that appears in `package.json`
//! manifests, plus error locations.

#include "common.hpp"

#include "json/json.hpp"
#include <gtest/gtest.h>

using namespace devkit;
using namespace devkit::json;

class JsonParserTest : public ::testing::Test {
protected:
    JsonValue parse_ok(std::string_view input) {
        auto result = parse_json(input);
        if (is_err(result)) {
            ADD_FAILURE() << "parse error: " << unwrap_err(result).to_string();
            return JsonValue{};
        }
        return unwrap(result);
    }

    JsonError parse_err(std::string_view input) {
        auto result = parse_json(input);
        EXPECT_TRUE(is_err(result)) << "expected a parse error for: " << input;
        return is_err(result) ? unwrap_err(result) : JsonError{};
    }
};

// ============================================================================
// Primitives
// ============================================================================

TEST_F(JsonParserTest, Keywords) {
    EXPECT_TRUE(parse_ok("null").is_null());
    EXPECT_TRUE(parse_ok("true").as_bool());
    EXPECT_FALSE(parse_ok("false").as_bool());
}

TEST_F(JsonParserTest, Numbers) {
    EXPECT_DOUBLE_EQ(parse_ok("42").as_number(), 42.0);
    EXPECT_DOUBLE_EQ(parse_ok("-3.5").as_number(), -3.5);
    EXPECT_DOUBLE_EQ(parse_ok("1e3").as_number(), 1000.0);
}

TEST_F(JsonParserTest, StringEscapes) {
    EXPECT_EQ(parse_ok(R"("a\"b\\c\nd")").as_string(), "a\"b\\c\nd");
    EXPECT_EQ(parse_ok(R"("\u00e9")").as_string(), "\xC3\xA9");
    EXPECT_EQ(parse_ok(R"("\ud83d\ude00")").as_string(), "\xF0\x9F\x98\x80");
}

// ============================================================================
// Containers
// ============================================================================

TEST_F(JsonParserTest, PackageManifest) {
    auto root = parse_ok(R"({
        "name": "@acme/web",
        "private": true,
        "workspaces": ["packages/*"],
        "scripts": {
            "build": "vite build",
            "test": "vitest"
        }
    })");

    ASSERT_TRUE(root.is_object());
    EXPECT_EQ(root.get_string("name"), "@acme/web");
    EXPECT_TRUE(root.contains("workspaces"));
    EXPECT_EQ(root.get("workspaces")->as_array().size(), 1u);

    const auto* scripts = root.get("scripts");
    ASSERT_NE(scripts, nullptr);
    ASSERT_TRUE(scripts->is_object());

    // Keys come back sorted
    auto it = scripts->as_object().begin();
    EXPECT_EQ(it->first, "build");
    EXPECT_EQ((++it)->first, "test");
}

TEST_F(JsonParserTest, MissingMembers) {
    auto root = parse_ok(R"({"version": 1})");

    EXPECT_EQ(root.get("scripts"), nullptr);
    EXPECT_EQ(root.get_string("version"), "");
    EXPECT_EQ(parse_ok("[1, 2]").get("x"), nullptr);
}

TEST_F(JsonParserTest, DuplicateKeyKeepsLast) {
    auto root = parse_ok(R"({"a": "first", "a": "second"})");
    EXPECT_EQ(root.get_string("a"), "second");
}

TEST_F(JsonParserTest, EmptyContainers) {
    EXPECT_TRUE(parse_ok("{}").as_object().empty());
    EXPECT_TRUE(parse_ok(" [ ] ").as_array().empty());
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(JsonParserTest, TrailingContent) {
    auto error = parse_err("{} x");
    EXPECT_EQ(error.message, "unexpected trailing content");
}

TEST_F(JsonParserTest, ErrorLocation) {
    auto error = parse_err("{\n  \"a\" 1\n}");
    EXPECT_EQ(error.message, "expected ':' after object key");
    EXPECT_EQ(error.line, 2u);
    EXPECT_NE(error.to_string().find("line 2"), std::string::npos);
}

TEST_F(JsonParserTest, MalformedInputs) {
    parse_err("");
    parse_err("{\"a\": }");
    parse_err("[1, 2");
    parse_err("\"unterminated");
    parse_err("tru");
    parse_err("{\"a\": 1,}");
}

TEST_F(JsonParserTest, LeadingZerosRejected) {
    EXPECT_EQ(parse_err("0123").message, "leading zeros are not allowed");
    EXPECT_EQ(parse_err("[-01]").message, "leading zeros are not allowed");
    EXPECT_DOUBLE_EQ(parse_ok("0").as_number(), 0.0);
    EXPECT_DOUBLE_EQ(parse_ok("-0.5").as_number(), -0.5);
    EXPECT_DOUBLE_EQ(parse_ok("0e2").as_number(), 0.0);
}

TEST_F(JsonParserTest, UnpairedSurrogatesRejected) {
    EXPECT_EQ(parse_err(R"("\ud800")").message, "unpaired surrogate");
    EXPECT_EQ(parse_err(R"("\ud800x")").message, "unpaired surrogate");
    EXPECT_EQ(parse_err(R"("\udc00")").message, "unpaired surrogate");
    EXPECT_EQ(parse_err(R"("\ud800\u0041")").message, "invalid surrogate pair");
}

TEST_F(JsonParserTest, NestingLimit) {
    std::string deep(JsonParser::MAX_DEPTH + 1, '[');
    deep += std::string(JsonParser::MAX_DEPTH + 1, ']');
    auto error = parse_err(deep);
    EXPECT_EQ(error.message, "maximum nesting depth exceeded");
}
