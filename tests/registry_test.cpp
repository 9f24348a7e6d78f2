//! # Command Registry Tests
//!
//! CommandEntry lookups and the package/command registry.

#include "config/config.hpp"
#include "registry/registry.hpp"

#include <gtest/gtest.h>

using namespace devkit;
using namespace devkit::registry;

// ============================================================================
// CommandEntry
// ============================================================================

TEST(CommandEntryTest, SimpleEntry) {
    auto entry = CommandEntry::simple("eslint .");

    EXPECT_TRUE(entry.is_simple());
    EXPECT_EQ(entry.default_command(), "eslint .");
    EXPECT_EQ(entry.variant("release"), "eslint .");
    EXPECT_FALSE(entry.has_variant("release"));
    EXPECT_TRUE(entry.variant_names().empty());
    EXPECT_TRUE(entry.deps().empty());
}

TEST(CommandEntryTest, FullEntryVariants) {
    auto entry = CommandEntry::full("cargo build", {"core"},
                                    {{"release", "cargo build --release"}, {"debug", "cargo build -v"}});

    EXPECT_FALSE(entry.is_simple());
    EXPECT_EQ(entry.default_command(), "cargo build");
    EXPECT_TRUE(entry.has_variant("release"));
    EXPECT_EQ(entry.variant("release"), "cargo build --release");
    EXPECT_EQ(entry.variant("missing"), "cargo build");
    EXPECT_EQ(entry.variant_names(), (std::vector<std::string>{"debug", "release"}));
    EXPECT_EQ(entry.deps(), (std::vector<std::string>{"core"}));
}

// ============================================================================
// CommandRegistry
// ============================================================================

class CommandRegistryTest : public ::testing::Test {
protected:
    CommandRegistry registry;

    void SetUp() override {
        registry.add(PackageNode{"/repo/packages/web", "web",
                                 {{"build", CommandEntry::full("vite build", {"api"})},
                                  {"lint", CommandEntry::simple("eslint .")}}});
        registry.add(PackageNode{"/repo/packages/api", "api",
                                 {{"build", CommandEntry::simple("go build")}}});
        registry.add(PackageNode{"/repo/packages/docs", "docs", {}});
    }
};

TEST_F(CommandRegistryTest, LookupByName) {
    ASSERT_NE(registry.package("web"), nullptr);
    EXPECT_EQ(registry.package("web")->path, fs::path("/repo/packages/web"));
    EXPECT_EQ(registry.package("nope"), nullptr);

    ASSERT_NE(registry.get("api", "build"), nullptr);
    EXPECT_EQ(registry.get("api", "build")->default_command(), "go build");
    EXPECT_EQ(registry.get("api", "lint"), nullptr);
    EXPECT_EQ(registry.get("nope", "build"), nullptr);
}

TEST_F(CommandRegistryTest, PackagesWithCommandSortedByName) {
    auto packages = registry.packages_with("build");
    ASSERT_EQ(packages.size(), 2u);
    EXPECT_EQ(packages[0]->name, "api");
    EXPECT_EQ(packages[1]->name, "web");

    EXPECT_TRUE(registry.packages_with("deploy").empty());
}

TEST_F(CommandRegistryTest, CommandNamesAreUnique) {
    EXPECT_EQ(registry.command_names(), (std::vector<std::string>{"build", "lint"}));
}

TEST_F(CommandRegistryTest, EntriesVisitEveryCommand) {
    auto entries = registry.entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].package->name, "api");
    EXPECT_EQ(*entries[0].command, "build");
}

TEST_F(CommandRegistryTest, DuplicateAddRejected) {
    EXPECT_FALSE(registry.add(PackageNode{"/elsewhere", "web", {}}));
    EXPECT_EQ(registry.package("web")->path, fs::path("/repo/packages/web"));
    EXPECT_EQ(registry.packages().size(), 3u);
}

TEST(CommandRegistryFromPackagesTest, FirstPackageWins) {
    config::PackageConfig a;
    a.path = "/repo/a";
    a.name = "shared";
    a.commands.emplace("build", CommandEntry::simple("make"));

    config::PackageConfig b;
    b.path = "/repo/b";
    b.name = "shared";

    auto registry = CommandRegistry::from_packages({a, b});
    ASSERT_NE(registry.package("shared"), nullptr);
    EXPECT_EQ(registry.package("shared")->path, fs::path("/repo/a"));
    EXPECT_NE(registry.get("shared", "build"), nullptr);
}

TEST(CommandRegistryFromPackagesTest, EmptyRegistry) {
    CommandRegistry registry;
    EXPECT_TRUE(registry.empty());
    EXPECT_TRUE(registry.command_names().empty());
}
