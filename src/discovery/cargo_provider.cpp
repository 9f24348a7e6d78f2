#include "discovery/provider.hpp"

namespace devkit::discovery {

using catalog::Category;
using catalog::CommandBuilder;
using catalog::CommandScope;

namespace {

struct CargoAction {
    const char* id;
    const char* label;
    const char* description;
    Category category;
    std::vector<std::string> args;
};

const std::vector<CargoAction>& cargo_actions() {
    static const std::vector<CargoAction> actions = {
        {"cargo.build.all", "Build all packages", "Build all packages in workspace",
         Category::Build, {"build"}},
        {"cargo.build.release.all", "Build all (release)", "Build all packages in release mode",
         Category::Build, {"build", "--release"}},
        {"cargo.test.all", "Test all packages", "Run tests for all packages", Category::Test,
         {"test"}},
        {"cargo.clippy.all", "Lint all packages", "Run clippy on all packages",
         Category::Quality, {"clippy", "--all-targets", "--all-features", "--", "-D", "warnings"}},
        {"cargo.fmt.all", "Format all packages", "Format all packages with rustfmt",
         Category::Quality, {"fmt", "--all"}},
        {"cargo.check.all", "Check all packages", "Run cargo check on all packages",
         Category::Quality, {"check", "--all-targets", "--all-features"}},
    };
    return actions;
}

} // namespace

bool CargoProvider::is_available(const Context& ctx) const {
    return ctx.repo_has("Cargo.toml") && ctx.has_executable("cargo");
}

DiscoverResult CargoProvider::discover(const Context& ctx) const {
    std::vector<DiscoveredCommand> commands;
    for (const auto& action : cargo_actions()) {
        commands.push_back(CommandBuilder(action.id, action.label, action.category)
                               .description(action.description)
                               .source("Cargo.toml")
                               .scope(CommandScope::workspace())
                               .run("cargo", action.args, ctx.repo)
                               .build());
    }
    sort_commands(commands);
    return commands;
}

} // namespace devkit::discovery
