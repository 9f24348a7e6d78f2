#include "config/config.hpp"
#include "discovery/provider.hpp"
#include "json/json.hpp"
#include "log/log.hpp"

#include <system_error>

namespace devkit::discovery {

using catalog::CommandBuilder;
using catalog::CommandScope;

const char* detect_package_manager(const fs::path& repo) {
    std::error_code ec;
    if (fs::exists(repo / "pnpm-lock.yaml", ec) || fs::exists(repo / "pnpm-workspace.yaml", ec)) {
        return "pnpm";
    }
    if (fs::exists(repo / "yarn.lock", ec)) {
        return "yarn";
    }
    return "npm";
}

static Result<json::JsonValue, std::string> read_manifest(const fs::path& path) {
    auto content = config::read_file(path);
    if (is_err(content)) {
        return unwrap_err(content).to_string();
    }
    auto json = json::parse_json(unwrap(content));
    if (is_err(json)) {
        return path.string() + ": " + unwrap_err(json).to_string();
    }
    if (!unwrap(json).is_object()) {
        return path.string() + ": top-level value is not an object";
    }
    return std::move(unwrap(json));
}

/// "@acme/web-app" -> "acme-web-app"
static std::string id_component(const std::string& manifest_name) {
    std::string result;
    for (char c : manifest_name) {
        if (c == '@' && result.empty()) {
            continue;
        }
        result += (c == '/') ? '-' : c;
    }
    return result;
}

static void add_scripts(const json::JsonValue& manifest, const fs::path& dir,
                        const std::string& fallback_name, const CommandScope& scope,
                        const char* package_manager, std::vector<DiscoveredCommand>& out) {
    const auto* scripts = manifest.get("scripts");
    if (!scripts || !scripts->is_object()) {
        return;
    }

    std::string manifest_name = manifest.get_string("name");
    std::string id_name = id_component(manifest_name.empty() ? fallback_name : manifest_name);

    for (const auto& [script, _] : scripts->as_object()) {
        std::string label;
        std::string description;
        switch (scope.kind()) {
        case CommandScope::Kind::Workspace:
            label = script + " (all)";
            description = "Run " + script + " script in all packages";
            break;
        case CommandScope::Kind::Package:
            label = script + " (" + scope.package_name() + ")";
            description = "Run " + script + " script in " + scope.package_name();
            break;
        case CommandScope::Kind::Global:
            label = script;
            description = "Run " + script + " script";
            break;
        }

        out.push_back(CommandBuilder("npm." + id_name + "." + script, label,
                                     catalog::categorize_name(script))
                          .description(description)
                          .source("package.json")
                          .scope(scope)
                          .run(package_manager, {"run", script}, dir)
                          .build());
    }
}

bool NpmProvider::is_available(const Context& ctx) const {
    return ctx.repo_has("package.json") && ctx.has_executable("node");
}

DiscoverResult NpmProvider::discover(const Context& ctx) const {
    std::vector<DiscoveredCommand> commands;
    const char* pm = detect_package_manager(ctx.repo);
    std::error_code ec;

    auto root_manifest = read_manifest(ctx.repo / "package.json");
    if (is_err(root_manifest)) {
        return unwrap_err(root_manifest);
    }
    const auto& root = unwrap(root_manifest);
    bool is_workspace = root.contains("workspaces") || ctx.repo_has("pnpm-workspace.yaml");
    add_scripts(root, ctx.repo, "root",
                is_workspace ? CommandScope::workspace() : CommandScope::global(), pm, commands);

    for (const auto& pkg : ctx.config.packages) {
        auto manifest_path = pkg.path / "package.json";
        if (!fs::exists(manifest_path, ec) || fs::equivalent(pkg.path, ctx.repo, ec)) {
            continue;
        }
        auto manifest = read_manifest(manifest_path);
        if (is_err(manifest)) {
            return unwrap_err(manifest);
        }
        add_scripts(unwrap(manifest), pkg.path, pkg.name, CommandScope::package(pkg.name), pm,
                    commands);
    }

    DEVKIT_LOG_DEBUG("discovery", "npm: " << commands.size() << " scripts via " << pm);
    sort_commands(commands);
    return commands;
}

} // namespace devkit::discovery
