#include "config/config.hpp"
#include "discovery/provider.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <system_error>
#include <yaml-cpp/yaml.h>

namespace devkit::discovery {

using catalog::Category;
using catalog::CommandBuilder;
using catalog::CommandScope;

const std::vector<std::string>& compose_file_names() {
    static const std::vector<std::string> names = {"docker-compose.yml", "docker-compose.yaml",
                                                   "compose.yml", "compose.yaml"};
    return names;
}

static std::optional<std::string> find_compose_file(const Context& ctx) {
    for (const auto& name : compose_file_names()) {
        if (ctx.repo_has(name)) {
            return name;
        }
    }
    return std::nullopt;
}

Result<std::vector<std::string>, std::string> parse_compose_services(const std::string& yaml) {
    std::vector<std::string> services;
    try {
        YAML::Node root = YAML::Load(yaml);
        if (!root.IsMap()) {
            return services;
        }
        YAML::Node section = root["services"];
        if (!section || !section.IsMap()) {
            return services;
        }
        for (auto it = section.begin(); it != section.end(); ++it) {
            if (it->first.IsScalar()) {
                services.push_back(it->first.as<std::string>());
            }
        }
    } catch (const YAML::Exception& e) {
        return std::string(e.what());
    }
    std::sort(services.begin(), services.end());
    return services;
}

bool ComposeProvider::is_available(const Context& ctx) const {
    return find_compose_file(ctx).has_value() &&
           (ctx.has_executable("docker") || ctx.has_executable("docker-compose"));
}

DiscoverResult ComposeProvider::discover(const Context& ctx) const {
    std::vector<DiscoveredCommand> commands;
    auto compose_file = find_compose_file(ctx);
    if (!compose_file) {
        return commands;
    }

    // "docker compose ..." when the plugin CLI is present, else "docker-compose ..."
    std::string program = "docker-compose";
    std::vector<std::string> base_args;
    if (ctx.has_executable("docker")) {
        program = "docker";
        base_args.push_back("compose");
    }

    auto add = [&](const std::string& id, const std::string& label, const std::string& description,
                   Category category, std::vector<std::string> args) {
        std::vector<std::string> full_args = base_args;
        full_args.insert(full_args.end(), args.begin(), args.end());
        commands.push_back(CommandBuilder(id, label, category)
                               .description(description)
                               .source(*compose_file)
                               .scope(CommandScope::global())
                               .run(program, std::move(full_args), ctx.repo)
                               .build());
    };

    add("compose.up", "Start services", "Start all Docker services", Category::Services,
        {"up", "-d"});
    add("compose.down", "Stop services", "Stop all Docker services", Category::Services,
        {"down"});
    add("compose.logs", "View logs", "Follow logs from all containers", Category::Services,
        {"logs", "-f", "--tail", "200"});
    add("compose.restart", "Restart services", "Restart Docker services", Category::Services,
        {"restart"});
    add("compose.build", "Build images", "Build Docker images", Category::Build, {"build"});
    add("compose.ps", "Show containers", "Show running containers", Category::Services, {"ps"});

    auto content = config::read_file(ctx.repo / *compose_file);
    if (is_err(content)) {
        return unwrap_err(content).to_string();
    }
    auto services = parse_compose_services(unwrap(content));
    if (is_err(services)) {
        return *compose_file + ": " + unwrap_err(services);
    }
    for (const auto& service : unwrap(services)) {
        add("compose.logs." + service, "Logs: " + service, "Follow logs from " + service,
            Category::Services, {"logs", "-f", "--tail", "200", service});
    }

    sort_commands(commands);
    return commands;
}

} // namespace devkit::discovery
