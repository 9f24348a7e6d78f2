#include "discovery/engine.hpp"

#include "log/log.hpp"

#include <set>

namespace devkit::discovery {

DiscoveryEngine DiscoveryEngine::with_default_providers() {
    DiscoveryEngine engine;
    engine.register_provider(make_box<NpmProvider>());
    engine.register_provider(make_box<CargoProvider>());
    engine.register_provider(make_box<MakefileProvider>());
    engine.register_provider(make_box<ScriptProvider>());
    engine.register_provider(make_box<ComposeProvider>());
    return engine;
}

void DiscoveryEngine::register_provider(Box<CommandProvider> provider) {
    providers_.push_back(std::move(provider));
}

const std::vector<DiscoveredCommand>& DiscoveryEngine::discover(const Context& ctx) {
    if (cache_) {
        return *cache_;
    }

    std::vector<DiscoveredCommand> commands;
    std::set<std::string> ids;

    for (const auto& provider : providers_) {
        if (!provider->is_available(ctx)) {
            DEVKIT_LOG_TRACE("discovery", "Provider " << provider->name() << " not available");
            continue;
        }

        auto result = provider->discover(ctx);
        if (is_err(result)) {
            DEVKIT_LOG_DEBUG("discovery",
                             "Provider " << provider->name() << " failed: " << unwrap_err(result));
            continue;
        }

        size_t added = 0;
        for (auto& cmd : unwrap(result)) {
            if (!ids.insert(cmd.id()).second) {
                DEVKIT_LOG_DEBUG("discovery", "Dropping duplicate command id " << cmd.id()
                                                                               << " from "
                                                                               << provider->name());
                continue;
            }
            commands.push_back(std::move(cmd));
            ++added;
        }
        DEVKIT_LOG_DEBUG("discovery", "Provider " << provider->name() << ": " << added
                                                  << " commands");
    }

    cache_ = std::move(commands);
    return *cache_;
}

std::vector<const DiscoveredCommand*>
commands_in_category(const std::vector<DiscoveredCommand>& commands, catalog::Category category) {
    std::vector<const DiscoveredCommand*> result;
    for (const auto& cmd : commands) {
        if (cmd.category() == category) {
            result.push_back(&cmd);
        }
    }
    return result;
}

} // namespace devkit::discovery
