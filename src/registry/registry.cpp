#include "registry/registry.hpp"

#include "config/config.hpp"
#include "log/log.hpp"

#include <set>

namespace devkit::registry {

CommandRegistry CommandRegistry::from_packages(const std::vector<config::PackageConfig>& packages) {
    CommandRegistry registry;
    for (const auto& pkg : packages) {
        if (!registry.add(PackageNode{pkg.path, pkg.name, pkg.commands})) {
            DEVKIT_LOG_WARN("registry", "Duplicate package name '" << pkg.name << "' at "
                                                                   << pkg.path.string()
                                                                   << "; ignoring");
        }
    }
    return registry;
}

bool CommandRegistry::add(PackageNode node) {
    std::string name = node.name;
    return packages_.emplace(std::move(name), std::move(node)).second;
}

const PackageNode* CommandRegistry::package(const std::string& name) const {
    auto it = packages_.find(name);
    return it == packages_.end() ? nullptr : &it->second;
}

const CommandEntry* CommandRegistry::get(const std::string& package,
                                         const std::string& command) const {
    const auto* node = this->package(package);
    return node ? node->find(command) : nullptr;
}

std::vector<const PackageNode*> CommandRegistry::packages_with(const std::string& command) const {
    std::vector<const PackageNode*> result;
    for (const auto& [_, node] : packages_) {
        if (node.find(command)) {
            result.push_back(&node);
        }
    }
    return result;
}

std::vector<std::string> CommandRegistry::command_names() const {
    std::set<std::string> names;
    for (const auto& [_, node] : packages_) {
        for (const auto& [cmd, _entry] : node.commands) {
            names.insert(cmd);
        }
    }
    return {names.begin(), names.end()};
}

std::vector<EntryRef> CommandRegistry::entries() const {
    std::vector<EntryRef> result;
    for (const auto& [_, node] : packages_) {
        for (const auto& [cmd, entry] : node.commands) {
            result.push_back(EntryRef{&node, &cmd, &entry});
        }
    }
    return result;
}

} // namespace devkit::registry
