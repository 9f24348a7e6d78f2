#include "registry/command_entry.hpp"

namespace devkit::registry {

const std::string& CommandEntry::default_command() const {
    if (const auto* s = std::get_if<Simple>(&data_)) {
        return s->command;
    }
    return std::get<Full>(data_).default_command;
}

const std::string& CommandEntry::variant(const std::string& name) const {
    if (const auto* s = std::get_if<Simple>(&data_)) {
        return s->command;
    }
    const auto& full = std::get<Full>(data_);
    auto it = full.variants.find(name);
    return it == full.variants.end() ? full.default_command : it->second;
}

bool CommandEntry::has_variant(const std::string& name) const {
    if (const auto* full = std::get_if<Full>(&data_)) {
        return full->variants.count(name) != 0;
    }
    return false;
}

std::vector<std::string> CommandEntry::variant_names() const {
    std::vector<std::string> names;
    if (const auto* full = std::get_if<Full>(&data_)) {
        for (const auto& [name, _] : full->variants) {
            names.push_back(name);
        }
    }
    return names;
}

const std::vector<std::string>& CommandEntry::deps() const {
    static const std::vector<std::string> no_deps;
    if (const auto* full = std::get_if<Full>(&data_)) {
        return full->deps;
    }
    return no_deps;
}

} // namespace devkit::registry
