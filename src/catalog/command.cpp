#include "catalog/command.hpp"

#include <sstream>

namespace devkit::catalog {

const char* category_label(Category category) {
    switch (category) {
    case Category::Build:
        return "Build";
    case Category::Test:
        return "Test";
    case Category::Quality:
        return "Quality";
    case Category::Services:
        return "Services";
    case Category::Database:
        return "Database";
    case Category::Dev:
        return "Development";
    case Category::Deploy:
        return "Deploy";
    case Category::Git:
        return "Git";
    case Category::Dependencies:
        return "Dependencies";
    case Category::Scripts:
        return "Scripts";
    case Category::Other:
        return "Other";
    }
    return "Other";
}

const char* category_name(Category category) {
    switch (category) {
    case Category::Build:
        return "build";
    case Category::Test:
        return "test";
    case Category::Quality:
        return "quality";
    case Category::Services:
        return "services";
    case Category::Database:
        return "database";
    case Category::Dev:
        return "dev";
    case Category::Deploy:
        return "deploy";
    case Category::Git:
        return "git";
    case Category::Dependencies:
        return "dependencies";
    case Category::Scripts:
        return "scripts";
    case Category::Other:
        return "other";
    }
    return "other";
}

std::optional<Category> parse_category(std::string_view name) {
    for (Category c : category_display_order()) {
        if (name == category_name(c)) {
            return c;
        }
    }
    return std::nullopt;
}

const std::array<Category, 11>& category_display_order() {
    static const std::array<Category, 11> order = {
        Category::Dev,     Category::Build, Category::Test,         Category::Quality,
        Category::Services, Category::Database, Category::Deploy,   Category::Git,
        Category::Dependencies, Category::Scripts, Category::Other};
    return order;
}

std::string CommandScope::label() const {
    switch (kind_) {
    case Kind::Workspace:
        return "workspace";
    case Kind::Package:
        return package_;
    case Kind::Global:
        return "global";
    }
    return "global";
}

static bool needs_quoting(const std::string& arg) {
    if (arg.empty()) {
        return true;
    }
    for (char c : arg) {
        if (c == ' ' || c == '\t' || c == '\'' || c == '"' || c == '$' || c == '\\' || c == '&' ||
            c == '|' || c == ';' || c == '<' || c == '>' || c == '*' || c == '?') {
            return true;
        }
    }
    return false;
}

static std::string quote_arg(const std::string& arg) {
    if (!needs_quoting(arg)) {
        return arg;
    }
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string ExecutionDescriptor::to_string() const {
    std::ostringstream oss;
    oss << quote_arg(program);
    for (const auto& arg : args) {
        oss << ' ' << quote_arg(arg);
    }
    return oss.str();
}

DiscoveredCommand::DiscoveredCommand(std::string id, std::string label, std::string description,
                                     std::string source, Category category, CommandScope scope,
                                     ExecutionDescriptor execution)
    : id_(std::move(id)), label_(std::move(label)), description_(std::move(description)),
      source_(std::move(source)), category_(category), scope_(std::move(scope)),
      execution_(std::move(execution)) {}

Category categorize_name(std::string_view name) {
    auto has = [name](std::string_view word) { return name.find(word) != std::string_view::npos; };

    if (has("build") || has("compile"))
        return Category::Build;
    if (has("test"))
        return Category::Test;
    if (has("lint") || has("check") || has("format") || has("fmt") || has("prettier") ||
        has("tsc"))
        return Category::Quality;
    if (has("deploy") || has("release") || has("publish"))
        return Category::Deploy;
    if (has("dev") || has("serve") || has("watch") || has("start"))
        return Category::Dev;
    if (has("clean") || has("install") || has("setup"))
        return Category::Other;
    return Category::Scripts;
}

} // namespace devkit::catalog
