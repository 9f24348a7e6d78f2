#include "config/config.hpp"

#include "json/json.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <fnmatch.h>
#include <fstream>
#include <glob.h>
#include <set>
#include <sstream>
#include <system_error>

namespace devkit::config {

std::string ConfigError::to_string() const {
    std::ostringstream oss;
    oss << path.string();
    if (line > 0) {
        oss << ":" << line;
    }
    oss << ": " << message;
    return oss.str();
}

const PackageConfig* WorkspaceConfig::find_package(const std::string& name) const {
    for (const auto& pkg : packages) {
        if (pkg.name == name) {
            return &pkg;
        }
    }
    return nullptr;
}

Result<std::string, ConfigError> read_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        return ConfigError{path, "cannot open file", 0};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return ConfigError{path, "read error", 0};
    }
    return buffer.str();
}

static Result<TomlDocument, ConfigError> load_toml(const fs::path& path) {
    auto content = read_file(path);
    if (is_err(content)) {
        return unwrap_err(content);
    }
    auto doc = parse_toml(unwrap(content));
    if (is_err(doc)) {
        const auto& err = unwrap_err(doc);
        return ConfigError{path, err.message, err.line};
    }
    return std::move(unwrap(doc));
}

// ============================================================================
// Global Config
// ============================================================================

Result<GlobalConfig, ConfigError> parse_global_config(const TomlDocument& doc,
                                                      const fs::path& path) {
    GlobalConfig global;

    if (const auto* project = doc.find({"project"})) {
        if (auto name = project->get_string("name")) {
            global.project_name = *name;
        }
    }

    if (const auto* ws = doc.find({"workspaces"})) {
        if (ws->find("packages")) {
            auto patterns = ws->get_string_array("packages");
            if (!patterns) {
                return ConfigError{path, "workspaces.packages must be an array of strings",
                                   ws->line};
            }
            global.package_patterns = *patterns;
        }
        if (ws->find("exclude")) {
            auto exclude = ws->get_string_array("exclude");
            if (!exclude) {
                return ConfigError{path, "workspaces.exclude must be an array of strings",
                                   ws->line};
            }
            global.exclude = *exclude;
        }
    }

    if (const auto* services = doc.find({"services"})) {
        for (const auto& key : services->key_order) {
            auto port = services->get_integer(key);
            if (!port || *port <= 0 || *port > 65535) {
                return ConfigError{path, "services." + key + " must be a port number",
                                   services->line};
            }
            global.service_ports[key] = *port;
        }
    }

    if (const auto* vars = doc.find({"vars"})) {
        for (const auto& key : vars->key_order) {
            auto value = vars->get_string(key);
            if (!value) {
                return ConfigError{path, "vars." + key + " must be a string", vars->line};
            }
            global.vars[key] = *value;
        }
    }

    return global;
}

// ============================================================================
// Package Commands
// ============================================================================

static Result<registry::CommandEntry, ConfigError> parse_full_entry(const TomlSection& section,
                                                                    const std::string& name,
                                                                    const fs::path& path) {
    auto default_cmd = section.get_string("default");
    if (!default_cmd) {
        return ConfigError{path, "cmd." + name + " is missing a string 'default'", section.line};
    }

    std::vector<std::string> deps;
    if (section.find("deps")) {
        auto list = section.get_string_array("deps");
        if (!list) {
            return ConfigError{path, "cmd." + name + ".deps must be an array of strings",
                               section.line};
        }
        deps = std::move(*list);
    }

    std::map<std::string, std::string> variants;
    for (const auto& key : section.key_order) {
        if (key == "default" || key == "deps") {
            continue;
        }
        auto value = section.get_string(key);
        if (!value) {
            return ConfigError{path, "cmd." + name + "." + key + " must be a string",
                               section.line};
        }
        variants[key] = *value;
    }

    return registry::CommandEntry::full(*default_cmd, std::move(deps), std::move(variants));
}

Result<std::map<std::string, registry::CommandEntry>, ConfigError>
parse_package_commands(const TomlDocument& doc, const fs::path& path) {
    std::map<std::string, registry::CommandEntry> commands;

    if (const auto* table = doc.find({"cmd"})) {
        for (const auto& key : table->key_order) {
            auto value = table->get_string(key);
            if (!value) {
                return ConfigError{path, "cmd." + key + " must be a string or a table",
                                   table->line};
            }
            commands.emplace(key, registry::CommandEntry::simple(*value));
        }
    }

    for (const auto* section : doc.children({"cmd"})) {
        const auto& name = section->path.back();
        if (commands.count(name) != 0) {
            return ConfigError{path, "cmd." + name + " is defined twice", section->line};
        }
        auto entry = parse_full_entry(*section, name, path);
        if (is_err(entry)) {
            return unwrap_err(entry);
        }
        commands.emplace(name, std::move(unwrap(entry)));
    }

    return commands;
}

// ============================================================================
// Package Name Inference
// ============================================================================

static std::optional<std::string> name_from_cargo_toml(const fs::path& dir) {
    std::error_code ec;
    auto manifest = dir / "Cargo.toml";
    if (!fs::exists(manifest, ec)) {
        return std::nullopt;
    }
    auto doc = load_toml(manifest);
    if (is_err(doc)) {
        DEVKIT_LOG_DEBUG("config", "Ignoring " << unwrap_err(doc).to_string());
        return std::nullopt;
    }
    if (const auto* package = unwrap(doc).find({"package"})) {
        return package->get_string("name");
    }
    return std::nullopt;
}

static std::optional<std::string> name_from_package_json(const fs::path& dir) {
    std::error_code ec;
    auto manifest = dir / "package.json";
    if (!fs::exists(manifest, ec)) {
        return std::nullopt;
    }
    auto content = read_file(manifest);
    if (is_err(content)) {
        return std::nullopt;
    }
    auto json = json::parse_json(unwrap(content));
    if (is_err(json)) {
        DEVKIT_LOG_DEBUG("config", "Ignoring " << manifest.string() << ": "
                                               << unwrap_err(json).to_string());
        return std::nullopt;
    }
    const auto* name = unwrap(json).get("name");
    if (!name || !name->is_string()) {
        return std::nullopt;
    }

    std::string value = name->as_string();
    if (!value.empty() && value[0] == '@') {
        auto slash = value.find('/');
        if (slash != std::string::npos && slash + 1 < value.size()) {
            return value.substr(slash + 1);
        }
    }
    return value;
}

std::string infer_package_name(const fs::path& package_dir) {
    if (auto name = name_from_cargo_toml(package_dir)) {
        return *name;
    }
    if (auto name = name_from_package_json(package_dir)) {
        return *name;
    }
    return package_dir.filename().string();
}

// ============================================================================
// Workspace Loading
// ============================================================================

std::optional<std::string> check_glob_pattern(const std::string& pattern) {
    if (pattern.empty()) {
        return "empty pattern";
    }
    if (fs::path(pattern).is_absolute()) {
        return "pattern must be relative to the repository root";
    }

    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '[') {
            size_t j = i + 1;
            if (j < pattern.size() && (pattern[j] == '!' || pattern[j] == '^')) {
                ++j;
            }
            if (j < pattern.size() && pattern[j] == ']') {
                ++j;
            }
            while (j < pattern.size() && pattern[j] != ']') {
                ++j;
            }
            if (j >= pattern.size()) {
                return "unclosed character class at position " + std::to_string(i);
            }
            i = j;
        } else if (c == '*' && i + 1 < pattern.size() && pattern[i + 1] == '*') {
            // "**" must be a whole path component
            bool starts = i == 0 || pattern[i - 1] == '/';
            bool ends = i + 2 == pattern.size() || pattern[i + 2] == '/';
            if (!starts || !ends) {
                return "'**' must form a whole path component";
            }
            ++i;
        }
    }
    return std::nullopt;
}

static std::vector<fs::path> expand_pattern(const fs::path& repo_root, const std::string& pattern) {
    std::vector<fs::path> matches;
    std::string full = (repo_root / pattern).string();

    glob_t result{};
    int rc = ::glob(full.c_str(), GLOB_MARK, nullptr, &result);
    if (rc == 0) {
        for (size_t i = 0; i < result.gl_pathc; ++i) {
            std::string match = result.gl_pathv[i];
            // GLOB_MARK appends '/' to directories
            if (!match.empty() && match.back() == '/') {
                match.pop_back();
                matches.emplace_back(match);
            }
        }
    } else if (rc != GLOB_NOMATCH) {
        DEVKIT_LOG_WARN("config", "Failed to expand workspace pattern '" << pattern << "'");
    }
    globfree(&result);
    return matches;
}

static bool is_excluded(const std::string& dir_name, const std::vector<std::string>& exclude) {
    for (const auto& pattern : exclude) {
        if (dir_name == pattern || ::fnmatch(pattern.c_str(), dir_name.c_str(), 0) == 0) {
            return true;
        }
    }
    return false;
}

static Result<PackageConfig, ConfigError> load_package(const fs::path& dir) {
    PackageConfig pkg;
    pkg.path = dir;
    pkg.dir_name = dir.filename().string();
    pkg.name = infer_package_name(dir);

    std::error_code ec;
    auto manifest = dir / "dev.toml";
    if (fs::exists(manifest, ec)) {
        auto doc = load_toml(manifest);
        if (is_err(doc)) {
            return unwrap_err(doc);
        }
        auto commands = parse_package_commands(unwrap(doc), manifest);
        if (is_err(commands)) {
            return unwrap_err(commands);
        }
        pkg.commands = std::move(unwrap(commands));
    }
    return pkg;
}

Result<WorkspaceConfig, ConfigError> load_workspace(const fs::path& repo_root) {
    WorkspaceConfig ws;
    ws.repo_root = repo_root;

    std::error_code ec;
    auto global_path = repo_root / ".dev" / "config.toml";
    if (fs::exists(global_path, ec)) {
        auto doc = load_toml(global_path);
        if (is_err(doc)) {
            return unwrap_err(doc);
        }
        auto global = parse_global_config(unwrap(doc), global_path);
        if (is_err(global)) {
            return unwrap_err(global);
        }
        ws.global = std::move(unwrap(global));
    }

    std::set<std::string> seen_dirs;
    std::set<std::string> seen_names;
    for (const auto& pattern : ws.global.package_patterns) {
        if (auto problem = check_glob_pattern(pattern)) {
            DEVKIT_LOG_WARN("config", "Skipping workspace pattern '" << pattern << "': "
                                                                     << *problem);
            continue;
        }
        for (const auto& dir : expand_pattern(repo_root, pattern)) {
            auto dir_name = dir.filename().string();
            if (is_excluded(dir_name, ws.global.exclude)) {
                DEVKIT_LOG_DEBUG("config", "Excluded package directory " << dir.string());
                continue;
            }
            if (!seen_dirs.insert(dir.lexically_normal().string()).second) {
                continue;
            }

            auto pkg = load_package(dir);
            if (is_err(pkg)) {
                return unwrap_err(pkg);
            }
            auto& loaded = unwrap(pkg);
            if (!seen_names.insert(loaded.name).second) {
                DEVKIT_LOG_WARN("config", "Package name '" << loaded.name << "' at "
                                                           << dir.string()
                                                           << " is already used; ignoring");
                continue;
            }
            DEVKIT_LOG_DEBUG("config", "Loaded package " << loaded.name << " ("
                                                         << loaded.commands.size()
                                                         << " commands)");
            ws.packages.push_back(std::move(loaded));
        }
    }

    std::sort(ws.packages.begin(), ws.packages.end(),
              [](const PackageConfig& a, const PackageConfig& b) { return a.name < b.name; });
    return ws;
}

Result<fs::path, std::string> find_repo_root(const fs::path& start) {
    std::error_code ec;
    if (const char* env = std::getenv("DEVKIT_REPO_ROOT")) {
        fs::path root(env);
        if (!root.empty() && fs::exists(root, ec)) {
            return fs::absolute(root, ec);
        }
        DEVKIT_LOG_WARN("config", "DEVKIT_REPO_ROOT=" << env << " does not exist; ignoring");
    }

    fs::path current = fs::absolute(start, ec);
    if (ec) {
        return "cannot resolve " + start.string() + ": " + ec.message();
    }
    while (true) {
        if (fs::exists(current / ".git", ec) || fs::exists(current / ".dev", ec)) {
            return current;
        }
        auto parent = current.parent_path();
        if (parent == current || parent.empty()) {
            break;
        }
        current = parent;
    }
    return "no .git or .dev directory found above " + start.string();
}

} // namespace devkit::config
