#include "discovery/gitignore.hpp"
#include "discovery/provider.hpp"
#include "log/log.hpp"

#include <fstream>
#include <sys/stat.h>
#include <system_error>

namespace devkit::discovery {

using catalog::CommandBuilder;
using catalog::CommandScope;

static constexpr int DESCRIPTION_SCAN_LINES = 20;

const std::vector<std::string>& script_directories() {
    static const std::vector<std::string> dirs = {"bin", "scripts", ".dev/scripts", "tools"};
    return dirs;
}

static bool is_executable(const fs::path& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        return false;
    }
    return S_ISREG(st.st_mode) && (st.st_mode & 0111) != 0;
}

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

std::optional<std::string> extract_script_description(const fs::path& script) {
    std::ifstream file(script);
    if (!file) {
        return std::nullopt;
    }

    static const std::string marker = "# Description:";
    std::optional<std::string> plain;
    std::string line;
    for (int i = 0; i < DESCRIPTION_SCAN_LINES && std::getline(file, line); ++i) {
        std::string trimmed = trim(line);
        if (trimmed.rfind(marker, 0) == 0) {
            return trim(trimmed.substr(marker.size()));
        }
        if (plain || trimmed.rfind("#!", 0) == 0 || trimmed.rfind("# ", 0) != 0) {
            continue;
        }
        std::string comment = trim(trimmed.substr(2));
        if (comment.empty() || comment[0] == '!' || comment.find("bin/") != std::string::npos ||
            comment.find("usr/") != std::string::npos) {
            continue;
        }
        if (comment.size() > 10 && comment.size() < 100) {
            plain = comment;
        }
    }
    return plain;
}

bool ScriptProvider::is_available(const Context& ctx) const {
    for (const auto& dir : script_directories()) {
        if (ctx.repo_has(dir)) {
            return true;
        }
    }
    return false;
}

static void discover_in(const Context& ctx, const std::string& dir, const IgnoreMatcher& ignore,
                        std::vector<DiscoveredCommand>& out) {
    std::error_code ec;
    auto dir_path = ctx.repo / dir;
    if (!fs::is_directory(dir_path, ec) || ignore.is_ignored(dir, true)) {
        return;
    }

    fs::directory_iterator it(dir_path, ec);
    if (ec) {
        DEVKIT_LOG_DEBUG("discovery", "Cannot list " << dir_path.string() << ": " << ec.message());
        return;
    }

    std::string id_dir = dir;
    for (auto& c : id_dir) {
        if (c == '/') {
            c = '_';
        }
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        const auto& entry = *it;
        const auto& path = entry.path();
        std::string file_name = path.filename().string();
        if (file_name.empty() || file_name[0] == '.') {
            continue;
        }
        if (entry.is_directory(ec) || !is_executable(path)) {
            continue;
        }
        std::string relative = dir + "/" + file_name;
        if (ignore.is_ignored(relative, false)) {
            DEVKIT_LOG_TRACE("discovery", "Ignored script " << relative);
            continue;
        }

        auto description = extract_script_description(path);
        out.push_back(CommandBuilder("script." + id_dir + "." + file_name, file_name,
                                     catalog::categorize_name(file_name))
                          .description(description ? *description : "Run " + file_name + " script")
                          .source(relative)
                          .scope(CommandScope::global())
                          .run(path.string(), {}, dir_path)
                          .build());
    }
}

DiscoverResult ScriptProvider::discover(const Context& ctx) const {
    std::vector<DiscoveredCommand> commands;
    auto ignore = IgnoreMatcher::load(ctx.repo / ".gitignore");

    for (const auto& dir : script_directories()) {
        discover_in(ctx, dir, ignore, commands);
    }

    sort_commands(commands);
    return commands;
}

} // namespace devkit::discovery
