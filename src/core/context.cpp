#include "core/context.hpp"

#include <cstdlib>
#include <system_error>
#include <unistd.h>

namespace devkit {

std::vector<fs::path> split_search_path(const std::string& path_var) {
    std::vector<fs::path> dirs;
    size_t start = 0;
    while (start <= path_var.size()) {
        size_t end = path_var.find(':', start);
        if (end == std::string::npos) {
            end = path_var.size();
        }
        if (end > start) {
            dirs.emplace_back(path_var.substr(start, end - start));
        }
        start = end + 1;
    }
    return dirs;
}

Context Context::create(config::WorkspaceConfig config, bool quiet) {
    Context ctx;
    ctx.repo = config.repo_root;
    ctx.quiet = quiet;
    ctx.config = std::move(config);
    if (const char* path = std::getenv("PATH")) {
        ctx.search_path = split_search_path(path);
    }
    return ctx;
}

std::optional<fs::path> Context::find_executable(const std::string& name) const {
    std::error_code ec;
    for (const auto& dir : search_path) {
        auto candidate = dir / name;
        if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

bool Context::repo_has(const fs::path& relative) const {
    std::error_code ec;
    return fs::exists(repo / relative, ec);
}

} // namespace devkit
