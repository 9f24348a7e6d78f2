#include "config/config.hpp"
#include "discovery/provider.hpp"
#include "log/log.hpp"

#include <set>
#include <sstream>
#include <system_error>

namespace devkit::discovery {

using catalog::CommandBuilder;
using catalog::CommandScope;

static const char* const MAKEFILE_NAMES[] = {"Makefile", "makefile", "GNUmakefile"};

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

static std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream stream(s);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

static std::string join(const std::vector<std::string>& lines) {
    std::string result;
    for (const auto& line : lines) {
        if (!result.empty()) {
            result += ' ';
        }
        result += line;
    }
    return result;
}

std::vector<MakeTarget> parse_makefile_targets(const std::string& content) {
    std::vector<MakeTarget> targets;
    std::set<std::string> seen;
    std::vector<std::string> comment;
    bool in_define = false;

    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::string trimmed = trim(line);

        if (in_define) {
            if (trimmed == "endef") {
                in_define = false;
            }
            continue;
        }
        if (trimmed.empty()) {
            comment.clear();
            continue;
        }
        if (line[0] == '\t' || line[0] == ' ') {
            continue;
        }
        if (trimmed[0] == '#') {
            size_t text_start = trimmed.find_first_not_of('#');
            auto text = text_start == std::string::npos ? "" : trim(trimmed.substr(text_start));
            if (!text.empty()) {
                comment.push_back(text);
            }
            continue;
        }
        if (trimmed.rfind("define ", 0) == 0 || trimmed == "define") {
            in_define = true;
            comment.clear();
            continue;
        }

        size_t colon = trimmed.find(':');
        size_t equals = trimmed.find('=');
        if (colon == std::string::npos || (equals != std::string::npos && equals < colon)) {
            comment.clear();
            continue;
        }
        // VAR := value and VAR ::= value
        size_t after = trimmed.find_first_not_of(':', colon);
        if (after != std::string::npos && trimmed[after] == '=') {
            comment.clear();
            continue;
        }

        std::string target_list = trimmed.substr(0, colon);
        if (target_list.empty() || target_list[0] == '.' || target_list[0] == '_' ||
            target_list.find("$(") != std::string::npos ||
            target_list.find("${") != std::string::npos) {
            comment.clear();
            continue;
        }

        std::string description = join(comment);
        comment.clear();
        for (const auto& name : split_words(target_list)) {
            if (name[0] == '.' || name[0] == '_' || !seen.insert(name).second) {
                continue;
            }
            targets.push_back(MakeTarget{name, description});
        }
    }
    return targets;
}

static std::optional<fs::path> find_makefile(const fs::path& repo) {
    std::error_code ec;
    for (const char* name : MAKEFILE_NAMES) {
        if (fs::exists(repo / name, ec)) {
            return repo / name;
        }
    }
    return std::nullopt;
}

bool MakefileProvider::is_available(const Context& ctx) const {
    return find_makefile(ctx.repo).has_value() && ctx.has_executable("make");
}

DiscoverResult MakefileProvider::discover(const Context& ctx) const {
    std::vector<DiscoveredCommand> commands;
    auto makefile = find_makefile(ctx.repo);
    if (!makefile) {
        return commands;
    }

    auto content = config::read_file(*makefile);
    if (is_err(content)) {
        return unwrap_err(content).to_string();
    }

    std::string source = makefile->filename().string();
    for (const auto& target : parse_makefile_targets(unwrap(content))) {
        std::string description = target.description.empty()
                                      ? "Run make target: " + target.name
                                      : target.description;
        commands.push_back(CommandBuilder("make." + target.name, target.name,
                                          catalog::categorize_name(target.name))
                               .description(description)
                               .source(source)
                               .scope(CommandScope::global())
                               .run("make", {target.name}, ctx.repo)
                               .build());
    }

    DEVKIT_LOG_DEBUG("discovery", "make: " << commands.size() << " targets in " << source);
    sort_commands(commands);
    return commands;
}

} // namespace devkit::discovery
