#include "discovery/gitignore.hpp"

#include <fnmatch.h>
#include <fstream>
#include <sstream>

namespace devkit::discovery {

static std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '/') {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

// Component-wise glob match where a "**" component spans zero or more components.
static bool match_parts(const std::vector<std::string>& pattern, size_t pi,
                        const std::vector<std::string>& path, size_t si) {
    while (pi < pattern.size()) {
        if (pattern[pi] == "**") {
            if (pi + 1 == pattern.size()) {
                return si < path.size();
            }
            for (size_t k = si; k <= path.size(); ++k) {
                if (match_parts(pattern, pi + 1, path, k)) {
                    return true;
                }
            }
            return false;
        }
        if (si >= path.size() || ::fnmatch(pattern[pi].c_str(), path[si].c_str(), 0) != 0) {
            return false;
        }
        ++pi;
        ++si;
    }
    return si == path.size();
}

IgnoreMatcher IgnoreMatcher::parse(const std::string& content) {
    IgnoreMatcher matcher;
    std::istringstream stream(content);
    std::string line;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        while (!line.empty() && line.back() == ' ' &&
               (line.size() < 2 || line[line.size() - 2] != '\\')) {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }

        Rule rule;
        if (line[0] == '!') {
            rule.negated = true;
            line.erase(0, 1);
        } else if (line[0] == '\\' && line.size() > 1 && (line[1] == '#' || line[1] == '!')) {
            line.erase(0, 1);
        }
        if (!line.empty() && line.back() == '/') {
            rule.dir_only = true;
            line.pop_back();
        }
        rule.anchored = line.find('/') != std::string::npos;
        rule.parts = split_path(line);
        if (rule.parts.empty()) {
            continue;
        }
        matcher.rules_.push_back(std::move(rule));
    }
    return matcher;
}

IgnoreMatcher IgnoreMatcher::load(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        return IgnoreMatcher{};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

bool IgnoreMatcher::matches_rules(const std::vector<std::string>& components,
                                  bool is_dir) const {
    bool ignored = false;
    for (const auto& rule : rules_) {
        if (rule.dir_only && !is_dir) {
            continue;
        }
        bool hit = false;
        if (rule.anchored) {
            hit = match_parts(rule.parts, 0, components, 0);
        } else {
            hit = ::fnmatch(rule.parts.front().c_str(), components.back().c_str(), 0) == 0;
        }
        if (hit) {
            ignored = !rule.negated;
        }
    }
    return ignored;
}

bool IgnoreMatcher::is_ignored(const std::string& relative, bool is_dir) const {
    if (rules_.empty()) {
        return false;
    }
    auto components = split_path(relative);
    if (components.empty()) {
        return false;
    }

    std::vector<std::string> prefix;
    for (size_t i = 0; i + 1 < components.size(); ++i) {
        prefix.push_back(components[i]);
        if (matches_rules(prefix, true)) {
            return true;
        }
    }
    return matches_rules(components, is_dir);
}

} // namespace devkit::discovery
