//! # Ignore Rules
//!
//! Matcher for `.gitignore` files, used to hide scripts the repository does
//! not track.
//!
//! Supported: `*`, `?` and `[...]` within a path component, `**` across
//! components, `!` negation, trailing `/` for directories only, and patterns
//! anchored by a leading or inner `/`. The last matching rule wins, and
//! nothing below an ignored directory can be re-included.

#ifndef DEVKIT_DISCOVERY_GITIGNORE_HPP
#define DEVKIT_DISCOVERY_GITIGNORE_HPP

#include "common.hpp"

#include <string>
#include <vector>

namespace devkit::discovery {

class IgnoreMatcher {
public:
    IgnoreMatcher() = default;

    /// Rules from `.gitignore`-formatted text.
    static IgnoreMatcher parse(const std::string& content);

    /// Rules from a file; empty if the file is missing or unreadable.
    static IgnoreMatcher load(const fs::path& path);

    /// Is `relative` (a '/'-separated path below the root) ignored?
    bool is_ignored(const std::string& relative, bool is_dir) const;

    bool empty() const {
        return rules_.empty();
    }

private:
    struct Rule {
        std::vector<std::string> parts; ///< Pattern split on '/'
        bool negated = false;
        bool dir_only = false;
        bool anchored = false;
    };

    std::vector<Rule> rules_;

    bool matches_rules(const std::vector<std::string>& components, bool is_dir) const;
};

} // namespace devkit::discovery

#endif // DEVKIT_DISCOVERY_GITIGNORE_HPP
