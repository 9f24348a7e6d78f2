//! # Command Entry
//!
//! A per-package declarative command from `dev.toml`:
//!
//! ```toml
//! [cmd]
//! lint = "cargo clippy"            # Simple
//!
//! [cmd.build]                      # Full
//! default = "cargo build"
//! deps = ["core", "web:bundle"]
//! release = "cargo build --release"
//! ```
//!
//! A `Simple` entry answers every variant lookup with its single command and
//! has no dependencies.

#ifndef DEVKIT_REGISTRY_COMMAND_ENTRY_HPP
#define DEVKIT_REGISTRY_COMMAND_ENTRY_HPP

#include <map>
#include <string>
#include <variant>
#include <vector>

namespace devkit::registry {

class CommandEntry {
public:
    struct Simple {
        std::string command;
    };

    struct Full {
        std::string default_command;
        std::vector<std::string> deps;
        std::map<std::string, std::string> variants;
    };

    static CommandEntry simple(std::string command) {
        return CommandEntry(Simple{std::move(command)});
    }

    static CommandEntry full(std::string default_command, std::vector<std::string> deps = {},
                             std::map<std::string, std::string> variants = {}) {
        return CommandEntry(Full{std::move(default_command), std::move(deps), std::move(variants)});
    }

    bool is_simple() const {
        return std::holds_alternative<Simple>(data_);
    }

    const std::string& default_command() const;

    /// The named variant, or the default when this entry has no such variant.
    const std::string& variant(const std::string& name) const;

    bool has_variant(const std::string& name) const;

    /// Variant names in sorted order; empty for Simple entries.
    std::vector<std::string> variant_names() const;

    /// Declared dependency references, verbatim.
    const std::vector<std::string>& deps() const;

private:
    explicit CommandEntry(Simple s) : data_(std::move(s)) {}
    explicit CommandEntry(Full f) : data_(std::move(f)) {}

    std::variant<Simple, Full> data_;
};

} // namespace devkit::registry

#endif // DEVKIT_REGISTRY_COMMAND_ENTRY_HPP
