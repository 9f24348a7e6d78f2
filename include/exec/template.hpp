//! # Command Templates
//!
//! `{name}` placeholders in a command string are filled from an explicit
//! variable table first, then from environment variables:
//!
//! ```cpp
//! resolve("deploy {app} to {env}", {{"app", "api"}}, {{"env", "prod"}});
//! // -> "deploy api to prod"
//! ```
//!
//! A placeholder is `{` followed by one or more characters other than `}`,
//! then `}`. Substituted values are not rescanned.

#ifndef DEVKIT_EXEC_TEMPLATE_HPP
#define DEVKIT_EXEC_TEMPLATE_HPP

#include "common.hpp"

#include <map>
#include <string>
#include <vector>

namespace devkit::exec {

using VarTable = std::map<std::string, std::string>;

/// Placeholders that neither table could fill, in order of first appearance.
struct TemplateError {
    std::vector<std::string> missing;

    std::string to_string() const;
};

/// Substitutes every placeholder, or reports all unresolved names at once.
Result<std::string, TemplateError> resolve(const std::string& tmpl, const VarTable& variables,
                                           const VarTable& env);

/// Placeholder names in order of first appearance, without duplicates.
std::vector<std::string> extract_variable_names(const std::string& tmpl);

/// The current process environment.
VarTable environment_variables();

} // namespace devkit::exec

#endif // DEVKIT_EXEC_TEMPLATE_HPP
