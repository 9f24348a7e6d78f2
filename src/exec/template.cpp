#include "exec/template.hpp"

#include <algorithm>

extern char** environ;

namespace devkit::exec {

namespace {

struct Placeholder {
    size_t begin; ///< Index of '{'
    size_t end;   ///< One past '}'
    std::string name;
};

std::vector<Placeholder> scan(const std::string& tmpl) {
    std::vector<Placeholder> found;
    size_t pos = 0;
    while (pos < tmpl.size()) {
        size_t open = tmpl.find('{', pos);
        if (open == std::string::npos) {
            break;
        }
        size_t close = tmpl.find('}', open + 1);
        if (close == std::string::npos) {
            break;
        }
        if (close == open + 1) {
            pos = open + 1;
            continue;
        }
        found.push_back(Placeholder{open, close + 1, tmpl.substr(open + 1, close - open - 1)});
        pos = close + 1;
    }
    return found;
}

} // namespace

std::string TemplateError::to_string() const {
    std::string names;
    for (const auto& name : missing) {
        if (!names.empty()) {
            names += ", ";
        }
        names += name;
    }
    return "Missing template variables: " + names +
           ". Set them in your config or environment.";
}

Result<std::string, TemplateError> resolve(const std::string& tmpl, const VarTable& variables,
                                           const VarTable& env) {
    std::string output;
    TemplateError error;
    size_t copied = 0;

    for (const auto& ph : scan(tmpl)) {
        output.append(tmpl, copied, ph.begin - copied);
        copied = ph.end;

        auto it = variables.find(ph.name);
        if (it == variables.end()) {
            it = env.find(ph.name);
            if (it == env.end()) {
                if (std::find(error.missing.begin(), error.missing.end(), ph.name) ==
                    error.missing.end()) {
                    error.missing.push_back(ph.name);
                }
                continue;
            }
        }
        output += it->second;
    }
    output.append(tmpl, copied, std::string::npos);

    if (!error.missing.empty()) {
        return error;
    }
    return output;
}

std::vector<std::string> extract_variable_names(const std::string& tmpl) {
    std::vector<std::string> names;
    for (const auto& ph : scan(tmpl)) {
        if (std::find(names.begin(), names.end(), ph.name) == names.end()) {
            names.push_back(ph.name);
        }
    }
    return names;
}

VarTable environment_variables() {
    VarTable env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string pair(*entry);
        auto eq = pair.find('=');
        if (eq != std::string::npos) {
            env.emplace(pair.substr(0, eq), pair.substr(eq + 1));
        }
    }
    return env;
}

} // namespace devkit::exec
