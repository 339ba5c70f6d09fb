#include "policy/script_validator.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace scriptgate::policy {

namespace {

bool has_prefix_module(const std::string& name, const std::string& prefix) {
    return name == prefix ||
           (name.size() > prefix.size() && name.compare(0, prefix.size(), prefix) == 0 &&
            name[prefix.size()] == '.');
}

// Can `fn(x)` bind without error?
bool accepts_one_positional(const SyntaxNode& fn) {
    std::size_t positional = 0;
    std::size_t required_positional = 0;
    bool var_positional = false;
    for (const auto& parameter : fn.parameters) {
        switch (parameter.kind) {
            case ParameterKind::Positional:
                ++positional;
                if (!parameter.has_default) {
                    ++required_positional;
                }
                break;
            case ParameterKind::VarPositional:
                var_positional = true;
                break;
            case ParameterKind::KeywordOnly:
                if (!parameter.has_default) {
                    return false;
                }
                break;
            case ParameterKind::VarKeyword:
                break;
        }
    }
    if (required_positional > 1) {
        return false;
    }
    return required_positional == 1 || positional > 0 || var_positional;
}

bool accepts_no_arguments(const SyntaxNode& fn) {
    return std::none_of(fn.parameters.begin(), fn.parameters.end(), [](const Parameter& p) {
        return (p.kind == ParameterKind::Positional || p.kind == ParameterKind::KeywordOnly) &&
               !p.has_default;
    });
}

Rejection make_rejection(RejectionKind kind, std::string reason, std::string construct,
                         const SourceLocation& location) {
    return Rejection{kind, std::move(reason), OffendingNode{std::move(construct), location}};
}

}  // namespace

ScriptValidator::ScriptValidator(ValidatorPolicy policy) : policy_(std::move(policy)) {}

ValidationVerdict ScriptValidator::validate(const std::string& source) const {
    auto parsed = parse_module(source);
    if (std::holds_alternative<SyntaxIssue>(parsed)) {
        const auto& issue = std::get<SyntaxIssue>(parsed);
        return ValidationVerdict{make_rejection(
            RejectionKind::SyntaxError,
            issue.message + " at line " + std::to_string(issue.location.line), "syntax",
            issue.location)};
    }

    const SyntaxNode& module = std::get<SyntaxNode>(parsed);
    if (auto rejection = check_entrypoint(module)) {
        return ValidationVerdict{std::move(rejection)};
    }
    if (auto rejection = check_imports(module)) {
        return ValidationVerdict{std::move(rejection)};
    }
    if (auto rejection = check_calls(module)) {
        return ValidationVerdict{std::move(rejection)};
    }
    return ValidationVerdict{};
}

std::optional<Rejection> ScriptValidator::check_entrypoint(const SyntaxNode& module) const {
    // Later top-level definitions rebind the name, as at runtime.
    std::map<std::string, const SyntaxNode*> functions;
    bool has_main_guard = false;
    for (const auto& child : module.children) {
        if (child.kind == NodeKind::FunctionDef) {
            functions[child.name] = &child;
        } else if (child.kind == NodeKind::If && child.is_main_guard) {
            has_main_guard = true;
        }
    }

    const auto run = functions.find("run");
    const bool has_run = run != functions.end();
    if (has_run && accepts_one_positional(*run->second)) {
        return std::nullopt;
    }

    // A `run` of the wrong shape still leaves the legacy entrypoint open.
    const auto main = functions.find("main");
    const bool has_parse_args = functions.count("parse_args") != 0;
    const bool has_main = main != functions.end();
    const bool legacy_shape = has_parse_args && has_main && has_main_guard;
    if (legacy_shape && accepts_no_arguments(*main->second)) {
        return std::nullopt;
    }
    if (has_run) {
        return make_rejection(RejectionKind::MissingEntrypoint,
                              "run must accept exactly one positional argument (args)", "run",
                              run->second->location);
    }
    if (legacy_shape) {
        return make_rejection(RejectionKind::MissingEntrypoint,
                              "main must be callable without arguments in legacy mode", "main",
                              main->second->location);
    }

    std::vector<std::string> missing = {"run(args)"};
    if (!has_parse_args) {
        missing.emplace_back("parse_args");
    }
    if (!has_main) {
        missing.emplace_back("main");
    }
    if (!has_main_guard) {
        missing.emplace_back("if __name__ == \"__main__\"");
    }
    std::string joined;
    for (const auto& piece : missing) {
        joined += (joined.empty() ? "" : ", ") + piece;
    }
    return make_rejection(RejectionKind::MissingEntrypoint,
                          "missing entrypoint: define run(args) or the legacy parse_args, main "
                          "and __main__ guard (missing: " +
                              joined + ")",
                          joined, module.location);
}

bool ScriptValidator::is_allowed_module(const std::string& name) const {
    return std::any_of(policy_.allowed_imports.begin(), policy_.allowed_imports.end(),
                       [&name](const std::string& allowed) {
                           return has_prefix_module(name, allowed);
                       });
}

bool ScriptValidator::is_banned_module(const std::string& name) const {
    return std::any_of(policy_.banned_import_prefixes.begin(),
                       policy_.banned_import_prefixes.end(),
                       [&name](const std::string& banned) {
                           return has_prefix_module(name, banned);
                       });
}

std::optional<Rejection> ScriptValidator::check_module_name(
    const std::string& name, const SourceLocation& location) const {
    if (is_banned_module(name)) {
        return make_rejection(RejectionKind::DisallowedImport,
                              "import of banned module '" + name + "'", name, location);
    }
    if (is_allowed_module(name)) {
        return std::nullopt;
    }
    return make_rejection(RejectionKind::DisallowedImport,
                          "import of '" + name + "' is not in the allowlist", name, location);
}

std::optional<Rejection> ScriptValidator::check_imports(const SyntaxNode& module) const {
    std::optional<Rejection> rejection;
    walk(module, [&](const SyntaxNode& node) {
        if (rejection.has_value()) {
            return;
        }
        if (node.kind == NodeKind::Import) {
            for (const auto& imported : node.names) {
                rejection = check_module_name(imported.name, node.location);
                if (rejection.has_value()) {
                    return;
                }
            }
            return;
        }
        if (node.kind != NodeKind::ImportFrom) {
            return;
        }

        if (node.relative_level > 0) {
            const std::string name = std::string(node.relative_level, '.') + node.module;
            rejection = make_rejection(RejectionKind::DisallowedImport,
                                       "relative import '" + name + "' is not allowed", name,
                                       node.location);
            return;
        }
        if (is_banned_module(node.module)) {
            rejection = check_module_name(node.module, node.location);
            return;
        }
        if (is_allowed_module(node.module)) {
            return;
        }
        // `from runtime import zoekt_tools` names the allowed module runtime.zoekt_tools.
        for (const auto& imported : node.names) {
            if (imported.name == "*") {
                rejection = check_module_name(node.module, node.location);
                return;
            }
            rejection = check_module_name(node.module + "." + imported.name, node.location);
            if (rejection.has_value()) {
                return;
            }
        }
    });
    return rejection;
}

std::optional<Rejection> ScriptValidator::check_calls(const SyntaxNode& module) const {
    std::optional<Rejection> rejection;
    walk(module, [&](const SyntaxNode& node) {
        if (rejection.has_value() || node.kind != NodeKind::Call) {
            return;
        }
        const bool denied = std::find(policy_.denied_calls.begin(), policy_.denied_calls.end(),
                                      node.name) != policy_.denied_calls.end();
        if (denied) {
            rejection = make_rejection(RejectionKind::DisallowedCall,
                                       "call to '" + node.qualified_name + "' is not allowed",
                                       node.name, node.location);
        }
    });
    return rejection;
}

std::string to_string(const RejectionKind kind) {
    switch (kind) {
        case RejectionKind::SyntaxError:
            return "syntax_error";
        case RejectionKind::MissingEntrypoint:
            return "missing_entrypoint";
        case RejectionKind::DisallowedImport:
            return "disallowed_import";
        case RejectionKind::DisallowedCall:
            return "disallowed_call";
        default:
            return "unknown";
    }
}

}  // namespace scriptgate::policy
