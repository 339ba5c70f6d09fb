#pragma once

#include <optional>
#include <string>
#include <vector>
#include "policy/script_parser.hpp"

namespace scriptgate::policy {

struct ValidatorPolicy {
    // Exact module names; submodules of an allowed module are allowed too.
    std::vector<std::string> allowed_imports = {
        "argparse", "asyncio", "json", "sys", "runtime.zoekt_tools"};

    std::vector<std::string> banned_import_prefixes = {
        "builtins", "ctypes",  "importlib", "multiprocessing", "os",      "pathlib",
        "shlex",    "shutil",  "socket",    "subprocess",      "tempfile"};

    // Matched against the final name of the callee, so both `eval(...)` and
    // `x.eval(...)` hit "eval".
    std::vector<std::string> denied_calls = {
        "__import__", "breakpoint", "compile", "eval",   "exec",      "execfile", "globals",
        "input",      "locals",     "open",    "popen",  "raw_input", "system",   "vars"};
};

enum class RejectionKind {
    SyntaxError,
    MissingEntrypoint,
    DisallowedImport,
    DisallowedCall
};

struct OffendingNode {
    std::string construct;
    SourceLocation location;
};

struct Rejection {
    RejectionKind kind = RejectionKind::SyntaxError;
    std::string reason;
    OffendingNode offending;
};

struct ValidationVerdict {
    std::optional<Rejection> rejection;

    bool accepted() const { return !rejection.has_value(); }
};

// Static gate in front of the runner. Pure: no I/O, no state between calls.
class ScriptValidator {
public:
    explicit ScriptValidator(ValidatorPolicy policy = {});

    ValidationVerdict validate(const std::string& source) const;

    const ValidatorPolicy& policy() const { return policy_; }

private:
    std::optional<Rejection> check_entrypoint(const SyntaxNode& module) const;
    std::optional<Rejection> check_imports(const SyntaxNode& module) const;
    std::optional<Rejection> check_calls(const SyntaxNode& module) const;
    std::optional<Rejection> check_module_name(const std::string& name,
                                               const SourceLocation& location) const;

    bool is_allowed_module(const std::string& name) const;
    bool is_banned_module(const std::string& name) const;

    ValidatorPolicy policy_;
};

std::string to_string(RejectionKind kind);

}  // namespace scriptgate::policy
