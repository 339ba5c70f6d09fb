#pragma once

#include <string>
#include <vector>
#include "core/errors/gate_errors.hpp"
#include "protocol/execution_contract.hpp"
#include "workflows/workflow_store.hpp"

namespace scriptgate::workflows {

// GateError codes produced here; the orchestrator maps them to result kinds.
inline constexpr const char* kUnknownWorkflowCode = "unknown_workflow";
inline constexpr const char* kInvalidArgumentsCode = "invalid_arguments";

struct MaterializedWorkflow {
    std::string workflow_id;
    std::string source;
    protocol::JsonValue args = protocol::JsonValue::object();
};

// POSIX shell-style word splitting: quotes and backslash escapes, no expansion.
core::errors::Result<std::vector<std::string>> split_command_line(const std::string& command);

// "Usage: <id> --required <value> [--optional <value>]"
std::string usage_line(const WorkflowTemplate& workflow);

class WorkflowMaterializer {
public:
    explicit WorkflowMaterializer(const WorkflowStore& store);

    // "symbol_usage --query Foo --context-lines 2"
    core::errors::Result<MaterializedWorkflow> materialize_command(
        const std::string& command) const;

    core::errors::Result<MaterializedWorkflow> materialize_flags(
        const std::string& workflow_id, const std::vector<std::string>& flag_tokens) const;

    // Structured arguments are coerced and bounded like flags; keys outside
    // the schema are passed through untouched.
    core::errors::Result<MaterializedWorkflow> materialize_args(
        const std::string& workflow_id, const protocol::JsonValue& args) const;

private:
    core::errors::Result<const WorkflowTemplate*> resolve(const std::string& workflow_id) const;
    core::errors::Result<MaterializedWorkflow> finish(const WorkflowTemplate& workflow,
                                                      protocol::JsonValue args) const;

    const WorkflowStore& store_;
};

}  // namespace scriptgate::workflows
