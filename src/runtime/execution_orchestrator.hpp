#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/config/gateway_config.hpp"
#include "core/errors/gate_errors.hpp"
#include "policy/script_validator.hpp"
#include "protocol/execution_contract.hpp"
#include "runtime/sandbox_runner.hpp"
#include "workflows/workflow_materializer.hpp"
#include "workflows/workflow_store.hpp"

namespace scriptgate::runtime {

enum class ExecutionStage {
    Received,
    Materialized,
    Validated,
    Rejected,
    Spawned,
    Running,
    Completed,
    TimedOut,
    SpawnFailed,
    Extracted
};

std::string to_string(ExecutionStage stage);

// Per-request stage tracker. Every accepted transition is logged; an illegal
// one is reported as an internal error and leaves the stage unchanged.
class ExecutionTrace {
public:
    explicit ExecutionTrace(std::string run_id);

    core::errors::Result<ExecutionStage> advance(ExecutionStage next);

    ExecutionStage stage() const { return stage_; }
    const std::vector<ExecutionStage>& history() const { return history_; }
    const std::string& run_id() const { return run_id_; }

private:
    std::string run_id_;
    ExecutionStage stage_ = ExecutionStage::Received;
    std::vector<ExecutionStage> history_{ExecutionStage::Received};
};

bool is_allowed_transition(ExecutionStage from, ExecutionStage to);

protocol::ExecutionError to_execution_error(const policy::Rejection& rejection);

// SourceTooLarge when the source exceeds max_source_bytes. Every entry point
// runs this before the validator sees the text.
std::optional<protocol::ExecutionError> check_source_size(const std::string& source,
                                                          std::size_t max_source_bytes);

// Composes materializer, validator, runner and extractor. Holds no mutable
// state, so one instance may serve concurrent callers.
class ExecutionOrchestrator {
public:
    ExecutionOrchestrator(core::config::GatewayConfig config,
                          const policy::ScriptValidator& validator, const ScriptRunner& runner,
                          const workflows::WorkflowStore* store = nullptr);

    protocol::ExecutionResult run_ad_hoc(
        const std::string& code,
        const protocol::JsonValue& args = protocol::JsonValue::object(),
        std::optional<std::int64_t> timeout_seconds = std::nullopt) const;

    protocol::ExecutionResult run_workflow(
        const std::string& workflow_id, const protocol::JsonValue& args,
        std::optional<std::int64_t> timeout_seconds = std::nullopt) const;

    protocol::ExecutionResult run_workflow_flags(
        const std::string& workflow_id, const std::vector<std::string>& flag_tokens,
        std::optional<std::int64_t> timeout_seconds = std::nullopt) const;

    protocol::ExecutionResult run_workflow_command(
        const std::string& command,
        std::optional<std::int64_t> timeout_seconds = std::nullopt) const;

    // Absent or non-positive means the configured default; the result is
    // always within [1, timeout_max_seconds].
    std::uint32_t clamp_timeout(std::optional<std::int64_t> timeout_seconds) const;

private:
    protocol::ExecutionResult execute(ExecutionTrace& trace, const std::string& source,
                                      const protocol::JsonValue& args,
                                      std::optional<std::int64_t> timeout_seconds) const;

    protocol::ExecutionResult run_materialized(
        ExecutionTrace& trace,
        const core::errors::Result<workflows::MaterializedWorkflow>& materialized,
        std::optional<std::int64_t> timeout_seconds) const;

    core::config::GatewayConfig config_;
    const policy::ScriptValidator& validator_;
    const ScriptRunner& runner_;
    const workflows::WorkflowStore* store_;
};

}  // namespace scriptgate::runtime
