#include "runtime/execution_orchestrator.hpp"

#include <algorithm>
#include <exception>
#include <functional>
#include <utility>
#include "core/config/run_id.hpp"
#include "core/logging/logger.hpp"
#include "runtime/result_extractor.hpp"

namespace scriptgate::runtime {

using core::errors::ErrorCategory;
using core::errors::GateError;
using protocol::ErrorKind;
using protocol::ExecutionError;
using protocol::ExecutionResult;
using protocol::JsonValue;
using protocol::OutcomeKind;
using protocol::OutputStatus;

namespace {

ExecutionResult failure(const ErrorKind kind, std::string message,
                        std::optional<std::string> offending = std::nullopt,
                        std::optional<int> line = std::nullopt,
                        std::optional<int> column = std::nullopt) {
    ExecutionResult result;
    result.ok = false;
    result.output_status = OutputStatus::NotAvailable;
    result.error = ExecutionError{kind, std::move(message), std::move(offending), line, column};
    return result;
}

ErrorKind to_error_kind(const policy::RejectionKind kind) {
    switch (kind) {
        case policy::RejectionKind::SyntaxError:
            return ErrorKind::SyntaxError;
        case policy::RejectionKind::MissingEntrypoint:
            return ErrorKind::MissingEntrypoint;
        case policy::RejectionKind::DisallowedImport:
            return ErrorKind::DisallowedImport;
        case policy::RejectionKind::DisallowedCall:
            return ErrorKind::DisallowedCall;
        default:
            return ErrorKind::Internal;
    }
}

ErrorKind to_error_kind(const GateError& error) {
    if (error.code == workflows::kUnknownWorkflowCode) {
        return ErrorKind::UnknownWorkflow;
    }
    if (error.code == workflows::kInvalidArgumentsCode) {
        return ErrorKind::InvalidArguments;
    }
    return ErrorKind::Internal;
}

std::optional<ExecutionResult> advance_or_fail(ExecutionTrace& trace, const ExecutionStage next) {
    auto advanced = trace.advance(next);
    if (core::errors::is_error(advanced)) {
        return failure(ErrorKind::Internal, core::errors::get_error(advanced).message);
    }
    return std::nullopt;
}

ExecutionResult finish(ExecutionTrace& trace, ExecutionResult result) {
    if (auto failed = advance_or_fail(trace, ExecutionStage::Extracted)) {
        return *failed;
    }
    return result;
}

// Single exit point for every public operation: whatever happens inside,
// the caller gets a result.
ExecutionResult guarded(const std::function<ExecutionResult(ExecutionTrace&)>& body) {
    ExecutionTrace trace(core::config::generate_run_id("run"));
    try {
        return body(trace);
    } catch (const std::exception& e) {
        LOG_ERROR("[" + trace.run_id() + "] Unhandled failure in stage " +
                  to_string(trace.stage()) + ": " + e.what());
        return failure(ErrorKind::Internal, std::string("internal error: ") + e.what());
    }
}

}  // namespace

std::string to_string(const ExecutionStage stage) {
    switch (stage) {
        case ExecutionStage::Received:
            return "received";
        case ExecutionStage::Materialized:
            return "materialized";
        case ExecutionStage::Validated:
            return "validated";
        case ExecutionStage::Rejected:
            return "rejected";
        case ExecutionStage::Spawned:
            return "spawned";
        case ExecutionStage::Running:
            return "running";
        case ExecutionStage::Completed:
            return "completed";
        case ExecutionStage::TimedOut:
            return "timed_out";
        case ExecutionStage::SpawnFailed:
            return "spawn_failed";
        case ExecutionStage::Extracted:
            return "extracted";
        default:
            return "unknown";
    }
}

bool is_allowed_transition(const ExecutionStage from, const ExecutionStage to) {
    switch (from) {
        case ExecutionStage::Received:
            return to == ExecutionStage::Materialized || to == ExecutionStage::Validated ||
                   to == ExecutionStage::Rejected || to == ExecutionStage::Extracted;
        case ExecutionStage::Materialized:
            return to == ExecutionStage::Validated || to == ExecutionStage::Rejected ||
                   to == ExecutionStage::Extracted;
        case ExecutionStage::Validated:
            return to == ExecutionStage::Spawned || to == ExecutionStage::Extracted;
        case ExecutionStage::Rejected:
            return to == ExecutionStage::Extracted;
        case ExecutionStage::Spawned:
            return to == ExecutionStage::Running || to == ExecutionStage::SpawnFailed;
        case ExecutionStage::Running:
            return to == ExecutionStage::Completed || to == ExecutionStage::TimedOut;
        case ExecutionStage::Completed:
        case ExecutionStage::TimedOut:
        case ExecutionStage::SpawnFailed:
            return to == ExecutionStage::Extracted;
        case ExecutionStage::Extracted:
            return false;
        default:
            return false;
    }
}

protocol::ExecutionError to_execution_error(const policy::Rejection& rejection) {
    return ExecutionError{to_error_kind(rejection.kind), rejection.reason,
                          rejection.offending.construct, rejection.offending.location.line,
                          rejection.offending.location.column};
}

ExecutionTrace::ExecutionTrace(std::string run_id) : run_id_(std::move(run_id)) {}

core::errors::Result<ExecutionStage> ExecutionTrace::advance(const ExecutionStage next) {
    if (!is_allowed_transition(stage_, next)) {
        LOG_ERROR("[" + run_id_ + "] Illegal stage transition " + to_string(stage_) + " -> " +
                  to_string(next));
        return GateError{ErrorCategory::Internal,
                         "illegal stage transition " + to_string(stage_) + " -> " +
                             to_string(next),
                         "illegal_transition"};
    }
    LOG_DEBUG("[" + run_id_ + "] " + to_string(stage_) + " -> " + to_string(next));
    stage_ = next;
    history_.push_back(next);
    return next;
}

std::optional<ExecutionError> check_source_size(const std::string& source,
                                                const std::size_t max_source_bytes) {
    if (source.size() <= max_source_bytes) {
        return std::nullopt;
    }
    return ExecutionError{ErrorKind::SourceTooLarge,
                          "script source is " + std::to_string(source.size()) +
                              " bytes; the limit is " + std::to_string(max_source_bytes),
                          std::nullopt, std::nullopt, std::nullopt};
}

ExecutionOrchestrator::ExecutionOrchestrator(core::config::GatewayConfig config,
                                             const policy::ScriptValidator& validator,
                                             const ScriptRunner& runner,
                                             const workflows::WorkflowStore* store)
    : config_(std::move(config)), validator_(validator), runner_(runner), store_(store) {}

std::uint32_t ExecutionOrchestrator::clamp_timeout(
    const std::optional<std::int64_t> timeout_seconds) const {
    std::int64_t requested = timeout_seconds.value_or(0);
    if (requested <= 0) {
        requested = config_.timeout_default_seconds;
    }
    const std::int64_t upper = std::max<std::int64_t>(1, config_.timeout_max_seconds);
    return static_cast<std::uint32_t>(std::clamp<std::int64_t>(requested, 1, upper));
}

ExecutionResult ExecutionOrchestrator::run_ad_hoc(
    const std::string& code, const JsonValue& args,
    const std::optional<std::int64_t> timeout_seconds) const {
    return guarded([&](ExecutionTrace& trace) {
        LOG_INFO("[" + trace.run_id() + "] Ad hoc execution requested (" +
                 std::to_string(code.size()) + " bytes)");
        return execute(trace, code, args, timeout_seconds);
    });
}

ExecutionResult ExecutionOrchestrator::run_workflow(
    const std::string& workflow_id, const JsonValue& args,
    const std::optional<std::int64_t> timeout_seconds) const {
    return guarded([&](ExecutionTrace& trace) {
        LOG_INFO("[" + trace.run_id() + "] Workflow '" + workflow_id + "' requested");
        if (store_ == nullptr) {
            return run_materialized(
                trace,
                GateError{ErrorCategory::Input,
                          "unknown workflow_id: " + workflow_id + ". No workflows are configured",
                          workflows::kUnknownWorkflowCode},
                timeout_seconds);
        }
        const workflows::WorkflowMaterializer materializer(*store_);
        return run_materialized(trace, materializer.materialize_args(workflow_id, args),
                                timeout_seconds);
    });
}

ExecutionResult ExecutionOrchestrator::run_workflow_flags(
    const std::string& workflow_id, const std::vector<std::string>& flag_tokens,
    const std::optional<std::int64_t> timeout_seconds) const {
    return guarded([&](ExecutionTrace& trace) {
        LOG_INFO("[" + trace.run_id() + "] Workflow '" + workflow_id + "' requested with " +
                 std::to_string(flag_tokens.size()) + " flag tokens");
        if (store_ == nullptr) {
            return run_materialized(
                trace,
                GateError{ErrorCategory::Input,
                          "unknown workflow_id: " + workflow_id + ". No workflows are configured",
                          workflows::kUnknownWorkflowCode},
                timeout_seconds);
        }
        const workflows::WorkflowMaterializer materializer(*store_);
        return run_materialized(trace, materializer.materialize_flags(workflow_id, flag_tokens),
                                timeout_seconds);
    });
}

ExecutionResult ExecutionOrchestrator::run_workflow_command(
    const std::string& command, const std::optional<std::int64_t> timeout_seconds) const {
    return guarded([&](ExecutionTrace& trace) {
        LOG_INFO("[" + trace.run_id() + "] Workflow command requested: " + command);
        if (store_ == nullptr) {
            return run_materialized(trace,
                                    GateError{ErrorCategory::Input,
                                              "unknown workflow: no workflows are configured",
                                              workflows::kUnknownWorkflowCode},
                                    timeout_seconds);
        }
        const workflows::WorkflowMaterializer materializer(*store_);
        return run_materialized(trace, materializer.materialize_command(command),
                                timeout_seconds);
    });
}

ExecutionResult ExecutionOrchestrator::run_materialized(
    ExecutionTrace& trace,
    const core::errors::Result<workflows::MaterializedWorkflow>& materialized,
    const std::optional<std::int64_t> timeout_seconds) const {
    if (core::errors::is_error(materialized)) {
        const GateError& error = core::errors::get_error(materialized);
        LOG_WARN("[" + trace.run_id() + "] Materialization failed: " + error.message);
        return finish(trace, failure(to_error_kind(error), error.message));
    }

    const auto& workflow = core::errors::get_value(materialized);
    if (auto failed = advance_or_fail(trace, ExecutionStage::Materialized)) {
        return *failed;
    }
    ExecutionResult result = execute(trace, workflow.source, workflow.args, timeout_seconds);
    result.workflow_id = workflow.workflow_id;
    return result;
}

ExecutionResult ExecutionOrchestrator::execute(
    ExecutionTrace& trace, const std::string& source, const JsonValue& args,
    const std::optional<std::int64_t> timeout_seconds) const {
    if (auto too_large = check_source_size(source, config_.max_source_bytes)) {
        ExecutionResult result;
        result.ok = false;
        result.output_status = OutputStatus::NotAvailable;
        result.error = std::move(too_large);
        return finish(trace, std::move(result));
    }
    if (!args.is_object()) {
        return finish(trace,
                      failure(ErrorKind::InvalidArguments, "args must be a JSON object"));
    }

    const auto verdict = validator_.validate(source);
    if (!verdict.accepted()) {
        const auto& rejection = *verdict.rejection;
        LOG_INFO("[" + trace.run_id() + "] Script rejected (" +
                 policy::to_string(rejection.kind) + "): " + rejection.reason);
        if (auto failed = advance_or_fail(trace, ExecutionStage::Rejected)) {
            return *failed;
        }
        ExecutionResult rejected;
        rejected.error = to_execution_error(rejection);
        return finish(trace, std::move(rejected));
    }
    if (auto failed = advance_or_fail(trace, ExecutionStage::Validated)) {
        return *failed;
    }

    protocol::ExecutionRequest request;
    request.source = source;
    request.args = args;
    request.timeout_seconds = clamp_timeout(timeout_seconds);

    SandboxSpec spec = make_sandbox_spec(config_, request.timeout_seconds);
    spec.run_id = trace.run_id();

    if (auto failed = advance_or_fail(trace, ExecutionStage::Spawned)) {
        return *failed;
    }
    auto outcome = runner_.run(request, spec);
    if (core::errors::is_error(outcome)) {
        const GateError& error = core::errors::get_error(outcome);
        LOG_ERROR("[" + trace.run_id() + "] Runner failed: " + error.message);
        // The process never started; report it the way a failed spawn is reported.
        if (auto failed = advance_or_fail(trace, ExecutionStage::SpawnFailed)) {
            return *failed;
        }
        return finish(trace, failure(ErrorKind::Internal, error.message));
    }

    const auto& raw = core::errors::get_value(outcome);
    if (raw.kind == OutcomeKind::SpawnFailed) {
        if (auto failed = advance_or_fail(trace, ExecutionStage::SpawnFailed)) {
            return *failed;
        }
    } else {
        if (auto failed = advance_or_fail(trace, ExecutionStage::Running)) {
            return *failed;
        }
        const ExecutionStage done = raw.kind == OutcomeKind::TimedOut
                                        ? ExecutionStage::TimedOut
                                        : ExecutionStage::Completed;
        if (auto failed = advance_or_fail(trace, done)) {
            return *failed;
        }
    }

    ExecutionResult result = extract_result(raw);
    LOG_INFO("[" + trace.run_id() + "] Run finished: ok=" + (result.ok ? "true" : "false") +
             " status=" + protocol::to_string(result.output_status) + " duration_ms=" +
             std::to_string(static_cast<long long>(result.duration_ms)));
    return finish(trace, std::move(result));
}

}  // namespace scriptgate::runtime
