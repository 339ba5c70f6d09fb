#include "protocol/execution_contract.hpp"

namespace scriptgate::protocol {

JsonValue to_json(const ExecutionError& error) {
    JsonValue payload;
    payload["kind"] = to_string(error.kind);
    payload["message"] = error.message;
    if (error.offending.has_value()) {
        payload["offending"] = error.offending.value();
    }
    if (error.line.has_value()) {
        payload["line"] = error.line.value();
    }
    if (error.column.has_value()) {
        payload["column"] = error.column.value();
    }
    return payload;
}

JsonValue to_json(const ExecutionResult& result) {
    JsonValue payload;
    payload["ok"] = result.ok;
    if (result.workflow_id.has_value()) {
        payload["workflow_id"] = result.workflow_id.value();
    }
    payload["exit_code"] =
        result.exit_code.has_value() ? JsonValue(result.exit_code.value()) : JsonValue();
    payload["output_status"] = to_string(result.output_status);
    payload["result_json"] =
        result.result_json.has_value() ? result.result_json.value() : JsonValue();
    payload["stdout"] = result.stdout_text;
    payload["stderr"] = result.stderr_text;
    payload["stdout_truncated"] = result.stdout_truncated;
    payload["stderr_truncated"] = result.stderr_truncated;
    payload["duration_ms"] = result.duration_ms;
    payload["error"] = result.error.has_value() ? to_json(result.error.value()) : JsonValue();
    return payload;
}

}  // namespace scriptgate::protocol
