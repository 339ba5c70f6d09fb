#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace scriptgate::protocol {

// Ordered so that argument mappings and result payloads keep the author's key order.
using JsonValue = nlohmann::ordered_json;

// One request to execute script source. Built once, never mutated.
struct ExecutionRequest {
    std::string source;
    JsonValue args = JsonValue::object();
    std::uint32_t timeout_seconds = 0;  // already clamped by the orchestrator
};

enum class ErrorKind {
    SyntaxError,
    MissingEntrypoint,
    DisallowedImport,
    DisallowedCall,
    SourceTooLarge,
    UnknownWorkflow,
    InvalidArguments,
    SpawnFailed,
    TimedOut,
    NonZeroExit,
    MalformedResultPayload,
    Internal
};

struct ExecutionError {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
    std::optional<std::string> offending;  // import name, call name, missing construct
    std::optional<int> line;
    std::optional<int> column;
};

enum class OutcomeKind {
    Exited,
    TimedOut,
    SpawnFailed
};

// What the runner observed. Produced once, consumed once by the extractor.
struct RawExecutionOutcome {
    OutcomeKind kind = OutcomeKind::Exited;
    std::optional<int> exit_code;  // 128 + signal when killed by a signal
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    // Last full marker line of the untruncated stream, when the runner saw one.
    std::optional<std::string> result_line;
    double duration_ms = 0.0;
    std::string spawn_error;
    std::string run_id;
    std::string working_directory;
};

enum class OutputStatus {
    Parsed,
    ParseError,
    MissingResultMarker,
    MissingPayload,
    NotAvailable
};

// The only entity handed back to callers.
struct ExecutionResult {
    bool ok = false;
    std::optional<JsonValue> result_json;
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::optional<int> exit_code;
    std::optional<ExecutionError> error;
    OutputStatus output_status = OutputStatus::NotAvailable;
    double duration_ms = 0.0;
    std::optional<std::string> workflow_id;
};

inline std::string to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SyntaxError:
            return "syntax_error";
        case ErrorKind::MissingEntrypoint:
            return "missing_entrypoint";
        case ErrorKind::DisallowedImport:
            return "disallowed_import";
        case ErrorKind::DisallowedCall:
            return "disallowed_call";
        case ErrorKind::SourceTooLarge:
            return "source_too_large";
        case ErrorKind::UnknownWorkflow:
            return "unknown_workflow";
        case ErrorKind::InvalidArguments:
            return "invalid_arguments";
        case ErrorKind::SpawnFailed:
            return "spawn_failed";
        case ErrorKind::TimedOut:
            return "timed_out";
        case ErrorKind::NonZeroExit:
            return "non_zero_exit";
        case ErrorKind::MalformedResultPayload:
            return "malformed_result_payload";
        case ErrorKind::Internal:
            return "internal";
        default:
            return "unknown";
    }
}

inline std::string to_string(const OutputStatus status) {
    switch (status) {
        case OutputStatus::Parsed:
            return "parsed";
        case OutputStatus::ParseError:
            return "parse_error";
        case OutputStatus::MissingResultMarker:
            return "missing_result_marker";
        case OutputStatus::MissingPayload:
            return "missing_payload";
        case OutputStatus::NotAvailable:
            return "not_available";
        default:
            return "unknown";
    }
}

inline std::string to_string(const OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Exited:
            return "exited";
        case OutcomeKind::TimedOut:
            return "timed_out";
        case OutcomeKind::SpawnFailed:
            return "spawn_failed";
        default:
            return "unknown";
    }
}

JsonValue to_json(const ExecutionError& error);
JsonValue to_json(const ExecutionResult& result);

}  // namespace scriptgate::protocol
