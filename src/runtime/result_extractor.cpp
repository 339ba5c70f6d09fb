#include "runtime/result_extractor.hpp"

#include <cstring>
#include <utility>

namespace scriptgate::runtime {

using protocol::ErrorKind;
using protocol::ExecutionError;
using protocol::ExecutionResult;
using protocol::JsonValue;
using protocol::OutcomeKind;
using protocol::OutputStatus;
using protocol::RawExecutionOutcome;

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::optional<JsonValue> parse_json(const std::string& text) {
    JsonValue parsed = JsonValue::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return std::nullopt;
    }
    return parsed;
}

}  // namespace

std::optional<MarkerLine> find_result_marker(const std::string& stdout_text) {
    const std::size_t marker_length = std::strlen(kResultMarker);
    std::optional<std::size_t> found_start;
    std::size_t line_start = 0;
    while (line_start < stdout_text.size()) {
        if (stdout_text.compare(line_start, marker_length, kResultMarker) == 0) {
            found_start = line_start;
        }
        const auto newline = stdout_text.find('\n', line_start);
        if (newline == std::string::npos) {
            break;
        }
        line_start = newline + 1;
    }
    if (!found_start.has_value()) {
        return std::nullopt;
    }

    const std::size_t start = *found_start;
    const auto newline = stdout_text.find('\n', start);
    const std::size_t line_end = newline == std::string::npos ? stdout_text.size() : newline;

    MarkerLine marker;
    marker.payload = stdout_text.substr(start + marker_length, line_end - start - marker_length);
    if (!marker.payload.empty() && marker.payload.back() == '\r') {
        marker.payload.pop_back();
    }
    const std::size_t removed_end = newline == std::string::npos ? line_end : newline + 1;
    marker.remaining_stdout = stdout_text.substr(0, start) + stdout_text.substr(removed_end);
    return marker;
}

ExecutionResult extract_result(const RawExecutionOutcome& outcome) {
    ExecutionResult result;
    result.stdout_text = outcome.stdout_text;
    result.stderr_text = outcome.stderr_text;
    result.stdout_truncated = outcome.stdout_truncated;
    result.stderr_truncated = outcome.stderr_truncated;
    result.duration_ms = outcome.duration_ms;
    result.exit_code = outcome.exit_code;

    if (outcome.kind == OutcomeKind::TimedOut) {
        result.ok = false;
        result.output_status = OutputStatus::NotAvailable;
        result.error = ExecutionError{ErrorKind::TimedOut, "execution timed out", std::nullopt,
                                      std::nullopt, std::nullopt};
        return result;
    }
    if (outcome.kind == OutcomeKind::SpawnFailed) {
        result.ok = false;
        result.output_status = OutputStatus::NotAvailable;
        result.error = ExecutionError{ErrorKind::SpawnFailed,
                                      outcome.spawn_error.empty()
                                          ? "failed to start interpreter"
                                          : outcome.spawn_error,
                                      std::nullopt, std::nullopt, std::nullopt};
        return result;
    }

    const int exit_code = outcome.exit_code.value_or(-1);
    result.ok = exit_code == 0;

    // The runner's view of the full stream wins: the captured stdout may have
    // been cut before the final marker line.
    auto marker = find_result_marker(outcome.stdout_text);
    std::optional<std::string> payload;
    if (outcome.result_line.has_value()) {
        if (auto seen = find_result_marker(*outcome.result_line)) {
            payload = std::move(seen->payload);
        }
    }
    if (marker.has_value()) {
        if (!payload.has_value() || *payload == marker->payload) {
            result.stdout_text = std::move(marker->remaining_stdout);
        }
        if (!payload.has_value()) {
            payload = std::move(marker->payload);
        }
    }

    std::optional<ExecutionError> payload_error;
    if (payload.has_value()) {
        if (auto parsed = parse_json(*payload)) {
            result.result_json = std::move(*parsed);
            result.output_status = OutputStatus::Parsed;
        } else {
            result.output_status = OutputStatus::ParseError;
            payload_error = ExecutionError{ErrorKind::MalformedResultPayload,
                                           "result marker payload is not valid JSON",
                                           std::nullopt, std::nullopt, std::nullopt};
        }
    } else {
        const std::string trimmed = trim(outcome.stdout_text);
        std::optional<JsonValue> parsed;
        if (!trimmed.empty()) {
            parsed = parse_json(trimmed);
        }
        if (parsed.has_value()) {
            result.result_json = std::move(*parsed);
            result.output_status = OutputStatus::Parsed;
        } else if (!trimmed.empty()) {
            result.output_status = OutputStatus::MissingResultMarker;
        } else {
            result.output_status = OutputStatus::MissingPayload;
        }
    }

    if (!result.ok) {
        std::string message = "script exited with code " + std::to_string(exit_code);
        if (exit_code > 128) {
            message += " (signal " + std::to_string(exit_code - 128) + ")";
        }
        result.error = ExecutionError{ErrorKind::NonZeroExit, message, std::nullopt,
                                      std::nullopt, std::nullopt};
    } else {
        result.error = std::move(payload_error);
    }
    return result;
}

}  // namespace scriptgate::runtime
