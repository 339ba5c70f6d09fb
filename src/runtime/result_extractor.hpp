#pragma once

#include <optional>
#include <string>
#include "protocol/execution_contract.hpp"

namespace scriptgate::runtime {

inline constexpr const char* kResultMarker = "__RESULT_JSON__=";

struct MarkerLine {
    std::string payload;
    std::string remaining_stdout;  // stdout with the marker line removed
};

// Finds the last line that starts with the result marker.
std::optional<MarkerLine> find_result_marker(const std::string& stdout_text);

// Turns what the runner observed into the caller-facing result. Total: every
// outcome maps to exactly one result, and nothing here throws.
protocol::ExecutionResult extract_result(const protocol::RawExecutionOutcome& outcome);

}  // namespace scriptgate::runtime
