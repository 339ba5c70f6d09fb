#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/gate_errors.hpp"
#include "protocol/execution_contract.hpp"

namespace scriptgate::app::cli {

    enum class CommandKind {
        Validate,
        RunCode,
        RunWorkflow
    };

    struct CliRequest {
        CommandKind command = CommandKind::Validate;
        std::optional<std::filesystem::path> script_file;
        std::optional<std::string> workflow_command;   // run-workflow --command "id --flag v"
        std::optional<std::string> workflow_id;        // run-workflow --id X
        std::vector<std::string> workflow_flags;       // tokens after "--"
        std::optional<scriptgate::protocol::JsonValue> args;
        std::optional<std::int64_t> timeout_seconds;
        bool verbose = false;
    };

    inline constexpr const char* kUsage =
        "Usage: scriptgate validate --file <script.py>\n"
        "       scriptgate run-code --file <script.py> [--args-json <json>] [--timeout <seconds>]\n"
        "       scriptgate run-workflow --command \"<id> --flag value ...\" [--timeout <seconds>]\n"
        "       scriptgate run-workflow --id <id> [--args-json <json>] [--timeout <seconds>] [-- <flags>]\n"
        "Add --verbose for debug logging.";

    scriptgate::core::errors::Result<CliRequest> parse_and_validate(int argc, char* argv[]);
}
