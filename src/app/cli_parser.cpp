#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>

namespace scriptgate::app::cli {

    using namespace scriptgate::core::errors;
    using scriptgate::protocol::JsonValue;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> file;
        std::optional<std::string> args_json;
        std::optional<std::string> timeout;
        std::optional<std::string> workflow_command;
        std::optional<std::string> workflow_id;
        std::vector<std::string> passthrough;
        bool saw_separator = false;
        bool verbose = false;
    };

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return GateError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        CliRequest req;
        const std::string command = argv[1];
        if (command == "validate") {
            req.command = CommandKind::Validate;
        } else if (command == "run-code") {
            req.command = CommandKind::RunCode;
        } else if (command == "run-workflow") {
            req.command = CommandKind::RunWorkflow;
        } else {
            return GateError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", kUsage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and the command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        auto take_value = [&args](size_t& i, std::optional<std::string>& slot) -> std::optional<GateError> {
            if (i + 1 >= args.size()) {
                return GateError{ErrorCategory::Input, "Missing value for " + args[i], "missing_value", kUsage};
            }
            if (slot.has_value()) {
                return GateError{ErrorCategory::Input, "Duplicate flag " + args[i], "duplicate_flag", kUsage};
            }
            slot = args[++i];
            return std::nullopt;
        };

        for (size_t i = 0; i < args.size(); ++i) {
            std::optional<GateError> error;
            if (args[i] == "--") {
                raw.saw_separator = true;
                raw.passthrough.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
                break;
            } else if (args[i] == "--file") {
                error = take_value(i, raw.file);
            } else if (args[i] == "--args-json") {
                error = take_value(i, raw.args_json);
            } else if (args[i] == "--timeout") {
                error = take_value(i, raw.timeout);
            } else if (args[i] == "--command") {
                error = take_value(i, raw.workflow_command);
            } else if (args[i] == "--id") {
                error = take_value(i, raw.workflow_id);
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return GateError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", kUsage};
            }
            if (error.has_value()) {
                return *error;
            }
        }

        // 3. Validator Phase: Enforce per-command rules
        req.verbose = raw.verbose;

        const bool is_workflow = req.command == CommandKind::RunWorkflow;
        if (!is_workflow) {
            if (!raw.file.has_value()) {
                return GateError{ErrorCategory::Input, "Missing required flag --file", "missing_required_flag", kUsage};
            }
            if (raw.workflow_command || raw.workflow_id || raw.saw_separator) {
                return GateError{ErrorCategory::Input, "--command, --id and -- are only valid for run-workflow", "conflicting_flags", kUsage};
            }
        } else {
            if (raw.file.has_value()) {
                return GateError{ErrorCategory::Input, "--file is not valid for run-workflow", "conflicting_flags", kUsage};
            }
            // Mutual Exclusion XOR check
            if (!raw.workflow_command.has_value() && !raw.workflow_id.has_value()) {
                return GateError{ErrorCategory::Input, "Must provide either --command or --id", "missing_required_flag", kUsage};
            }
            if (raw.workflow_command.has_value() && raw.workflow_id.has_value()) {
                return GateError{ErrorCategory::Input, "Cannot provide both --command and --id", "conflicting_flags", kUsage};
            }
            if (raw.workflow_command.has_value() && (raw.args_json.has_value() || raw.saw_separator)) {
                return GateError{ErrorCategory::Input, "--command carries its own flags; drop --args-json and --", "conflicting_flags", kUsage};
            }
            if (raw.args_json.has_value() && raw.saw_separator) {
                return GateError{ErrorCategory::Input, "Cannot combine --args-json with flags after --", "conflicting_flags", kUsage};
            }
        }

        if (req.command == CommandKind::Validate && (raw.args_json || raw.timeout)) {
            return GateError{ErrorCategory::Input, "validate accepts only --file", "conflicting_flags", kUsage};
        }

        if (raw.file) {
            std::filesystem::path p(raw.file.value());
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return GateError{ErrorCategory::Input, "Script file does not exist or is not a regular file: " + raw.file.value(), "invalid_path"};
            }
            req.script_file = std::move(p);
        }

        if (raw.args_json) {
            JsonValue parsed = JsonValue::parse(raw.args_json.value(), nullptr, false);
            if (parsed.is_discarded() || !parsed.is_object()) {
                return GateError{ErrorCategory::Input, "--args-json must be a JSON object", "invalid_args_json", "Example: --args-json '{\"query\": \"Foo\"}'"};
            }
            req.args = std::move(parsed);
        }

        // Exception-free integer parsing; zero or negative falls back to the configured default.
        if (raw.timeout) {
            std::int64_t seconds = 0;
            const char* begin = raw.timeout->data();
            const char* end = raw.timeout->data() + raw.timeout->size();
            auto [ptr, ec] = std::from_chars(begin, end, seconds);
            if (ec != std::errc() || ptr != end) {
                return GateError{ErrorCategory::Input, "Invalid number for --timeout", "invalid_integer", "Provide a whole number of seconds."};
            }
            req.timeout_seconds = seconds;
        }

        req.workflow_command = raw.workflow_command;
        req.workflow_id = raw.workflow_id;
        req.workflow_flags = std::move(raw.passthrough);
        return req;
    }

} // namespace scriptgate::app::cli
