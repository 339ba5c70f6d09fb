#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/gateway_config.hpp"
#include "core/errors/gate_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/script_validator.hpp"
#include "protocol/execution_contract.hpp"
#include "runtime/execution_orchestrator.hpp"
#include "runtime/sandbox_runner.hpp"
#include "workflows/workflow_store.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitNotOk = 1;
constexpr int kExitInputError = 2;
constexpr int kExitConfigError = 3;

void print_json(const scriptgate::protocol::JsonValue& payload) {
    std::cout << payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
}

void report(const scriptgate::core::errors::GateError& err, const std::string& what) {
    LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

bool read_script(const std::filesystem::path& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return false;
    }
    out = buffer.str();
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace errors = scriptgate::core::errors;
    using scriptgate::app::cli::CommandKind;

    // 1. Parse CLI input and return normalized input errors
    auto parsed = scriptgate::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        report(errors::get_error(parsed), "Input error");
        return kExitInputError;
    }
    const auto& req = errors::get_value(parsed);
    if (req.verbose) {
        scriptgate::core::logging::Logger::get().set_level(
            scriptgate::core::logging::LogLevel::DEBUG);
    }

    std::string source;
    if (req.script_file.has_value() && !read_script(req.script_file.value(), source)) {
        LOG_ERROR("Failed to read script file: " + req.script_file->string());
        return kExitInputError;
    }

    // 2. Static validation needs only the source size limit, not the full configuration
    const scriptgate::policy::ScriptValidator validator;
    if (req.command == CommandKind::Validate) {
        auto max_source_bytes = scriptgate::core::config::load_max_source_bytes(
            scriptgate::core::config::process_environment());
        if (errors::is_error(max_source_bytes)) {
            report(errors::get_error(max_source_bytes), "Configuration error");
            return kExitConfigError;
        }
        if (auto too_large = scriptgate::runtime::check_source_size(
                source, errors::get_value(max_source_bytes))) {
            scriptgate::protocol::JsonValue payload;
            payload["accepted"] = false;
            payload["error"] = scriptgate::protocol::to_json(*too_large);
            print_json(payload);
            return kExitNotOk;
        }

        scriptgate::policy::ValidationVerdict verdict;
        try {
            verdict = validator.validate(source);
        } catch (const std::exception& ex) {
            LOG_ERROR(std::string("Validator failed: ") + ex.what());
            return kExitNotOk;
        }
        scriptgate::protocol::JsonValue payload;
        payload["accepted"] = verdict.accepted();
        payload["error"] = verdict.accepted()
                               ? scriptgate::protocol::JsonValue()
                               : scriptgate::protocol::to_json(
                                     scriptgate::runtime::to_execution_error(*verdict.rejection));
        print_json(payload);
        return verdict.accepted() ? kExitOk : kExitNotOk;
    }

    // 3. Load the immutable gateway configuration, failing fast on bad values
    auto loaded = scriptgate::core::config::load_gateway_config(
        scriptgate::core::config::process_environment());
    if (errors::is_error(loaded)) {
        report(errors::get_error(loaded), "Configuration error");
        return kExitConfigError;
    }
    const auto& config = errors::get_value(loaded);
    if (!req.verbose) {
        scriptgate::core::logging::Logger::get().set_level(config.log_level);
    }

    std::unique_ptr<scriptgate::workflows::ManifestWorkflowStore> store;
    if (config.workflow_manifest.has_value()) {
        auto manifest = scriptgate::workflows::ManifestWorkflowStore::load(
            config.workflow_manifest.value());
        if (errors::is_error(manifest)) {
            report(errors::get_error(manifest), "Workflow manifest error");
            return kExitConfigError;
        }
        store = std::make_unique<scriptgate::workflows::ManifestWorkflowStore>(
            std::move(std::get<scriptgate::workflows::ManifestWorkflowStore>(manifest)));
    }

    const scriptgate::runtime::SandboxRunner runner;
    const scriptgate::runtime::ExecutionOrchestrator orchestrator(config, validator, runner,
                                                                  store.get());

    // 4. Execute and print exactly one ExecutionResult
    scriptgate::protocol::ExecutionResult result;
    if (req.command == CommandKind::RunCode) {
        result = orchestrator.run_ad_hoc(
            source, req.args.value_or(scriptgate::protocol::JsonValue::object()),
            req.timeout_seconds);
    } else if (req.workflow_command.has_value()) {
        result = orchestrator.run_workflow_command(req.workflow_command.value(),
                                                   req.timeout_seconds);
    } else if (req.args.has_value()) {
        result = orchestrator.run_workflow(req.workflow_id.value(), req.args.value(),
                                           req.timeout_seconds);
    } else {
        result = orchestrator.run_workflow_flags(req.workflow_id.value(), req.workflow_flags,
                                                 req.timeout_seconds);
    }

    print_json(scriptgate::protocol::to_json(result));
    return result.ok ? kExitOk : kExitNotOk;
}
