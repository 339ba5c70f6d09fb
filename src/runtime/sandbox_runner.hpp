#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core/config/gateway_config.hpp"
#include "core/errors/gate_errors.hpp"
#include "protocol/execution_contract.hpp"

namespace scriptgate::runtime {

inline constexpr const char* kRunIdVariable = "SCRIPTGATE_RUN_ID";
inline constexpr const char* kArgsFileVariable = "SCRIPTGATE_ARGS_FILE";

// Per-run, read-only settings for one sandboxed execution.
struct SandboxSpec {
    std::filesystem::path temp_root = "/tmp";
    std::vector<std::string> env_allowlist;
    std::vector<std::pair<std::string, std::string>> extra_env;
    std::uint32_t timeout_seconds = 30;
    std::size_t stdout_max_bytes = 32768;
    std::size_t stderr_max_bytes = 32768;

    std::filesystem::path interpreter = "/usr/bin/python3";
    std::vector<std::string> interpreter_flags = {"-I", "-u"};
    // When set it is written next to the script and executed instead of it.
    std::optional<std::string> bootstrap_source;
    // Contents are copied into the working directory before the run.
    std::optional<std::filesystem::path> runtime_dir;

    std::string run_id;  // generated when empty
    std::chrono::milliseconds kill_grace{250};
};

// Python launcher that loads script.py and drives run(args) or legacy main().
const std::string& python_bootstrap_source();

SandboxSpec make_sandbox_spec(const core::config::GatewayConfig& config,
                              std::uint32_t timeout_seconds);

// Environment for the child: allowlisted host variables only, then the
// run-scoped variables. Returned as sorted KEY=VALUE entries.
std::vector<std::string> build_child_environment(const SandboxSpec& spec,
                                                 const core::config::EnvLookup& host_env,
                                                 const std::string& run_id,
                                                 const std::filesystem::path& args_file);

class ScriptRunner {
public:
    virtual ~ScriptRunner() = default;

    // Blocks until the child exits or the watchdog kills it. Errors are
    // reserved for failures preparing the run; a crashing or failing
    // script is a normal outcome.
    virtual core::errors::Result<protocol::RawExecutionOutcome> run(
        const protocol::ExecutionRequest& request, const SandboxSpec& spec) const = 0;
};

class SandboxRunner : public ScriptRunner {
public:
    explicit SandboxRunner(core::config::EnvLookup host_env = core::config::process_environment());

    core::errors::Result<protocol::RawExecutionOutcome> run(
        const protocol::ExecutionRequest& request, const SandboxSpec& spec) const override;

private:
    core::config::EnvLookup host_env_;
};

}  // namespace scriptgate::runtime
