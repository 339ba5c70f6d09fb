#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/gate_errors.hpp"
#include "core/logging/logger.hpp"

namespace scriptgate::core::config {

// Immutable gateway settings, read once at startup and passed explicitly
// to the validator, runner and orchestrator.
struct GatewayConfig {
    std::string backend_url;
    std::uint16_t sse_port = 8000;
    std::uint16_t streamable_http_port = 8080;

    std::uint32_t timeout_default_seconds = 30;
    std::uint32_t timeout_max_seconds = 120;
    std::size_t stdout_max_bytes = 32768;
    std::size_t stderr_max_bytes = 32768;
    std::size_t max_source_bytes = 256 * 1024;

    std::filesystem::path python_executable = "/usr/bin/python3";
    std::optional<std::filesystem::path> runtime_dir;
    std::filesystem::path temp_root = "/tmp";
    std::optional<std::filesystem::path> workflow_manifest;
    logging::LogLevel log_level = logging::LogLevel::INFO;

    // Host variables copied into the child environment; nothing else is inherited.
    std::vector<std::string> env_allowlist = {
        "HOME", "LANG", "LC_ALL", "LC_CTYPE", "PATH", "TZ", "ZOEKT_API_URL"};
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Lookup backed by the real process environment.
EnvLookup process_environment();

errors::Result<GatewayConfig> load_gateway_config(const EnvLookup& lookup);

// Just EXECUTION_MAX_SOURCE_BYTES, for callers that validate without running.
errors::Result<std::size_t> load_max_source_bytes(const EnvLookup& lookup);

// Resolves a bare program name through a PATH-style search list. Names
// containing a slash are checked directly.
errors::Result<std::filesystem::path> resolve_executable(
    const std::string& name, const std::optional<std::string>& search_path);

}  // namespace scriptgate::core::config
