#include "core/config/gateway_config.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace scriptgate::core::config {

using errors::ErrorCategory;
using errors::GateError;

namespace {

constexpr const char* kBackendUrl = "ZOEKT_API_URL";
constexpr const char* kSsePort = "MCP_SSE_PORT";
constexpr const char* kStreamableHttpPort = "MCP_STREAMABLE_HTTP_PORT";
constexpr const char* kTimeoutDefault = "EXECUTION_TIMEOUT_DEFAULT";
constexpr const char* kTimeoutMax = "EXECUTION_TIMEOUT_MAX";
constexpr const char* kStdoutMaxBytes = "EXECUTION_STDOUT_MAX_BYTES";
constexpr const char* kStderrMaxBytes = "EXECUTION_STDERR_MAX_BYTES";
constexpr const char* kMaxSourceBytes = "EXECUTION_MAX_SOURCE_BYTES";
constexpr const char* kPython = "EXECUTION_PYTHON";
constexpr const char* kRuntimeDir = "EXECUTION_RUNTIME_DIR";
constexpr const char* kTempRoot = "EXECUTION_TEMP_ROOT";
constexpr const char* kManifestPath = "WORKFLOW_MANIFEST_PATH";
constexpr const char* kLogLevel = "SCRIPTGATE_LOG_LEVEL";

constexpr std::uint64_t kMaxBytes = std::numeric_limits<std::uint32_t>::max();

std::optional<std::string> non_empty(const EnvLookup& lookup, const char* key) {
    auto value = lookup(key);
    if (!value.has_value() || value->empty()) {
        return std::nullopt;
    }
    return value;
}

// Exception-free positive integer parsing, bounded by max_value.
errors::Result<std::uint64_t> parse_positive(const EnvLookup& lookup,
                                             const char* key,
                                             const std::uint64_t fallback,
                                             const std::uint64_t max_value) {
    const auto raw = non_empty(lookup, key);
    if (!raw.has_value()) {
        return fallback;
    }

    std::uint64_t value = 0;
    const char* begin = raw->data();
    const char* end = raw->data() + raw->size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || value == 0) {
        return GateError{ErrorCategory::Input,
                         std::string(key) + " must be a positive integer, got '" +
                             *raw + "'",
                         "invalid_config_value", "Provide a positive integer."};
    }
    if (value > max_value) {
        return GateError{ErrorCategory::Input,
                         std::string(key) + " is out of bounds: " + *raw,
                         "invalid_config_value",
                         "Must be at most " + std::to_string(max_value) + "."};
    }
    return value;
}

errors::Result<std::filesystem::path> existing_directory(const std::string& key,
                                                         const std::string& raw) {
    std::error_code ec;
    const std::filesystem::path path(raw);
    if (!std::filesystem::is_directory(path, ec) || ec) {
        return GateError{ErrorCategory::Input,
                         key + " is not a directory: " + raw, "invalid_config_path"};
    }
    auto canonical = std::filesystem::canonical(path, ec);
    if (ec) {
        return GateError{ErrorCategory::Input,
                         "Failed to canonicalize " + key + ": " + raw,
                         "invalid_config_path"};
    }
    return canonical;
}

}  // namespace

EnvLookup process_environment() {
    return [](const std::string& key) -> std::optional<std::string> {
        const char* value = std::getenv(key.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

errors::Result<std::filesystem::path> resolve_executable(
    const std::string& name, const std::optional<std::string>& search_path) {
    if (name.empty()) {
        return GateError{ErrorCategory::Input, "Interpreter name cannot be empty.",
                         "interpreter_not_found"};
    }

    if (name.find('/') != std::string::npos) {
        if (access(name.c_str(), X_OK) != 0) {
            return GateError{ErrorCategory::Input,
                             "Interpreter is not executable: " + name,
                             "interpreter_not_found"};
        }
        return std::filesystem::path(name);
    }

    std::istringstream dirs(search_path.value_or("/usr/local/bin:/usr/bin:/bin"));
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        const std::filesystem::path candidate = std::filesystem::path(dir) / name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return GateError{ErrorCategory::Input,
                     "Interpreter not found on PATH: " + name,
                     "interpreter_not_found",
                     "Set EXECUTION_PYTHON to an absolute interpreter path."};
}

errors::Result<std::size_t> load_max_source_bytes(const EnvLookup& lookup) {
    auto value = parse_positive(lookup, kMaxSourceBytes, GatewayConfig{}.max_source_bytes,
                                kMaxBytes);
    if (errors::is_error(value)) return errors::get_error(value);
    return static_cast<std::size_t>(errors::get_value(value));
}

errors::Result<GatewayConfig> load_gateway_config(const EnvLookup& lookup) {
    GatewayConfig config;

    const auto backend_url = non_empty(lookup, kBackendUrl);
    if (!backend_url.has_value()) {
        return GateError{ErrorCategory::Input,
                         std::string("Required environment variable ") + kBackendUrl +
                             " is not set",
                         "missing_config_value"};
    }
    config.backend_url = *backend_url;

    constexpr std::uint64_t kMaxPort = 65535;
    constexpr std::uint64_t kMaxSeconds = 24 * 60 * 60;

    auto sse_port = parse_positive(lookup, kSsePort, config.sse_port, kMaxPort);
    if (errors::is_error(sse_port)) return errors::get_error(sse_port);
    config.sse_port = static_cast<std::uint16_t>(errors::get_value(sse_port));

    auto http_port = parse_positive(lookup, kStreamableHttpPort,
                                    config.streamable_http_port, kMaxPort);
    if (errors::is_error(http_port)) return errors::get_error(http_port);
    config.streamable_http_port = static_cast<std::uint16_t>(errors::get_value(http_port));

    auto timeout_default = parse_positive(lookup, kTimeoutDefault,
                                          config.timeout_default_seconds, kMaxSeconds);
    if (errors::is_error(timeout_default)) return errors::get_error(timeout_default);
    config.timeout_default_seconds =
        static_cast<std::uint32_t>(errors::get_value(timeout_default));

    auto timeout_max = parse_positive(lookup, kTimeoutMax, config.timeout_max_seconds,
                                      kMaxSeconds);
    if (errors::is_error(timeout_max)) return errors::get_error(timeout_max);
    config.timeout_max_seconds = static_cast<std::uint32_t>(errors::get_value(timeout_max));

    if (config.timeout_default_seconds > config.timeout_max_seconds) {
        return GateError{ErrorCategory::Input,
                         std::string(kTimeoutDefault) + " exceeds " + kTimeoutMax,
                         "invalid_config_value",
                         "Default timeout must not be larger than the maximum."};
    }

    auto stdout_max = parse_positive(lookup, kStdoutMaxBytes, config.stdout_max_bytes,
                                     kMaxBytes);
    if (errors::is_error(stdout_max)) return errors::get_error(stdout_max);
    config.stdout_max_bytes = static_cast<std::size_t>(errors::get_value(stdout_max));

    auto stderr_max = parse_positive(lookup, kStderrMaxBytes, config.stderr_max_bytes,
                                     kMaxBytes);
    if (errors::is_error(stderr_max)) return errors::get_error(stderr_max);
    config.stderr_max_bytes = static_cast<std::size_t>(errors::get_value(stderr_max));

    auto source_max = load_max_source_bytes(lookup);
    if (errors::is_error(source_max)) return errors::get_error(source_max);
    config.max_source_bytes = errors::get_value(source_max);

    auto python = resolve_executable(non_empty(lookup, kPython).value_or("python3"),
                                     non_empty(lookup, "PATH"));
    if (errors::is_error(python)) return errors::get_error(python);
    config.python_executable = errors::get_value(python);

    if (const auto runtime_dir = non_empty(lookup, kRuntimeDir)) {
        auto dir = existing_directory(kRuntimeDir, *runtime_dir);
        if (errors::is_error(dir)) return errors::get_error(dir);
        config.runtime_dir = errors::get_value(dir);
    }

    if (const auto temp_root = non_empty(lookup, kTempRoot)) {
        auto dir = existing_directory(kTempRoot, *temp_root);
        if (errors::is_error(dir)) return errors::get_error(dir);
        config.temp_root = errors::get_value(dir);
    } else {
        std::error_code ec;
        const auto system_temp = std::filesystem::temp_directory_path(ec);
        if (!ec) {
            config.temp_root = system_temp;
        }
    }

    if (const auto manifest = non_empty(lookup, kManifestPath)) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(*manifest, ec) || ec) {
            return GateError{ErrorCategory::Input,
                             std::string(kManifestPath) + " is not a file: " + *manifest,
                             "invalid_config_path"};
        }
        config.workflow_manifest = std::filesystem::path(*manifest);
    }

    if (const auto level_text = non_empty(lookup, kLogLevel)) {
        const auto level = logging::parse_log_level(*level_text);
        if (!level.has_value()) {
            return GateError{ErrorCategory::Input,
                             std::string(kLogLevel) + " is invalid: " + *level_text,
                             "invalid_config_value",
                             "Use one of: debug, info, warn, error."};
        }
        config.log_level = *level;
    }

    return config;
}

}  // namespace scriptgate::core::config
