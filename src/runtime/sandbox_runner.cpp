#include "runtime/sandbox_runner.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <map>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include "core/config/run_id.hpp"
#include "core/logging/logger.hpp"
#include "runtime/result_extractor.hpp"

namespace scriptgate::runtime {

using core::errors::ErrorCategory;
using core::errors::GateError;
using protocol::OutcomeKind;
using protocol::RawExecutionOutcome;

namespace {

constexpr const char* kScriptFile = "script.py";
constexpr const char* kBootstrapFile = "bootstrap.py";
constexpr const char* kArgsFile = "args.json";

// Removes the run directory on every exit path.
class ScopedRunDirectory {
public:
    ScopedRunDirectory() = default;
    ScopedRunDirectory(const ScopedRunDirectory&) = delete;
    ScopedRunDirectory& operator=(const ScopedRunDirectory&) = delete;

    ~ScopedRunDirectory() {
        if (path_.empty()) {
            return;
        }
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            LOG_WARN("Failed to remove run directory " + path_.string() + ": " + ec.message());
        }
    }

    core::errors::Result<std::filesystem::path> create(const std::filesystem::path& root,
                                                       const std::string& run_id) {
        std::string pattern = (root / ("scriptgate-" + run_id + "-XXXXXX")).string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (mkdtemp(buffer.data()) == nullptr) {
            return GateError{ErrorCategory::Internal,
                             "Failed to create run directory under " + root.string() + ": " +
                                 std::strerror(errno),
                             "run_dir_create_failed"};
        }
        path_ = std::filesystem::path(buffer.data());
        return path_;
    }

private:
    std::filesystem::path path_;
};

// Owns the child's process group until it has been reaped.
class ChildProcess {
public:
    explicit ChildProcess(const pid_t pid) : pid_(pid) {}
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    ~ChildProcess() {
        if (reaped_) {
            return;
        }
        kill_group();
        int status = 0;
        static_cast<void>(waitpid(pid_, &status, 0));
    }

    void kill_group() const {
        if (killpg(pid_, SIGKILL) != 0 && !reaped_) {
            static_cast<void>(kill(pid_, SIGKILL));
        }
    }

    bool try_reap(int& status) {
        if (reaped_) {
            return true;
        }
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            reaped_ = true;
        }
        return reaped_;
    }

    void reap(int& status) {
        if (!reaped_) {
            static_cast<void>(waitpid(pid_, &status, 0));
            reaped_ = true;
        }
    }

private:
    pid_t pid_;
    bool reaped_ = false;
};

class Pipe {
public:
    Pipe() = default;
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;
    ~Pipe() {
        close_read();
        close_write();
    }

    bool open() { return pipe2(fds_, O_CLOEXEC) == 0; }
    int read_end() const { return fds_[0]; }
    int write_end() const { return fds_[1]; }

    void close_read() {
        if (fds_[0] >= 0) {
            static_cast<void>(close(fds_[0]));
            fds_[0] = -1;
        }
    }

    void close_write() {
        if (fds_[1] >= 0) {
            static_cast<void>(close(fds_[1]));
            fds_[1] = -1;
        }
    }

private:
    int fds_[2] = {-1, -1};
};

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

// Remembers the last complete line that starts with the result marker, over
// the whole stream and not only the capped prefix. Lines longer than
// max_line are skipped.
class ResultLineTracker {
public:
    explicit ResultLineTracker(const std::size_t max_line)
        : prefix_(kResultMarker), max_line_(std::max(max_line, prefix_.size())) {}

    void feed(const char* data, const std::size_t size) {
        for (std::size_t i = 0; i < size; ++i) {
            const char c = data[i];
            if (c == '\n') {
                end_line();
                continue;
            }
            if (skipping_) {
                continue;
            }
            current_.push_back(c);
            const std::size_t length = current_.size();
            if ((length <= prefix_.size() && c != prefix_[length - 1]) || length > max_line_) {
                skipping_ = true;
                current_.clear();
            }
        }
    }

    // A final line without a trailing newline still counts.
    std::optional<std::string> finish() {
        end_line();
        return std::move(last_);
    }

private:
    void end_line() {
        if (!skipping_ && current_.size() >= prefix_.size()) {
            last_ = current_;
        }
        current_.clear();
        skipping_ = false;
    }

    std::string prefix_;
    std::size_t max_line_;
    std::string current_;
    bool skipping_ = false;
    std::optional<std::string> last_;
};

struct StreamCapture {
    Pipe* pipe = nullptr;
    bool open = true;
    std::size_t cap = 0;
    std::string text;
    bool truncated = false;
    ResultLineTracker* result_line = nullptr;
};

// Reads whatever is available; bytes past the cap are read and dropped so
// the child never blocks on a full pipe.
void drain(StreamCapture& stream) {
    if (!stream.open) {
        return;
    }
    char buffer[4096];
    while (true) {
        const ssize_t n = read(stream.pipe->read_end(), buffer, sizeof(buffer));
        if (n > 0) {
            if (stream.result_line != nullptr) {
                stream.result_line->feed(buffer, static_cast<std::size_t>(n));
            }
            const std::size_t room = stream.cap - std::min(stream.cap, stream.text.size());
            const std::size_t keep = std::min(room, static_cast<std::size_t>(n));
            stream.text.append(buffer, keep);
            if (keep < static_cast<std::size_t>(n)) {
                stream.truncated = true;
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        stream.open = false;
        stream.pipe->close_read();
        return;
    }
}

core::errors::Result<bool> write_private_file(const std::filesystem::path& path,
                                              const std::string& content) {
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return GateError{ErrorCategory::Internal, "Failed to open " + path.string(),
                             "run_file_write_failed"};
        }
        out << content;
        if (!out.good()) {
            return GateError{ErrorCategory::Internal, "Failed to write " + path.string(),
                             "run_file_write_failed"};
        }
    }
    std::error_code ec;
    std::filesystem::permissions(
        path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
        std::filesystem::perm_options::replace, ec);
    if (ec) {
        return GateError{ErrorCategory::Internal,
                         "Failed to restrict permissions on " + path.string(),
                         "run_file_write_failed"};
    }
    return true;
}

double elapsed_ms(const std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started)
        .count();
}

}  // namespace

const std::string& python_bootstrap_source() {
    static const std::string kSource = R"PY(import asyncio
import inspect
import json
import os
import runpy
import sys

RESULT_MARKER = "__RESULT_JSON__="


def _resolve(value):
    if inspect.isawaitable(value):
        async def _await():
            return await value
        return asyncio.run(_await())
    return value


def _exit_code(value):
    if isinstance(value, int) and not isinstance(value, bool):
        return value
    return None


def _takes_one_argument(fn):
    try:
        inspect.signature(fn).bind(None)
    except TypeError:
        return False
    except ValueError:
        return True
    return True


def _bootstrap():
    here = os.path.dirname(os.path.abspath(__file__))
    if here not in sys.path:
        sys.path.insert(0, here)

    args = {}
    args_path = os.environ.get("SCRIPTGATE_ARGS_FILE", "")
    if args_path:
        with open(args_path, "r", encoding="utf-8") as handle:
            args = json.load(handle)

    script = os.path.join(here, "script.py")
    namespace = runpy.run_path(script, run_name="__scriptgate__")

    run = namespace.get("run")
    if callable(run) and _takes_one_argument(run):
        value = _resolve(run(args))
        code = _exit_code(value)
        payload = None if code is not None else value
        sys.stdout.write(RESULT_MARKER + json.dumps(payload, ensure_ascii=True, default=str) + "\n")
        sys.stdout.flush()
        return code or 0

    main = namespace.get("main")
    if callable(main):
        sys.argv = [script, "--args-json", json.dumps(args, ensure_ascii=True)]
        return _exit_code(_resolve(main())) or 0

    sys.stderr.write("missing entrypoint: expected run(args) or legacy main()\n")
    return 2


if __name__ == "__main__":
    sys.exit(_bootstrap())
)PY";
    return kSource;
}

SandboxSpec make_sandbox_spec(const core::config::GatewayConfig& config,
                              const std::uint32_t timeout_seconds) {
    SandboxSpec spec;
    spec.temp_root = config.temp_root;
    spec.env_allowlist = config.env_allowlist;
    spec.timeout_seconds = timeout_seconds;
    spec.stdout_max_bytes = config.stdout_max_bytes;
    spec.stderr_max_bytes = config.stderr_max_bytes;
    spec.interpreter = config.python_executable;
    spec.bootstrap_source = python_bootstrap_source();
    spec.runtime_dir = config.runtime_dir;
    return spec;
}

std::vector<std::string> build_child_environment(const SandboxSpec& spec,
                                                 const core::config::EnvLookup& host_env,
                                                 const std::string& run_id,
                                                 const std::filesystem::path& args_file) {
    std::map<std::string, std::string> env;
    for (const auto& key : spec.env_allowlist) {
        const auto value = host_env(key);
        if (value.has_value() && !value->empty()) {
            env[key] = *value;
        }
    }
    for (const auto& [key, value] : spec.extra_env) {
        env[key] = value;
    }
    env[kRunIdVariable] = run_id;
    env[kArgsFileVariable] = args_file.string();
    env["PYTHONUNBUFFERED"] = "1";
    env["PYTHONDONTWRITEBYTECODE"] = "1";

    std::vector<std::string> entries;
    entries.reserve(env.size());
    for (const auto& [key, value] : env) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

SandboxRunner::SandboxRunner(core::config::EnvLookup host_env)
    : host_env_(std::move(host_env)) {}

core::errors::Result<RawExecutionOutcome> SandboxRunner::run(
    const protocol::ExecutionRequest& request, const SandboxSpec& spec) const {
    const std::string run_id =
        spec.run_id.empty() ? core::config::generate_run_id("run") : spec.run_id;

    ScopedRunDirectory run_directory;
    auto created = run_directory.create(spec.temp_root, run_id);
    if (core::errors::is_error(created)) {
        return core::errors::get_error(created);
    }
    const std::filesystem::path work_dir = core::errors::get_value(created);

    if (spec.runtime_dir.has_value()) {
        std::error_code ec;
        std::filesystem::copy(*spec.runtime_dir, work_dir,
                              std::filesystem::copy_options::recursive |
                                  std::filesystem::copy_options::overwrite_existing,
                              ec);
        if (ec) {
            return GateError{ErrorCategory::Internal,
                             "Failed to copy runtime directory " + spec.runtime_dir->string() +
                                 ": " + ec.message(),
                             "runtime_copy_failed"};
        }
    }

    const std::filesystem::path script_path = work_dir / kScriptFile;
    const std::filesystem::path args_path = work_dir / kArgsFile;
    auto written = write_private_file(script_path, request.source);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    written = write_private_file(
        args_path, request.args.dump(-1, ' ', true, nlohmann::json::error_handler_t::replace));
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }

    std::filesystem::path entry_path = script_path;
    if (spec.bootstrap_source.has_value()) {
        entry_path = work_dir / kBootstrapFile;
        written = write_private_file(entry_path, *spec.bootstrap_source);
        if (core::errors::is_error(written)) {
            return core::errors::get_error(written);
        }
    }

    // Everything the child needs is materialized before fork.
    std::vector<std::string> argv_storage;
    argv_storage.push_back(spec.interpreter.string());
    argv_storage.insert(argv_storage.end(), spec.interpreter_flags.begin(),
                        spec.interpreter_flags.end());
    argv_storage.push_back(entry_path.string());
    std::vector<char*> argv;
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage =
        build_child_environment(spec, host_env_, run_id, args_path);
    std::vector<char*> envp;
    for (auto& entry : env_storage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    const std::string interpreter = spec.interpreter.string();
    const std::string work_dir_text = work_dir.string();
    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0 || max_fd > 65536) {
        max_fd = 65536;
    }

    Pipe stdout_pipe;
    Pipe stderr_pipe;
    Pipe exec_error_pipe;
    if (!stdout_pipe.open() || !stderr_pipe.open() || !exec_error_pipe.open()) {
        return GateError{ErrorCategory::Internal, "Failed to create process pipes.",
                         "pipe_creation_failed"};
    }

    RawExecutionOutcome outcome;
    outcome.run_id = run_id;
    outcome.working_directory = work_dir_text;

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        outcome.kind = OutcomeKind::SpawnFailed;
        outcome.spawn_error = std::string("fork failed: ") + std::strerror(errno);
        outcome.duration_ms = elapsed_ms(started);
        LOG_ERROR(outcome.spawn_error);
        return outcome;
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        int failure = 0;
        if (chdir(work_dir_text.c_str()) != 0) {
            failure = errno;
        }
        const int dev_null = failure == 0 ? open("/dev/null", O_RDONLY) : -1;
        if (failure == 0 && dev_null < 0) {
            failure = errno;
        }
        if (failure == 0) {
            static_cast<void>(dup2(dev_null, STDIN_FILENO));
            static_cast<void>(dup2(stdout_pipe.write_end(), STDOUT_FILENO));
            static_cast<void>(dup2(stderr_pipe.write_end(), STDERR_FILENO));
            for (long fd = 3; fd < max_fd; ++fd) {
                if (fd != exec_error_pipe.write_end()) {
                    static_cast<void>(close(static_cast<int>(fd)));
                }
            }
            execve(interpreter.c_str(), argv.data(), envp.data());
            failure = errno;
        }
        static_cast<void>(write(exec_error_pipe.write_end(), &failure, sizeof(failure)));
        _exit(127);
    }

    ChildProcess child(pid);
    static_cast<void>(setpgid(pid, pid));
    stdout_pipe.close_write();
    stderr_pipe.close_write();
    exec_error_pipe.close_write();

    int exec_errno = 0;
    ssize_t reported = 0;
    do {
        reported = read(exec_error_pipe.read_end(), &exec_errno, sizeof(exec_errno));
    } while (reported < 0 && errno == EINTR);
    if (reported == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        child.reap(status);
        outcome.kind = OutcomeKind::SpawnFailed;
        outcome.spawn_error =
            "failed to start " + interpreter + ": " + std::strerror(exec_errno);
        outcome.duration_ms = elapsed_ms(started);
        LOG_ERROR(outcome.spawn_error);
        return outcome;
    }
    LOG_DEBUG("Spawned pid " + std::to_string(pid) + " in " + work_dir_text);

    set_nonblocking(stdout_pipe.read_end());
    set_nonblocking(stderr_pipe.read_end());
    ResultLineTracker result_line(spec.stdout_max_bytes);
    StreamCapture out_stream{&stdout_pipe, true, spec.stdout_max_bytes, "", false, &result_line};
    StreamCapture err_stream{&stderr_pipe, true, spec.stderr_max_bytes, "", false, nullptr};

    const auto deadline = started + std::chrono::seconds(spec.timeout_seconds);
    std::optional<std::chrono::steady_clock::time_point> grace_deadline;
    bool timed_out = false;
    bool child_exited = false;
    int status = 0;

    while (out_stream.open || err_stream.open || !child_exited) {
        const auto now = std::chrono::steady_clock::now();
        if (!grace_deadline.has_value() && now >= deadline) {
            // Descendants holding the pipes open are killed along with the child.
            timed_out = !child_exited;
            child.kill_group();
            grace_deadline = now + spec.kill_grace;
            if (timed_out) {
                LOG_WARN("Run exceeded " + std::to_string(spec.timeout_seconds) +
                         "s timeout; killed process group " + std::to_string(pid));
            }
        }
        if (grace_deadline.has_value() && now >= *grace_deadline) {
            break;
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (out_stream.open) {
            fds[nfds].fd = stdout_pipe.read_end();
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (err_stream.open) {
            fds[nfds].fd = stderr_pipe.read_end();
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            static_cast<void>(usleep(10 * 1000));
        }

        drain(out_stream);
        drain(err_stream);

        if (!child_exited) {
            child_exited = child.try_reap(status);
        }
    }

    drain(out_stream);
    drain(err_stream);
    child.kill_group();
    child.reap(status);

    outcome.duration_ms = elapsed_ms(started);
    outcome.stdout_text = std::move(out_stream.text);
    outcome.stderr_text = std::move(err_stream.text);
    outcome.stdout_truncated = out_stream.truncated;
    outcome.stderr_truncated = err_stream.truncated;
    outcome.result_line = result_line.finish();

    if (timed_out) {
        outcome.kind = OutcomeKind::TimedOut;
        return outcome;
    }
    outcome.kind = OutcomeKind::Exited;
    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.exit_code = 128 + WTERMSIG(status);
    } else {
        outcome.exit_code = -1;
    }
    LOG_DEBUG("Run finished with exit code " + std::to_string(*outcome.exit_code));
    return outcome;
}

}  // namespace scriptgate::runtime
