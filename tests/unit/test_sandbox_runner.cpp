#include <algorithm>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <signal.h>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include "core/config/run_id.hpp"
#include "runtime/result_extractor.hpp"
#include "runtime/sandbox_runner.hpp"

namespace {

namespace fs = std::filesystem;
using scriptgate::core::config::EnvLookup;
using scriptgate::core::errors::get_error;
using scriptgate::core::errors::get_value;
using scriptgate::core::errors::is_error;
using scriptgate::protocol::ExecutionRequest;
using scriptgate::protocol::OutcomeKind;
using scriptgate::protocol::RawExecutionOutcome;
using scriptgate::runtime::SandboxRunner;
using scriptgate::runtime::SandboxSpec;

class TempWorkspace {
public:
    TempWorkspace()
        : root_(fs::current_path() /
                (".tmp_sandbox_runner_" + scriptgate::core::config::generate_run_id("test"))) {
        fs::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    const fs::path& root() const { return root_; }

private:
    fs::path root_;
};

EnvLookup fake_host(std::map<std::string, std::string> values) {
    return [values = std::move(values)](const std::string& key) -> std::optional<std::string> {
        const auto it = values.find(key);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

// Runs shell "scripts" so these tests do not depend on a Python install.
SandboxSpec shell_spec(const fs::path& root) {
    SandboxSpec spec;
    spec.temp_root = root;
    spec.interpreter = "/bin/sh";
    spec.interpreter_flags = {};
    spec.env_allowlist = {"PATH"};
    spec.timeout_seconds = 10;
    return spec;
}

// Dead or a zombie waiting for its new parent to reap it.
bool process_gone(const pid_t pid) {
    if (kill(pid, 0) != 0 && errno == ESRCH) {
        return true;
    }
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    if (!std::getline(stat, line)) {
        return true;
    }
    const auto paren = line.rfind(')');
    return paren != std::string::npos && paren + 2 < line.size() && line[paren + 2] == 'Z';
}

SandboxRunner shell_runner() {
    return SandboxRunner(fake_host({{"PATH", "/usr/bin:/bin"}, {"SECRET_TOKEN", "hunter2"}}));
}

RawExecutionOutcome run_ok(const SandboxRunner& runner, const std::string& source,
                           const SandboxSpec& spec) {
    ExecutionRequest request;
    request.source = source;
    auto result = runner.run(request, spec);
    if (is_error(result)) {
        ADD_FAILURE() << "runner failed: " << get_error(result).message;
        return RawExecutionOutcome{};
    }
    return get_value(result);
}

TEST(SandboxRunnerTest, CapturesStdoutStderrAndExitCode) {
    TempWorkspace ws;
    const auto outcome =
        run_ok(shell_runner(), "echo out\necho err 1>&2\nexit 4\n", shell_spec(ws.root()));
    EXPECT_EQ(outcome.kind, OutcomeKind::Exited);
    ASSERT_TRUE(outcome.exit_code.has_value());
    EXPECT_EQ(*outcome.exit_code, 4);
    EXPECT_EQ(outcome.stdout_text, "out\n");
    EXPECT_EQ(outcome.stderr_text, "err\n");
    EXPECT_FALSE(outcome.stdout_truncated);
    EXPECT_GT(outcome.duration_ms, 0.0);
}

TEST(SandboxRunnerTest, ReportsSignalDeathAsShiftedExitCode) {
    TempWorkspace ws;
    const auto outcome = run_ok(shell_runner(), "kill -9 $$\n", shell_spec(ws.root()));
    EXPECT_EQ(outcome.kind, OutcomeKind::Exited);
    ASSERT_TRUE(outcome.exit_code.has_value());
    EXPECT_EQ(*outcome.exit_code, 128 + SIGKILL);
}

TEST(SandboxRunnerTest, KillsProcessGroupOnTimeout) {
    TempWorkspace ws;
    auto spec = shell_spec(ws.root());
    spec.timeout_seconds = 1;

    const auto started = std::chrono::steady_clock::now();
    const auto outcome =
        run_ok(shell_runner(), "sleep 30 &\necho $!\nwait\n", spec);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(outcome.kind, OutcomeKind::TimedOut);
    EXPECT_FALSE(outcome.exit_code.has_value());
    EXPECT_LT(elapsed, std::chrono::seconds(10));

    // The background sleep shared the group and must be gone too.
    const std::string text = outcome.stdout_text;
    ASSERT_FALSE(text.empty());
    const pid_t background = static_cast<pid_t>(std::stol(text));
    bool gone = false;
    for (int attempt = 0; attempt < 40 && !gone; ++attempt) {
        gone = process_gone(background);
        if (!gone) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
    EXPECT_TRUE(gone);
}

TEST(SandboxRunnerTest, TruncatesOutputAtCap) {
    TempWorkspace ws;
    auto spec = shell_spec(ws.root());
    spec.stdout_max_bytes = 1000;
    const auto outcome = run_ok(
        shell_runner(),
        "i=0\nwhile [ $i -lt 2000 ]; do echo 0123456789; i=$((i+1)); done\necho done 1>&2\n",
        spec);
    EXPECT_EQ(outcome.kind, OutcomeKind::Exited);
    EXPECT_EQ(*outcome.exit_code, 0);
    EXPECT_TRUE(outcome.stdout_truncated);
    EXPECT_EQ(outcome.stdout_text.size(), 1000u);
    EXPECT_FALSE(outcome.stderr_truncated);
    EXPECT_EQ(outcome.stderr_text, "done\n");
}

TEST(SandboxRunnerTest, ChildSeesOnlyAllowlistedEnvironment) {
    TempWorkspace ws;
    auto spec = shell_spec(ws.root());
    spec.run_id = "run-env-check";
    spec.extra_env = {{"EXTRA_FLAG", "yes"}};
    const auto outcome = run_ok(
        shell_runner(),
        "echo \"secret=${SECRET_TOKEN:-unset}\"\n"
        "echo \"extra=$EXTRA_FLAG\"\n"
        "echo \"run=$SCRIPTGATE_RUN_ID\"\n"
        "cat \"$SCRIPTGATE_ARGS_FILE\"\n",
        spec);
    EXPECT_NE(outcome.stdout_text.find("secret=unset"), std::string::npos);
    EXPECT_NE(outcome.stdout_text.find("extra=yes"), std::string::npos);
    EXPECT_NE(outcome.stdout_text.find("run=run-env-check"), std::string::npos);
    EXPECT_NE(outcome.stdout_text.find("{}"), std::string::npos);
    EXPECT_EQ(outcome.run_id, "run-env-check");
}

TEST(SandboxRunnerTest, UsesFreshDirectoryAndRemovesIt) {
    TempWorkspace ws;
    const auto runner = shell_runner();
    const auto spec = shell_spec(ws.root());
    const auto first = run_ok(runner, "pwd\nls\n", spec);
    const auto second = run_ok(runner, "pwd\n", spec);

    EXPECT_NE(first.working_directory, second.working_directory);
    EXPECT_NE(first.stdout_text.find("script.py"), std::string::npos);
    EXPECT_NE(first.stdout_text.find("args.json"), std::string::npos);
    EXPECT_FALSE(fs::exists(first.working_directory));
    EXPECT_FALSE(fs::exists(second.working_directory));
    EXPECT_TRUE(fs::is_empty(ws.root()));
}

TEST(SandboxRunnerTest, CopiesRuntimeDirectoryIntoRun) {
    TempWorkspace ws;
    const fs::path runtime = ws.root() / "runtime_src";
    fs::create_directories(runtime / "runtime");
    {
        std::ofstream tools(runtime / "runtime" / "zoekt_tools.py");
        tools << "# tools\n";
    }
    const fs::path runs = ws.root() / "runs";
    fs::create_directories(runs);

    auto spec = shell_spec(runs);
    spec.runtime_dir = runtime;
    const auto outcome = run_ok(shell_runner(), "ls runtime\n", spec);
    EXPECT_EQ(outcome.stdout_text, "zoekt_tools.py\n");
}

TEST(SandboxRunnerTest, MissingInterpreterIsSpawnFailure) {
    TempWorkspace ws;
    auto spec = shell_spec(ws.root());
    spec.interpreter = ws.root() / "no-such-python";
    const auto outcome = run_ok(shell_runner(), "echo hi\n", spec);
    EXPECT_EQ(outcome.kind, OutcomeKind::SpawnFailed);
    EXPECT_FALSE(outcome.exit_code.has_value());
    EXPECT_NE(outcome.spawn_error.find("no-such-python"), std::string::npos);
}

TEST(SandboxRunnerTest, MissingTempRootIsAnError) {
    TempWorkspace ws;
    auto spec = shell_spec(ws.root() / "absent");
    ExecutionRequest request;
    request.source = "echo hi\n";
    auto result = shell_runner().run(request, spec);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "run_dir_create_failed");
}

TEST(SandboxRunnerTest, BuildsSortedChildEnvironment) {
    SandboxSpec spec;
    spec.env_allowlist = {"PATH", "HOME", "MISSING"};
    spec.extra_env = {{"ZOEKT_API_URL", "http://zoekt"}};
    const auto env = scriptgate::runtime::build_child_environment(
        spec, fake_host({{"PATH", "/bin"}, {"HOME", "/root"}, {"AWS_SECRET", "x"}}), "run-1",
        "/tmp/r/args.json");

    EXPECT_TRUE(std::is_sorted(env.begin(), env.end()));
    const auto has = [&env](const std::string& entry) {
        return std::find(env.begin(), env.end(), entry) != env.end();
    };
    EXPECT_TRUE(has("PATH=/bin"));
    EXPECT_TRUE(has("HOME=/root"));
    EXPECT_TRUE(has("ZOEKT_API_URL=http://zoekt"));
    EXPECT_TRUE(has("SCRIPTGATE_RUN_ID=run-1"));
    EXPECT_TRUE(has("SCRIPTGATE_ARGS_FILE=/tmp/r/args.json"));
    EXPECT_TRUE(has("PYTHONUNBUFFERED=1"));
    for (const auto& entry : env) {
        EXPECT_EQ(entry.rfind("AWS_SECRET", 0), std::string::npos);
        EXPECT_EQ(entry.rfind("MISSING", 0), std::string::npos);
    }
}

TEST(SandboxRunnerTest, PythonBootstrapEmitsResultMarker) {
    if (!fs::exists("/usr/bin/python3")) {
        GTEST_SKIP() << "python3 not installed";
    }
    TempWorkspace ws;
    SandboxSpec spec;
    spec.temp_root = ws.root();
    spec.bootstrap_source = scriptgate::runtime::python_bootstrap_source();
    spec.timeout_seconds = 20;

    ExecutionRequest request;
    request.source =
        "import json\n"
        "def run(args):\n"
        "    print('working')\n"
        "    return {'echo': args['q'], 'n': 2}\n";
    request.args = {{"q", "needle"}};
    auto result = SandboxRunner(fake_host({})).run(request, spec);
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    const auto extracted = scriptgate::runtime::extract_result(get_value(result));
    EXPECT_TRUE(extracted.ok) << extracted.stderr_text;
    ASSERT_TRUE(extracted.result_json.has_value());
    EXPECT_EQ((*extracted.result_json)["echo"], "needle");
    EXPECT_EQ(extracted.stdout_text, "working\n");
}

TEST(SandboxRunnerTest, PythonBootstrapDrivesLegacyMain) {
    if (!fs::exists("/usr/bin/python3")) {
        GTEST_SKIP() << "python3 not installed";
    }
    TempWorkspace ws;
    SandboxSpec spec;
    spec.temp_root = ws.root();
    spec.bootstrap_source = scriptgate::runtime::python_bootstrap_source();
    spec.timeout_seconds = 20;

    ExecutionRequest request;
    request.source =
        "import argparse\n"
        "import json\n"
        "def parse_args():\n"
        "    parser = argparse.ArgumentParser()\n"
        "    parser.add_argument('--args-json', default='{}')\n"
        "    return parser.parse_args()\n"
        "def main():\n"
        "    args = json.loads(parse_args().args_json)\n"
        "    print(json.dumps({'got': args['k']}))\n"
        "if __name__ == '__main__':\n"
        "    main()\n";
    request.args = {{"k", 7}};
    auto result = SandboxRunner(fake_host({})).run(request, spec);
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    const auto extracted = scriptgate::runtime::extract_result(get_value(result));
    EXPECT_TRUE(extracted.ok) << extracted.stderr_text;
    ASSERT_TRUE(extracted.result_json.has_value());
    EXPECT_EQ((*extracted.result_json)["got"], 7);
}

TEST(SandboxRunnerTest, KeepsLastMarkerLinePastOutputCap) {
    TempWorkspace ws;
    auto spec = shell_spec(ws.root());
    spec.stdout_max_bytes = 1000;
    const auto outcome = run_ok(
        shell_runner(),
        "echo '__RESULT_JSON__={\"early\": 1}'\n"
        "i=0\nwhile [ $i -lt 200 ]; do echo 0123456789; i=$((i+1)); done\n"
        "echo '__RESULT_JSON__={\"answer\": 42}'\n"
        "echo trailing\n",
        spec);
    EXPECT_TRUE(outcome.stdout_truncated);
    EXPECT_EQ(outcome.stdout_text.size(), 1000u);
    ASSERT_TRUE(outcome.result_line.has_value());
    EXPECT_EQ(*outcome.result_line, "__RESULT_JSON__={\"answer\": 42}");
}

TEST(SandboxRunnerTest, PythonResultSurvivesOversizedStdout) {
    if (!fs::exists("/usr/bin/python3")) {
        GTEST_SKIP() << "python3 not installed";
    }
    TempWorkspace ws;
    SandboxSpec spec;
    spec.temp_root = ws.root();
    spec.bootstrap_source = scriptgate::runtime::python_bootstrap_source();
    spec.stdout_max_bytes = 1000;
    spec.timeout_seconds = 20;

    ExecutionRequest request;
    request.source =
        "def run(args):\n"
        "    print('x' * 2000)\n"
        "    return {'answer': 42}\n";
    auto result = SandboxRunner(fake_host({})).run(request, spec);
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    const auto extracted = scriptgate::runtime::extract_result(get_value(result));
    EXPECT_TRUE(extracted.ok) << extracted.stderr_text;
    EXPECT_TRUE(extracted.stdout_truncated);
    EXPECT_EQ(extracted.stdout_text.size(), 1000u);
    EXPECT_EQ(extracted.output_status, scriptgate::protocol::OutputStatus::Parsed);
    ASSERT_TRUE(extracted.result_json.has_value());
    EXPECT_EQ((*extracted.result_json)["answer"], 42);
}

TEST(SandboxRunnerTest, PythonBootstrapFallsBackToLegacyWhenRunTakesNoArgs) {
    if (!fs::exists("/usr/bin/python3")) {
        GTEST_SKIP() << "python3 not installed";
    }
    TempWorkspace ws;
    SandboxSpec spec;
    spec.temp_root = ws.root();
    spec.bootstrap_source = scriptgate::runtime::python_bootstrap_source();
    spec.timeout_seconds = 20;

    ExecutionRequest request;
    request.source =
        "import json\n"
        "def run():\n"
        "    raise RuntimeError('not the entrypoint')\n"
        "def parse_args():\n"
        "    return None\n"
        "def main():\n"
        "    print(json.dumps({'legacy': True}))\n"
        "if __name__ == '__main__':\n"
        "    main()\n";
    auto result = SandboxRunner(fake_host({})).run(request, spec);
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    const auto extracted = scriptgate::runtime::extract_result(get_value(result));
    EXPECT_TRUE(extracted.ok) << extracted.stderr_text;
    ASSERT_TRUE(extracted.result_json.has_value());
    EXPECT_EQ((*extracted.result_json)["legacy"], true);
}

}  // namespace
