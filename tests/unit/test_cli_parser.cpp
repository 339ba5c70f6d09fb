#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/config/run_id.hpp"
#include "core/errors/gate_errors.hpp"

namespace {

using scriptgate::app::cli::CliRequest;
using scriptgate::app::cli::CommandKind;
using scriptgate::app::cli::parse_and_validate;
using scriptgate::core::errors::ErrorCategory;
using scriptgate::core::errors::get_error;
using scriptgate::core::errors::get_value;
using scriptgate::core::errors::is_error;

scriptgate::core::errors::Result<CliRequest> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("scriptgate");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

class ScriptFile {
public:
    ScriptFile()
        : path_(std::filesystem::current_path() /
                (".tmp_cli_script_" + scriptgate::core::config::generate_run_id("test") + ".py")) {
        std::ofstream out(path_);
        out << "def run(args):\n    return args\n";
    }

    ~ScriptFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, FailsWhenFileMissingForRunCode) {
    auto result = parse_tokens({"run-code"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenFileDoesNotExist) {
    auto result = parse_tokens({"validate", "--file", "/nonexistent/script.py"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, ParsesRunCodeRequest) {
    ScriptFile script;
    auto result = parse_tokens({"run-code", "--file", script.path(), "--args-json",
                                "{\"query\": \"Foo\"}", "--timeout", "15", "--verbose"});
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    const auto& req = get_value(result);
    EXPECT_EQ(req.command, CommandKind::RunCode);
    ASSERT_TRUE(req.script_file.has_value());
    EXPECT_EQ(req.script_file->string(), script.path());
    ASSERT_TRUE(req.args.has_value());
    EXPECT_EQ((*req.args)["query"], "Foo");
    EXPECT_EQ(req.timeout_seconds, 15);
    EXPECT_TRUE(req.verbose);
}

TEST(CliParserTest, FailsWhenArgsJsonIsNotAnObject) {
    ScriptFile script;
    for (const std::string bad : {"[1, 2]", "{broken", "\"text\""}) {
        auto result = parse_tokens({"run-code", "--file", script.path(), "--args-json", bad});
        ASSERT_TRUE(is_error(result)) << bad;
        EXPECT_EQ(get_error(result).code, "invalid_args_json") << bad;
    }
}

TEST(CliParserTest, FailsWhenTimeoutNotNumeric) {
    ScriptFile script;
    auto result = parse_tokens({"run-code", "--file", script.path(), "--timeout", "ten"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsOnDuplicateOrDanglingFlags) {
    ScriptFile script;
    auto duplicate =
        parse_tokens({"run-code", "--file", script.path(), "--file", script.path()});
    ASSERT_TRUE(is_error(duplicate));
    EXPECT_EQ(get_error(duplicate).code, "duplicate_flag");

    auto dangling = parse_tokens({"run-code", "--file"});
    ASSERT_TRUE(is_error(dangling));
    EXPECT_EQ(get_error(dangling).code, "missing_value");

    auto unknown = parse_tokens({"run-code", "--file", script.path(), "--fast"});
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).code, "unknown_argument");
}

TEST(CliParserTest, ValidateAcceptsOnlyFile) {
    ScriptFile script;
    auto ok = parse_tokens({"validate", "--file", script.path()});
    ASSERT_FALSE(is_error(ok));
    EXPECT_EQ(get_value(ok).command, CommandKind::Validate);

    auto extra = parse_tokens({"validate", "--file", script.path(), "--timeout", "3"});
    ASSERT_TRUE(is_error(extra));
    EXPECT_EQ(get_error(extra).code, "conflicting_flags");
}

TEST(CliParserTest, ParsesWorkflowCommand) {
    auto result = parse_tokens({"run-workflow", "--command", "symbol_usage --query Foo"});
    ASSERT_FALSE(is_error(result));
    const auto& req = get_value(result);
    EXPECT_EQ(req.command, CommandKind::RunWorkflow);
    EXPECT_EQ(req.workflow_command, "symbol_usage --query Foo");
    EXPECT_FALSE(req.workflow_id.has_value());
}

TEST(CliParserTest, ParsesWorkflowIdWithPassthroughFlags) {
    auto result = parse_tokens(
        {"run-workflow", "--id", "symbol_usage", "--", "--query", "Foo", "--file", "x"});
    ASSERT_FALSE(is_error(result)) << get_error(result).message;
    const auto& req = get_value(result);
    EXPECT_EQ(req.workflow_id, "symbol_usage");
    EXPECT_EQ(req.workflow_flags,
              (std::vector<std::string>{"--query", "Foo", "--file", "x"}));
}

TEST(CliParserTest, FailsWhenWorkflowSelectorsConflict) {
    auto neither = parse_tokens({"run-workflow"});
    ASSERT_TRUE(is_error(neither));
    EXPECT_EQ(get_error(neither).code, "missing_required_flag");

    auto both = parse_tokens({"run-workflow", "--id", "a", "--command", "a --x 1"});
    ASSERT_TRUE(is_error(both));
    EXPECT_EQ(get_error(both).code, "conflicting_flags");

    auto mixed = parse_tokens({"run-workflow", "--id", "a", "--args-json", "{}", "--", "--x", "1"});
    ASSERT_TRUE(is_error(mixed));
    EXPECT_EQ(get_error(mixed).code, "conflicting_flags");

    ScriptFile script;
    auto with_file = parse_tokens({"run-workflow", "--id", "a", "--file", script.path()});
    ASSERT_TRUE(is_error(with_file));
    EXPECT_EQ(get_error(with_file).code, "conflicting_flags");
}

}  // namespace
