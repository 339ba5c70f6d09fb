#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/run_id.hpp"
#include "workflows/workflow_store.hpp"

namespace {

namespace fs = std::filesystem;
using scriptgate::core::errors::ErrorCategory;
using scriptgate::core::errors::get_error;
using scriptgate::core::errors::get_value;
using scriptgate::core::errors::is_error;
using scriptgate::protocol::JsonValue;
using scriptgate::workflows::ArgType;
using scriptgate::workflows::ManifestWorkflowStore;

class TempWorkspace {
public:
    TempWorkspace()
        : root_(fs::current_path() /
                (".tmp_workflow_store_" + scriptgate::core::config::generate_run_id("test"))) {
        fs::create_directories(root_ / "workflows");
    }

    ~TempWorkspace() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    const fs::path& root() const { return root_; }

private:
    fs::path root_;
};

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

JsonValue symbol_usage_manifest() {
    return JsonValue::parse(R"({
        "workflows": [{
            "id": "symbol_usage",
            "description": "Find usages of a symbol",
            "script_path": "workflows/symbol_usage.py",
            "arg_schema": {
                "query": {"type": "string", "required": true},
                "context_lines": {"type": "Integer", "default": 2, "minimum": 0, "maximum": 10},
                "include_tests": {"type": "boolean", "default": false}
            }
        }]
    })");
}

TEST(WorkflowStoreTest, LoadsManifestFromDisk) {
    TempWorkspace ws;
    write_file(ws.root() / "workflows" / "symbol_usage.py", "def run(args):\n    return 1\n");
    write_file(ws.root() / "manifest.json", symbol_usage_manifest().dump());

    auto loaded = ManifestWorkflowStore::load(ws.root() / "manifest.json");
    ASSERT_FALSE(is_error(loaded)) << get_error(loaded).message;
    const auto& store = get_value(loaded);

    EXPECT_EQ(store.workflow_ids(), std::vector<std::string>{"symbol_usage"});
    const auto* workflow = store.find("symbol_usage");
    ASSERT_NE(workflow, nullptr);
    EXPECT_EQ(workflow->description, "Find usages of a symbol");
    ASSERT_EQ(workflow->arg_schema.size(), 3u);
    EXPECT_EQ(workflow->arg_schema[0].name, "query");
    EXPECT_TRUE(workflow->arg_schema[0].required);
    EXPECT_EQ(workflow->arg_schema[1].type, ArgType::Integer);
    EXPECT_EQ(workflow->arg_schema[1].minimum, 0);
    EXPECT_EQ(workflow->arg_schema[1].maximum, 10);
    EXPECT_EQ(workflow->arg_schema[2].type, ArgType::Boolean);
    EXPECT_EQ(store.find("other"), nullptr);

    auto source = store.load_source(*workflow);
    ASSERT_FALSE(is_error(source));
    EXPECT_EQ(get_value(source), "def run(args):\n    return 1\n");
}

TEST(WorkflowStoreTest, RejectsScriptPathOutsideManifestDirectory) {
    TempWorkspace ws;
    auto manifest = symbol_usage_manifest();
    manifest["workflows"][0]["script_path"] = "../escape.py";
    auto loaded = ManifestWorkflowStore::from_json(manifest, ws.root());
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).category, ErrorCategory::Policy);
    EXPECT_EQ(get_error(loaded).code, "path_outside_manifest");
}

TEST(WorkflowStoreTest, RejectsMalformedManifests) {
    TempWorkspace ws;
    for (const std::string text :
         {R"({"workflow": []})",
          R"({"workflows": [{"script_path": "a.py"}]})",
          R"({"workflows": [{"id": "a"}]})",
          R"({"workflows": [{"id": "a", "script_path": "a.py"}, {"id": "a", "script_path": "b.py"}]})",
          R"({"workflows": [{"id": "a", "script_path": "a.py", "arg_schema": {"n": {"type": "float"}}}]})",
          R"({"workflows": [{"id": "a", "script_path": "a.py", "arg_schema": {"n": {"type": "string", "minimum": 1}}}]})",
          R"({"workflows": [{"id": "a", "script_path": "a.py", "arg_schema": {"n": {"type": "integer", "minimum": 5, "maximum": 1}}}]})"}) {
        auto loaded = ManifestWorkflowStore::from_json(JsonValue::parse(text), ws.root());
        ASSERT_TRUE(is_error(loaded)) << text;
        EXPECT_EQ(get_error(loaded).code, "invalid_manifest") << text;
    }
}

TEST(WorkflowStoreTest, ReportsUnreadableManifest) {
    TempWorkspace ws;
    auto missing = ManifestWorkflowStore::load(ws.root() / "absent.json");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "manifest_read_failed");

    write_file(ws.root() / "broken.json", "{not json");
    auto broken = ManifestWorkflowStore::load(ws.root() / "broken.json");
    ASSERT_TRUE(is_error(broken));
    EXPECT_EQ(get_error(broken).code, "invalid_manifest");
}

TEST(WorkflowStoreTest, MissingScriptIsInternalError) {
    TempWorkspace ws;
    auto loaded = ManifestWorkflowStore::from_json(symbol_usage_manifest(), ws.root());
    ASSERT_FALSE(is_error(loaded));
    const auto& store = get_value(loaded);
    auto source = store.load_source(*store.find("symbol_usage"));
    ASSERT_TRUE(is_error(source));
    EXPECT_EQ(get_error(source).category, ErrorCategory::Internal);
    EXPECT_EQ(get_error(source).code, "workflow_script_missing");
}

TEST(WorkflowStoreTest, ParsesArgTypeNames) {
    EXPECT_EQ(scriptgate::workflows::parse_arg_type(" Boolean "), ArgType::Boolean);
    EXPECT_EQ(scriptgate::workflows::parse_arg_type("integer"), ArgType::Integer);
    EXPECT_FALSE(scriptgate::workflows::parse_arg_type("list").has_value());
    EXPECT_EQ(scriptgate::workflows::to_string(ArgType::String), "string");
}

}  // namespace
