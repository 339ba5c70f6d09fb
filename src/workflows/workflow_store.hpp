#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/gate_errors.hpp"
#include "protocol/execution_contract.hpp"

namespace scriptgate::workflows {

enum class ArgType {
    String,
    Integer,
    Boolean
};

struct ArgSpec {
    std::string name;
    ArgType type = ArgType::String;
    bool required = false;
    std::optional<protocol::JsonValue> default_value;
    std::optional<std::int64_t> minimum;
    std::optional<std::int64_t> maximum;
};

struct WorkflowTemplate {
    std::string id;
    std::string description;
    std::filesystem::path script_path;
    std::vector<ArgSpec> arg_schema;  // declaration order
};

class WorkflowStore {
public:
    virtual ~WorkflowStore() = default;

    virtual const WorkflowTemplate* find(const std::string& workflow_id) const = 0;
    virtual std::vector<std::string> workflow_ids() const = 0;
    virtual core::errors::Result<std::string> load_source(
        const WorkflowTemplate& workflow) const = 0;
};

// Store backed by a JSON manifest:
// {"workflows": [{"id", "script_path", "description", "arg_schema": {...}}]}
// Script paths are relative to the manifest directory and may not leave it.
class ManifestWorkflowStore : public WorkflowStore {
public:
    static core::errors::Result<ManifestWorkflowStore> load(
        const std::filesystem::path& manifest_path);

    static core::errors::Result<ManifestWorkflowStore> from_json(
        const protocol::JsonValue& manifest, const std::filesystem::path& base_dir);

    const WorkflowTemplate* find(const std::string& workflow_id) const override;
    std::vector<std::string> workflow_ids() const override;
    core::errors::Result<std::string> load_source(
        const WorkflowTemplate& workflow) const override;

private:
    std::map<std::string, WorkflowTemplate> workflows_;
};

std::optional<ArgType> parse_arg_type(const std::string& text);
std::string to_string(ArgType type);

}  // namespace scriptgate::workflows
