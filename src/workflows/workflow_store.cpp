#include "workflows/workflow_store.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace scriptgate::workflows {

using core::errors::ErrorCategory;
using core::errors::GateError;
using protocol::JsonValue;

namespace {

bool is_within_root(const std::filesystem::path& root, const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

GateError manifest_error(const std::string& message) {
    return GateError{ErrorCategory::Input, "Invalid workflow manifest: " + message,
                     "invalid_manifest"};
}

core::errors::Result<ArgSpec> parse_arg_spec(const std::string& workflow_id,
                                             const std::string& name, const JsonValue& raw) {
    const std::string where = workflow_id + "." + name;
    if (!raw.is_object()) {
        return manifest_error("arg_schema entry " + where + " must be an object");
    }

    ArgSpec spec;
    spec.name = name;
    if (raw.contains("type")) {
        if (!raw["type"].is_string()) {
            return manifest_error("type of " + where + " must be a string");
        }
        const auto type = parse_arg_type(raw["type"].get<std::string>());
        if (!type.has_value()) {
            return manifest_error("unsupported type '" + raw["type"].get<std::string>() +
                                  "' for " + where);
        }
        spec.type = *type;
    }
    if (raw.contains("required")) {
        if (!raw["required"].is_boolean()) {
            return manifest_error("required flag of " + where + " must be a boolean");
        }
        spec.required = raw["required"].get<bool>();
    }
    if (raw.contains("default")) {
        spec.default_value = raw["default"];
    }
    for (const char* bound : {"minimum", "maximum"}) {
        if (!raw.contains(bound)) {
            continue;
        }
        if (!raw[bound].is_number_integer()) {
            return manifest_error(std::string(bound) + " of " + where + " must be an integer");
        }
        if (spec.type != ArgType::Integer) {
            return manifest_error(std::string(bound) + " is only valid for integer args (" +
                                  where + ")");
        }
        const auto value = raw[bound].get<std::int64_t>();
        if (std::string(bound) == "minimum") {
            spec.minimum = value;
        } else {
            spec.maximum = value;
        }
    }
    if (spec.minimum.has_value() && spec.maximum.has_value() && *spec.minimum > *spec.maximum) {
        return manifest_error("minimum exceeds maximum for " + where);
    }
    return spec;
}

}  // namespace

std::optional<ArgType> parse_arg_type(const std::string& text) {
    std::string lowered;
    for (const char c : text) {
        if (std::isspace(static_cast<unsigned char>(c)) == 0) {
            lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    if (lowered == "string") return ArgType::String;
    if (lowered == "integer") return ArgType::Integer;
    if (lowered == "boolean") return ArgType::Boolean;
    return std::nullopt;
}

std::string to_string(const ArgType type) {
    switch (type) {
        case ArgType::String:
            return "string";
        case ArgType::Integer:
            return "integer";
        case ArgType::Boolean:
            return "boolean";
        default:
            return "unknown";
    }
}

core::errors::Result<ManifestWorkflowStore> ManifestWorkflowStore::load(
    const std::filesystem::path& manifest_path) {
    std::ifstream in(manifest_path);
    if (!in.is_open()) {
        return GateError{ErrorCategory::Input,
                         "Failed to open workflow manifest: " + manifest_path.string(),
                         "manifest_read_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    const JsonValue manifest = JsonValue::parse(buffer.str(), nullptr, false);
    if (manifest.is_discarded()) {
        return manifest_error(manifest_path.string() + " is not valid JSON");
    }

    std::error_code ec;
    auto base_dir = std::filesystem::absolute(manifest_path, ec).parent_path();
    if (ec) {
        return manifest_error("cannot resolve " + manifest_path.string());
    }
    auto store = from_json(manifest, base_dir);
    if (core::errors::is_error(store)) {
        return core::errors::get_error(store);
    }
    LOG_DEBUG("Loaded " + std::to_string(core::errors::get_value(store).workflows_.size()) +
              " workflows from " + manifest_path.string());
    return store;
}

core::errors::Result<ManifestWorkflowStore> ManifestWorkflowStore::from_json(
    const JsonValue& manifest, const std::filesystem::path& base_dir) {
    if (!manifest.is_object() || !manifest.contains("workflows") ||
        !manifest["workflows"].is_array()) {
        return manifest_error("expected an object with a \"workflows\" array");
    }

    std::error_code ec;
    const auto root = std::filesystem::weakly_canonical(base_dir, ec);
    if (ec) {
        return manifest_error("cannot resolve manifest directory " + base_dir.string());
    }

    ManifestWorkflowStore store;
    for (const auto& entry : manifest["workflows"]) {
        if (!entry.is_object()) {
            return manifest_error("workflow entries must be objects");
        }
        if (!entry.contains("id") || !entry["id"].is_string() ||
            entry["id"].get<std::string>().empty()) {
            return manifest_error("workflow entry without a string id");
        }

        WorkflowTemplate workflow;
        workflow.id = entry["id"].get<std::string>();
        if (store.workflows_.count(workflow.id) != 0) {
            return manifest_error("duplicate workflow id '" + workflow.id + "'");
        }
        if (entry.contains("description") && entry["description"].is_string()) {
            workflow.description = entry["description"].get<std::string>();
        }

        if (!entry.contains("script_path") || !entry["script_path"].is_string() ||
            entry["script_path"].get<std::string>().empty()) {
            return manifest_error("workflow '" + workflow.id + "' has no script_path");
        }
        const std::filesystem::path relative = entry["script_path"].get<std::string>();
        const auto resolved = std::filesystem::weakly_canonical(root / relative, ec);
        if (ec || !is_within_root(root, resolved)) {
            return GateError{ErrorCategory::Policy,
                             "Workflow script path escapes the manifest directory: " +
                                 relative.string(),
                             "path_outside_manifest"};
        }
        workflow.script_path = resolved;

        if (entry.contains("arg_schema")) {
            const auto& schema = entry["arg_schema"];
            if (!schema.is_object()) {
                return manifest_error("arg_schema of '" + workflow.id + "' must be an object");
            }
            for (const auto& [name, raw_spec] : schema.items()) {
                auto spec = parse_arg_spec(workflow.id, name, raw_spec);
                if (core::errors::is_error(spec)) {
                    return core::errors::get_error(spec);
                }
                workflow.arg_schema.push_back(core::errors::get_value(spec));
            }
        }
        store.workflows_.emplace(workflow.id, std::move(workflow));
    }
    return store;
}

const WorkflowTemplate* ManifestWorkflowStore::find(const std::string& workflow_id) const {
    const auto it = workflows_.find(workflow_id);
    return it == workflows_.end() ? nullptr : &it->second;
}

std::vector<std::string> ManifestWorkflowStore::workflow_ids() const {
    std::vector<std::string> ids;
    ids.reserve(workflows_.size());
    for (const auto& [id, workflow] : workflows_) {
        ids.push_back(id);
    }
    return ids;
}

core::errors::Result<std::string> ManifestWorkflowStore::load_source(
    const WorkflowTemplate& workflow) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(workflow.script_path, ec) || ec) {
        return GateError{ErrorCategory::Internal,
                         "Workflow script missing: " + workflow.script_path.string(),
                         "workflow_script_missing"};
    }
    std::ifstream in(workflow.script_path, std::ios::binary);
    if (!in.is_open()) {
        return GateError{ErrorCategory::Internal,
                         "Failed to open workflow script: " + workflow.script_path.string(),
                         "workflow_script_missing"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return GateError{ErrorCategory::Internal,
                         "I/O error while reading workflow script: " +
                             workflow.script_path.string(),
                         "workflow_script_missing"};
    }
    return buffer.str();
}

}  // namespace scriptgate::workflows
