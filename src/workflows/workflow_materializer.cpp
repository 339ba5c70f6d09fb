#include "workflows/workflow_materializer.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <utility>

namespace scriptgate::workflows {

using core::errors::ErrorCategory;
using core::errors::GateError;
using protocol::JsonValue;

namespace {

std::string flag_for(const std::string& arg_name) {
    std::string flag = "--" + arg_name;
    std::replace(flag.begin() + 2, flag.end(), '_', '-');
    return flag;
}

GateError invalid_arguments(const std::string& message, const std::string& usage) {
    return GateError{ErrorCategory::Input, "args validation failure: " + message + ". " + usage,
                     kInvalidArgumentsCode, usage};
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string display_value(const JsonValue& raw) {
    return raw.is_string() ? "'" + raw.get<std::string>() + "'"
                           : raw.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<std::int64_t> parse_integer(const std::string& text) {
    std::string digits = trim(text);
    if (!digits.empty() && digits.front() == '+') {
        digits.erase(0, 1);
    }
    if (digits.empty()) {
        return std::nullopt;
    }
    std::int64_t value = 0;
    const char* begin = digits.data();
    const char* end = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

core::errors::Result<JsonValue> coerce(const ArgSpec& spec, const JsonValue& raw,
                                       const std::string& usage) {
    const std::string flag = flag_for(spec.name);
    switch (spec.type) {
        case ArgType::String:
            if (raw.is_string()) {
                return raw;
            }
            return JsonValue(raw.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

        case ArgType::Integer: {
            std::optional<std::int64_t> value;
            if (raw.is_number_unsigned()) {
                const auto unsigned_value = raw.get<std::uint64_t>();
                if (unsigned_value <=
                    static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                    value = static_cast<std::int64_t>(unsigned_value);
                }
            } else if (raw.is_number_integer()) {
                value = raw.get<std::int64_t>();
            } else if (raw.is_string()) {
                value = parse_integer(raw.get<std::string>());
            }
            if (!value.has_value()) {
                return invalid_arguments(
                    "invalid integer for `" + flag + "`: " + display_value(raw), usage);
            }
            if (spec.minimum.has_value() && *value < *spec.minimum) {
                return invalid_arguments("invalid value for `" + flag + "`: must be >= " +
                                             std::to_string(*spec.minimum),
                                         usage);
            }
            if (spec.maximum.has_value() && *value > *spec.maximum) {
                return invalid_arguments("invalid value for `" + flag + "`: must be <= " +
                                             std::to_string(*spec.maximum),
                                         usage);
            }
            return JsonValue(*value);
        }

        case ArgType::Boolean: {
            if (raw.is_boolean()) {
                return raw;
            }
            const std::string text =
                lowercase(trim(raw.is_string() ? raw.get<std::string>() : raw.dump()));
            if (text == "true" || text == "1" || text == "yes" || text == "on") {
                return JsonValue(true);
            }
            if (text == "false" || text == "0" || text == "no" || text == "off") {
                return JsonValue(false);
            }
            return invalid_arguments(
                "invalid boolean for `" + flag + "`: " + display_value(raw), usage);
        }
    }
    return invalid_arguments("unsupported arg type for `" + flag + "`", usage);
}

}  // namespace

core::errors::Result<std::vector<std::string>> split_command_line(const std::string& command) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    std::size_t i = 0;
    while (i < command.size()) {
        const char c = command[i];
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            if (in_word) {
                words.push_back(std::move(current));
                current.clear();
                in_word = false;
            }
            ++i;
            continue;
        }

        in_word = true;
        if (c == '\\') {
            if (i + 1 >= command.size()) {
                return GateError{ErrorCategory::Input,
                                 "args validation failure: invalid command: No escaped character",
                                 kInvalidArgumentsCode};
            }
            current.push_back(command[i + 1]);
            i += 2;
            continue;
        }
        if (c == '\'') {
            const auto close = command.find('\'', i + 1);
            if (close == std::string::npos) {
                return GateError{ErrorCategory::Input,
                                 "args validation failure: invalid command: No closing quotation",
                                 kInvalidArgumentsCode};
            }
            current.append(command, i + 1, close - i - 1);
            i = close + 1;
            continue;
        }
        if (c == '"') {
            ++i;
            bool closed = false;
            while (i < command.size()) {
                const char d = command[i];
                if (d == '"') {
                    closed = true;
                    ++i;
                    break;
                }
                if (d == '\\' && i + 1 < command.size()) {
                    const char next = command[i + 1];
                    if (next == '"' || next == '\\' || next == '$' || next == '`') {
                        current.push_back(next);
                        i += 2;
                        continue;
                    }
                    if (next == '\n') {
                        i += 2;
                        continue;
                    }
                }
                current.push_back(d);
                ++i;
            }
            if (!closed) {
                return GateError{ErrorCategory::Input,
                                 "args validation failure: invalid command: No closing quotation",
                                 kInvalidArgumentsCode};
            }
            continue;
        }
        current.push_back(c);
        ++i;
    }
    if (in_word) {
        words.push_back(std::move(current));
    }
    return words;
}

std::string usage_line(const WorkflowTemplate& workflow) {
    std::string usage = "Usage: " + workflow.id;
    for (const auto& spec : workflow.arg_schema) {
        const std::string fragment = flag_for(spec.name) + " <value>";
        usage += spec.required ? " " + fragment : " [" + fragment + "]";
    }
    return usage;
}

WorkflowMaterializer::WorkflowMaterializer(const WorkflowStore& store) : store_(store) {}

core::errors::Result<const WorkflowTemplate*> WorkflowMaterializer::resolve(
    const std::string& workflow_id) const {
    const WorkflowTemplate* workflow = store_.find(workflow_id);
    if (workflow != nullptr) {
        return workflow;
    }

    auto ids = store_.workflow_ids();
    std::sort(ids.begin(), ids.end());
    std::string available;
    for (const auto& id : ids) {
        available += (available.empty() ? "" : ", ") + id;
    }
    return GateError{ErrorCategory::Input,
                     "unknown workflow_id: " + workflow_id +
                         ". Available workflows: " + available,
                     kUnknownWorkflowCode};
}

core::errors::Result<MaterializedWorkflow> WorkflowMaterializer::materialize_command(
    const std::string& command) const {
    auto split = split_command_line(command);
    if (core::errors::is_error(split)) {
        return core::errors::get_error(split);
    }
    const auto& tokens = core::errors::get_value(split);
    if (tokens.empty()) {
        return GateError{ErrorCategory::Input,
                         "args validation failure: command must not be empty",
                         kInvalidArgumentsCode};
    }
    return materialize_flags(tokens.front(),
                             std::vector<std::string>(tokens.begin() + 1, tokens.end()));
}

core::errors::Result<MaterializedWorkflow> WorkflowMaterializer::materialize_flags(
    const std::string& workflow_id, const std::vector<std::string>& flag_tokens) const {
    auto resolved = resolve(workflow_id);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const WorkflowTemplate& workflow = *core::errors::get_value(resolved);
    const std::string usage = usage_line(workflow);

    std::map<std::string, const ArgSpec*> aliases;
    for (const auto& spec : workflow.arg_schema) {
        aliases["--" + spec.name] = &spec;
        aliases[flag_for(spec.name)] = &spec;
    }

    JsonValue args = JsonValue::object();
    for (std::size_t index = 0; index < flag_tokens.size(); index += 2) {
        const std::string& token = flag_tokens[index];
        if (token.rfind("--", 0) != 0) {
            return invalid_arguments("unexpected positional argument `" + token + "`", usage);
        }
        const auto alias = aliases.find(token);
        if (alias == aliases.end()) {
            return invalid_arguments("unknown flag `" + token + "`", usage);
        }
        const ArgSpec& spec = *alias->second;
        if (args.contains(spec.name)) {
            return invalid_arguments("duplicate flag `" + token + "`", usage);
        }
        if (index + 1 >= flag_tokens.size() || flag_tokens[index + 1].rfind("--", 0) == 0) {
            return invalid_arguments("missing value for `" + token + "`", usage);
        }

        auto value = coerce(spec, JsonValue(flag_tokens[index + 1]), usage);
        if (core::errors::is_error(value)) {
            return core::errors::get_error(value);
        }
        args[spec.name] = core::errors::get_value(value);
    }
    return finish(workflow, std::move(args));
}

core::errors::Result<MaterializedWorkflow> WorkflowMaterializer::materialize_args(
    const std::string& workflow_id, const JsonValue& args) const {
    auto resolved = resolve(workflow_id);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const WorkflowTemplate& workflow = *core::errors::get_value(resolved);
    const std::string usage = usage_line(workflow);

    if (!args.is_object()) {
        return invalid_arguments("args must be a JSON object", usage);
    }
    JsonValue coerced = args;
    for (const auto& spec : workflow.arg_schema) {
        if (!args.contains(spec.name) || args[spec.name].is_null()) {
            continue;
        }
        auto value = coerce(spec, args[spec.name], usage);
        if (core::errors::is_error(value)) {
            return core::errors::get_error(value);
        }
        coerced[spec.name] = core::errors::get_value(value);
    }
    return finish(workflow, std::move(coerced));
}

core::errors::Result<MaterializedWorkflow> WorkflowMaterializer::finish(
    const WorkflowTemplate& workflow, JsonValue args) const {
    const std::string usage = usage_line(workflow);

    for (const auto& spec : workflow.arg_schema) {
        if ((args.contains(spec.name) && !args[spec.name].is_null()) ||
            !spec.default_value.has_value()) {
            continue;
        }
        auto value = coerce(spec, *spec.default_value, usage);
        if (core::errors::is_error(value)) {
            return core::errors::get_error(value);
        }
        args[spec.name] = core::errors::get_value(value);
    }

    std::string missing;
    for (const auto& spec : workflow.arg_schema) {
        if (spec.required && (!args.contains(spec.name) || args[spec.name].is_null())) {
            missing += (missing.empty() ? "" : ", ") + flag_for(spec.name);
        }
    }
    if (!missing.empty()) {
        return invalid_arguments("missing required flags: " + missing, usage);
    }

    auto source = store_.load_source(workflow);
    if (core::errors::is_error(source)) {
        return core::errors::get_error(source);
    }
    return MaterializedWorkflow{workflow.id, core::errors::get_value(source), std::move(args)};
}

}  // namespace scriptgate::workflows
