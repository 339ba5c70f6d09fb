#include "policy/script_parser.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <optional>
#include <utility>
#include <pybind11/embed.h>

namespace py = pybind11;

namespace scriptgate::policy {

namespace {

// Deeper trees are refused before the C++ walk can exhaust the stack.
constexpr int kMaxNestingDepth = 3000;

// One CPython per process. The GIL is released after start-up so any thread
// can take it through gil_scoped_acquire.
class EmbeddedInterpreter {
public:
    static EmbeddedInterpreter& instance() {
        static EmbeddedInterpreter interpreter;
        return interpreter;
    }

    EmbeddedInterpreter(const EmbeddedInterpreter&) = delete;
    EmbeddedInterpreter& operator=(const EmbeddedInterpreter&) = delete;

private:
    EmbeddedInterpreter()
        : interpreter_(std::make_unique<py::scoped_interpreter>(false)),
          release_(std::make_unique<py::gil_scoped_release>()) {}

    ~EmbeddedInterpreter() {
        release_.reset();
        interpreter_.reset();
    }

    std::unique_ptr<py::scoped_interpreter> interpreter_;
    std::unique_ptr<py::gil_scoped_release> release_;
};

std::string type_name(const py::handle& node) {
    return py::type::of(node).attr("__name__").cast<std::string>();
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string optional_string(const py::handle& value) {
    return value.is_none() ? std::string() : value.cast<std::string>();
}

SourceLocation location_of(const py::handle& node) {
    SourceLocation location;
    if (py::hasattr(node, "lineno")) {
        location.line = node.attr("lineno").cast<int>();
        location.column = node.attr("col_offset").cast<int>() + 1;
    }
    return location;
}

bool is_main_literal(const py::handle& node) {
    if (type_name(node) != "Constant") {
        return false;
    }
    const py::object value = node.attr("value");
    return py::isinstance<py::str>(value) && value.cast<std::string>() == "__main__";
}

bool is_dunder_name(const py::handle& node) {
    return type_name(node) == "Name" && node.attr("id").cast<std::string>() == "__name__";
}

// `__name__ == "__main__"`, with the operands in either order.
bool is_main_guard(const py::handle& test) {
    if (type_name(test) != "Compare") {
        return false;
    }
    const py::list ops(test.attr("ops"));
    const py::list comparators(test.attr("comparators"));
    if (ops.size() != 1 || comparators.size() != 1 || type_name(ops[0]) != "Eq") {
        return false;
    }
    const py::object left = test.attr("left");
    const py::object right = comparators[0];
    return (is_dunder_name(left) && is_main_literal(right)) ||
           (is_main_literal(left) && is_dunder_name(right));
}

std::vector<Parameter> read_parameters(const py::handle& arguments) {
    std::vector<Parameter> parameters;

    std::vector<py::object> positional;
    for (const auto field : {"posonlyargs", "args"}) {
        for (const auto arg : arguments.attr(field)) {
            positional.push_back(py::reinterpret_borrow<py::object>(arg));
        }
    }
    const std::size_t defaults = py::len(arguments.attr("defaults"));
    for (std::size_t i = 0; i < positional.size(); ++i) {
        Parameter parameter;
        parameter.name = positional[i].attr("arg").cast<std::string>();
        parameter.has_default = i + defaults >= positional.size();
        parameters.push_back(std::move(parameter));
    }

    const py::object vararg = arguments.attr("vararg");
    if (!vararg.is_none()) {
        parameters.push_back(
            Parameter{vararg.attr("arg").cast<std::string>(), ParameterKind::VarPositional, false});
    }

    const py::list keyword_only(arguments.attr("kwonlyargs"));
    const py::list keyword_defaults(arguments.attr("kw_defaults"));
    for (std::size_t i = 0; i < keyword_only.size(); ++i) {
        parameters.push_back(Parameter{keyword_only[i].attr("arg").cast<std::string>(),
                                       ParameterKind::KeywordOnly,
                                       !keyword_defaults[i].is_none()});
    }

    const py::object kwarg = arguments.attr("kwarg");
    if (!kwarg.is_none()) {
        parameters.push_back(
            Parameter{kwarg.attr("arg").cast<std::string>(), ParameterKind::VarKeyword, false});
    }
    return parameters;
}

std::vector<ImportedName> read_aliases(const py::handle& node) {
    std::vector<ImportedName> names;
    for (const auto alias : node.attr("names")) {
        names.push_back(ImportedName{alias.attr("name").cast<std::string>(),
                                     optional_string(alias.attr("asname"))});
    }
    return names;
}

// `a.b.c(...)` -> name "c", qualified "a.b.c"; `f()(...)` -> name "", "<expr>".
void read_callee(const py::handle& func, SyntaxNode& call) {
    std::vector<std::string> parts;
    py::object current = py::reinterpret_borrow<py::object>(func);
    while (type_name(current) == "Attribute") {
        parts.push_back(current.attr("attr").cast<std::string>());
        current = current.attr("value");
    }
    const bool rooted_at_name = type_name(current) == "Name";
    parts.push_back(rooted_at_name ? current.attr("id").cast<std::string>() : "<expr>");

    call.name = parts.size() > 1 || rooted_at_name ? parts.front() : std::string();
    for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
        call.qualified_name += (call.qualified_name.empty() ? "" : ".") + *it;
    }
}

void sort_by_location(std::vector<SyntaxNode>& nodes) {
    std::stable_sort(nodes.begin(), nodes.end(), [](const SyntaxNode& a, const SyntaxNode& b) {
        return a.location.line != b.location.line ? a.location.line < b.location.line
                                                  : a.location.column < b.location.column;
    });
}

// Turns a CPython tree into SyntaxNodes. Statements and calls become nodes;
// every other AST node is transparent and hands its descendants upward.
class TreeBuilder {
public:
    explicit TreeBuilder(py::module_ ast)
        : ast_(std::move(ast)),
          stmt_type_(ast_.attr("stmt")),
          iter_child_nodes_(ast_.attr("iter_child_nodes")) {}

    std::optional<SyntaxIssue> collect_children(const py::handle& node, const int depth,
                                                std::vector<SyntaxNode>& out) const {
        for (const auto child : iter_child_nodes_(node)) {
            if (auto issue = collect(child, depth, out)) {
                return issue;
            }
        }
        return std::nullopt;
    }

private:
    std::optional<SyntaxIssue> collect(const py::handle& node, const int depth,
                                       std::vector<SyntaxNode>& out) const {
        if (depth > kMaxNestingDepth) {
            return SyntaxIssue{"source nests too deeply to validate", location_of(node)};
        }
        const std::string type = type_name(node);
        if (type != "Call" && !py::isinstance(node, stmt_type_)) {
            return collect_children(node, depth + 1, out);
        }

        SyntaxNode built = describe(node, type);
        if (auto issue = collect_children(node, depth + 1, built.children)) {
            return issue;
        }
        sort_by_location(built.children);
        out.push_back(std::move(built));
        return std::nullopt;
    }

    SyntaxNode describe(const py::handle& node, const std::string& type) const {
        SyntaxNode out;
        out.location = location_of(node);
        if (type == "FunctionDef" || type == "AsyncFunctionDef") {
            out.kind = NodeKind::FunctionDef;
            out.name = node.attr("name").cast<std::string>();
            out.is_async = type == "AsyncFunctionDef";
            out.parameters = read_parameters(node.attr("args"));
        } else if (type == "ClassDef") {
            out.kind = NodeKind::ClassDef;
            out.name = node.attr("name").cast<std::string>();
        } else if (type == "If") {
            out.kind = NodeKind::If;
            out.name = "if";
            out.is_main_guard = is_main_guard(node.attr("test"));
        } else if (type == "Import") {
            out.kind = NodeKind::Import;
            out.names = read_aliases(node);
        } else if (type == "ImportFrom") {
            out.kind = NodeKind::ImportFrom;
            out.module = optional_string(node.attr("module"));
            const py::object level = node.attr("level");
            out.relative_level = level.is_none() ? 0 : level.cast<int>();
            out.names = read_aliases(node);
        } else if (type == "Call") {
            out.kind = NodeKind::Call;
            read_callee(node.attr("func"), out);
        } else {
            out.kind = py::hasattr(node, "body") ? NodeKind::Block : NodeKind::Statement;
            out.name = lowercase(type);
        }
        return out;
    }

    py::module_ ast_;
    py::object stmt_type_;
    py::object iter_child_nodes_;
};

SyntaxIssue to_syntax_issue(const py::error_already_set& error) {
    const py::object& value = error.value();
    if (!error.matches(PyExc_SyntaxError)) {
        return SyntaxIssue{type_name(value) + ": " + py::str(value).cast<std::string>(), {}};
    }

    SyntaxIssue issue;
    issue.message = optional_string(value.attr("msg"));
    const py::object line = value.attr("lineno");
    if (!line.is_none()) {
        issue.location.line = line.cast<int>();
    }
    const py::object offset = value.attr("offset");
    if (!offset.is_none() && offset.cast<int>() > 0) {
        issue.location.column = offset.cast<int>();
    }
    return issue;
}

}  // namespace

ParseResult<SyntaxNode> parse_module(const std::string& source) {
    EmbeddedInterpreter::instance();
    py::gil_scoped_acquire gil;
    try {
        py::module_ ast = py::module_::import("ast");
        // Bytes, so undecodable input surfaces as a SyntaxError from the parser.
        const py::object tree = ast.attr("parse")(py::bytes(source), "<script>", "exec");

        SyntaxNode module;
        module.kind = NodeKind::Module;
        const TreeBuilder builder(ast);
        if (auto issue = builder.collect_children(tree, 1, module.children)) {
            return *issue;
        }
        sort_by_location(module.children);
        return module;
    } catch (const py::error_already_set& error) {
        return to_syntax_issue(error);
    }
}

void walk(const SyntaxNode& node, const std::function<void(const SyntaxNode&)>& visit) {
    visit(node);
    for (const auto& child : node.children) {
        walk(child, visit);
    }
}

std::string to_string(const NodeKind kind) {
    switch (kind) {
        case NodeKind::Module:
            return "module";
        case NodeKind::FunctionDef:
            return "function_def";
        case NodeKind::ClassDef:
            return "class_def";
        case NodeKind::If:
            return "if";
        case NodeKind::Import:
            return "import";
        case NodeKind::ImportFrom:
            return "import_from";
        case NodeKind::Call:
            return "call";
        case NodeKind::Block:
            return "block";
        case NodeKind::Statement:
            return "statement";
        default:
            return "unknown";
    }
}

}  // namespace scriptgate::policy
