#pragma once

#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace scriptgate::policy {

// 1-based line and column of a construct. Columns count UTF-8 bytes.
struct SourceLocation {
    int line = 1;
    int column = 1;
};

struct SyntaxIssue {
    std::string message;
    SourceLocation location;
};

template <typename T>
using ParseResult = std::variant<T, SyntaxIssue>;

enum class NodeKind {
    Module,
    FunctionDef,
    ClassDef,
    If,
    Import,
    ImportFrom,
    Call,
    Block,     // any other compound statement: for, while, with, try, match
    Statement  // a simple statement; its children are the calls it contains
};

enum class ParameterKind {
    Positional,
    VarPositional,
    KeywordOnly,
    VarKeyword
};

struct Parameter {
    std::string name;
    ParameterKind kind = ParameterKind::Positional;
    bool has_default = false;
};

struct ImportedName {
    std::string name;
    std::string alias;
};

// Minimal syntax tree: only the node kinds the safety policy inspects.
// Expressions other than calls are dropped; their calls hang off the
// enclosing statement. Children are in source order.
struct SyntaxNode {
    NodeKind kind = NodeKind::Statement;
    SourceLocation location;
    std::string name;            // def/class name, final callee name, statement type
    std::string qualified_name;  // dotted callee path for calls
    bool is_async = false;
    bool is_main_guard = false;  // `if __name__ == "__main__":`
    std::vector<Parameter> parameters;
    std::string module;          // `from <module> import ...`
    int relative_level = 0;      // leading dots of a relative import
    std::vector<ImportedName> names;
    std::vector<SyntaxNode> children;
};

// Parses with the grammar of the embedded CPython (`ast.parse`) and keeps the
// policy-relevant nodes. The interpreter is started on first use and shared
// by all threads; each call holds the GIL only while it converts the tree.
ParseResult<SyntaxNode> parse_module(const std::string& source);

// Pre-order walk in source order.
void walk(const SyntaxNode& node, const std::function<void(const SyntaxNode&)>& visit);

std::string to_string(NodeKind kind);

}  // namespace scriptgate::policy
