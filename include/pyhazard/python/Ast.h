#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace pyhazard::python {

// Closed set of syntax node kinds. The numbering is dense so the walker
// can index its dispatch table directly by kind.
enum class NodeKind : uint8_t {
    // module / statements
    Module,
    FunctionDef,
    AsyncFunctionDef,
    ClassDef,
    Return,
    Delete,
    Assign,
    AugAssign,
    AnnAssign,
    For,
    AsyncFor,
    While,
    If,
    With,
    AsyncWith,
    WithItem,
    Match,
    MatchCase,
    Raise,
    Try,
    ExceptHandler,
    Assert,
    Import,
    ImportFrom,
    Alias,
    Global,
    Nonlocal,
    ExprStmt,
    Pass,
    Break,
    Continue,

    // expressions
    BoolOp,
    NamedExpr,
    BinOp,
    UnaryOp,
    Lambda,
    IfExp,
    Dict,
    Set,
    ListComp,
    SetComp,
    DictComp,
    GeneratorExp,
    Comprehension,
    Await,
    Yield,
    YieldFrom,
    Compare,
    Call,
    Keyword,
    JoinedStr,
    Constant,
    Attribute,
    Subscript,
    Starred,
    Name,
    List,
    Tuple,
    Slice,

    // signatures
    Arguments,
    Arg,
};

inline constexpr size_t kNodeKindCount = static_cast<size_t>(NodeKind::Arg) + 1;

std::string_view nodeKindName(NodeKind k);

enum class ConstantKind : uint8_t {
    None,
    True,
    False,
    Ellipsis,
    Int,
    Float,
    Complex,
    Str,
    Bytes,
};

enum class ArgKind : uint8_t {
    PositionalOnly,
    Positional,
    VarArgs,     // *args
    KeywordOnly,
    KwArgs,      // **kwargs
};

// Facts gathered by SyntaxTree::finalize() for scope nodes (Module,
// FunctionDef, AsyncFunctionDef, Lambda, ClassDef). Nested scopes are not
// folded into `branches`, `returns` and `stringNames`.
struct ScopeFacts {
    bool containsGuard = false;  // a Try anywhere in the subtree
    unsigned branches  = 0;      // decision points, cyclomatic complexity
    unsigned returns   = 0;
    std::vector<std::string> stringNames;             // bound to str literals
    std::unordered_set<std::string> referencedNames;  // Module only
};

// One syntax node. Which slots are meaningful depends on `kind`:
//
//   Module              body
//   FunctionDef         name, args, body, decorators, returns
//   ClassDef            name, body, decorators, elts (bases), keywords
//   Return / Expr-like  value
//   Delete              targets
//   Assign              targets, value
//   AugAssign           target, op, value
//   AnnAssign           target, annotation, value?
//   For / AsyncFor      target, iter, body, orelse
//   While               test, body, orelse
//   If                  test, body, orelse   (elif: nested If, isElif)
//   With / AsyncWith    items (WithItem), body
//   WithItem            value (context expr), target?
//   Match               value (subject), handlers (MatchCase)
//   MatchCase           target (pattern), test (guard)?, body
//   Raise               value?, cause?
//   Try                 body, handlers, orelse, finalbody
//   ExceptHandler       test (type)?, name, body
//   Assert              test, value (msg)?
//   Import / ImportFrom names (Alias); ImportFrom: name = module, level
//   Alias               name, asName
//   Global / Nonlocal   identifiers
//   ExprStmt            value
//   BoolOp              op ("and"/"or"), elts
//   NamedExpr           target, value
//   BinOp               left, op, right
//   UnaryOp             op, value
//   Lambda              args, value (body)
//   IfExp               test, value (body), orelse (single element)
//   Dict                keys (nullptr for ** unpack), elts (values)
//   Set / List / Tuple  elts
//   ListComp etc.       value (elt), key (DictComp), generators
//   Comprehension       target, iter, ifs (elts), isAsync
//   Await / Yield(From) value?
//   Compare             left, identifiers (operators), elts (comparators)
//   Call                func, elts (positional args), keywords
//   Keyword             name (empty for **), value
//   JoinedStr           elts (replacement-field expressions)
//   Constant            constant, text (decoded for strings)
//   Attribute           value, name (attr)
//   Subscript           value, slice
//   Starred             value
//   Name                name
//   Slice               left (lower)?, right (upper)?, value (step)?
//   Arguments           elts (Arg)
//   Arg                 name, argKind, annotation?, value (default)?
struct Node {
    NodeKind kind;
    unsigned line    = 0;
    unsigned column  = 0;
    unsigned endLine = 0;

    std::string name;
    std::string asName;
    std::string op;
    std::string text;
    std::vector<std::string> identifiers;

    ConstantKind constant = ConstantKind::None;
    ArgKind argKind       = ArgKind::Positional;
    unsigned level        = 0;
    bool isElif           = false;
    bool isAsync          = false;

    const Node *value      = nullptr;
    const Node *target     = nullptr;
    const Node *test       = nullptr;
    const Node *iter       = nullptr;
    const Node *func       = nullptr;
    const Node *left       = nullptr;
    const Node *right      = nullptr;
    const Node *key        = nullptr;
    const Node *slice      = nullptr;
    const Node *annotation = nullptr;
    const Node *returns    = nullptr;
    const Node *args       = nullptr;
    const Node *cause      = nullptr;

    std::vector<const Node *> body;
    std::vector<const Node *> orelse;
    std::vector<const Node *> finalbody;
    std::vector<const Node *> handlers;
    std::vector<const Node *> decorators;
    std::vector<const Node *> targets;
    std::vector<const Node *> elts;
    std::vector<const Node *> keys;
    std::vector<const Node *> keywords;
    std::vector<const Node *> generators;
    std::vector<const Node *> items;
    std::vector<const Node *> names;

    ScopeFacts facts;

    explicit Node(NodeKind k) : kind(k) {}

    bool is(NodeKind k) const { return kind == k; }
    bool isFunction() const {
        return kind == NodeKind::FunctionDef ||
               kind == NodeKind::AsyncFunctionDef;
    }
    bool isScope() const {
        return isFunction() || kind == NodeKind::Lambda ||
               kind == NodeKind::ClassDef || kind == NodeKind::Module;
    }
    bool isStringLiteral() const {
        return kind == NodeKind::JoinedStr ||
               (kind == NodeKind::Constant && constant == ConstantKind::Str);
    }
};

// Appends the children of `n` to `out` in source order.
void childrenOf(const Node &n, std::vector<const Node *> &out);

// Dotted spelling of a Name/Attribute chain ("os.path.join"); empty for
// anything else.
std::string dottedName(const Node *n);

// Callee spelling of a call: the attribute name for `x.f()`, the
// identifier for `f()`, empty otherwise.
std::string_view calleeName(const Node &call);

// Owns every node of one parsed file. Nodes are created by the parser
// and frozen by finalize(); afterwards the tree is read-only.
class SyntaxTree {
public:
    SyntaxTree() = default;
    SyntaxTree(SyntaxTree &&) = default;
    SyntaxTree &operator=(SyntaxTree &&) = default;

    Node *make(NodeKind kind, unsigned line, unsigned column);

    void setRoot(const Node *root) { root_ = root; }
    const Node *root() const { return root_; }
    size_t size() const { return nodes_.size(); }

    void finalize();

private:
    std::vector<std::unique_ptr<Node>> nodes_;
    const Node *root_ = nullptr;
};

} // namespace pyhazard::python
