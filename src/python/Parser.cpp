#include "pyhazard/python/Parser.h"
#include "pyhazard/core/Error.h"

#include <llvm/ADT/ScopeExit.h>
#include <llvm/ADT/StringRef.h>

#include <tree_sitter/api.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <string>
#include <vector>

extern "C" const TSLanguage *tree_sitter_python(void);

namespace pyhazard::python {

namespace {

struct ParserDeleter {
    void operator()(TSParser *p) const { ts_parser_delete(p); }
};

struct TreeDeleter {
    void operator()(TSTree *t) const { ts_tree_delete(t); }
};

// One child of a concrete syntax node with its grammar field name, empty
// when the grammar gives it none.
struct Child {
    TSNode node;
    llvm::StringRef field;
};

llvm::StringRef typeOf(TSNode n) {
    return ts_node_type(n);
}

bool present(TSNode n) {
    return !ts_node_is_null(n);
}

TSNode field(TSNode n, const char *name) {
    return ts_node_child_by_field_name(n, name,
                                       static_cast<uint32_t>(std::strlen(name)));
}

// Children in source order, comments and line continuations excluded.
// A cursor walk keeps this linear in the number of children.
std::vector<Child> childrenOf(TSNode n) {
    std::vector<Child> out;
    TSTreeCursor cursor = ts_tree_cursor_new(n);
    auto done = llvm::make_scope_exit([&] { ts_tree_cursor_delete(&cursor); });
    if (!ts_tree_cursor_goto_first_child(&cursor))
        return out;
    do {
        TSNode c = ts_tree_cursor_current_node(&cursor);
        if (ts_node_is_extra(c))
            continue;
        const char *f = ts_tree_cursor_current_field_name(&cursor);
        out.push_back({c, f ? llvm::StringRef(f) : llvm::StringRef()});
    } while (ts_tree_cursor_goto_next_sibling(&cursor));
    return out;
}

std::vector<TSNode> namedChildren(TSNode n) {
    std::vector<TSNode> out;
    for (const Child &c : childrenOf(n)) {
        if (ts_node_is_named(c.node))
            out.push_back(c.node);
    }
    return out;
}

std::vector<TSNode> fieldChildren(TSNode n, llvm::StringRef name) {
    std::vector<TSNode> out;
    for (const Child &c : childrenOf(n)) {
        if (c.field == name)
            out.push_back(c.node);
    }
    return out;
}

TSNode firstNamedOfType(TSNode n, llvm::StringRef type) {
    for (TSNode c : namedChildren(n)) {
        if (typeOf(c) == type)
            return c;
    }
    return TSNode{};
}

bool hasToken(TSNode n, llvm::StringRef token) {
    for (const Child &c : childrenOf(n)) {
        if (!ts_node_is_named(c.node) && typeOf(c.node) == token)
            return true;
    }
    return false;
}

// The indented suite of a clause: `body`, `consequence`, or a bare block.
TSNode blockOf(TSNode clause) {
    TSNode b = field(clause, "body");
    if (present(b))
        return b;
    b = field(clause, "consequence");
    if (present(b))
        return b;
    return firstNamedOfType(clause, "block");
}

// `x` of `... as x`, which newer grammars wrap in as_pattern_target.
TSNode unwrapAlias(TSNode alias) {
    if (present(alias) && typeOf(alias) == "as_pattern_target") {
        auto kids = namedChildren(alias);
        if (!kids.empty())
            return kids.front();
    }
    return alias;
}

unsigned endLineOf(TSNode n) {
    TSPoint start = ts_node_start_point(n);
    TSPoint end = ts_node_end_point(n);
    if (end.column == 0 && end.row > start.row)
        return end.row;
    return end.row + 1;
}

// First ERROR or MISSING node in document order. Only subtrees flagged
// with an error are entered.
TSNode firstErrorNode(TSNode root) {
    TSTreeCursor cursor = ts_tree_cursor_new(root);
    auto done = llvm::make_scope_exit([&] { ts_tree_cursor_delete(&cursor); });
    while (true) {
        TSNode n = ts_tree_cursor_current_node(&cursor);
        if (ts_node_is_missing(n) || typeOf(n) == "ERROR")
            return n;
        if (ts_node_has_error(n) && ts_tree_cursor_goto_first_child(&cursor))
            continue;
        while (!ts_tree_cursor_goto_next_sibling(&cursor)) {
            if (!ts_tree_cursor_goto_parent(&cursor))
                return root;
        }
    }
}

ConstantKind numberKind(llvm::StringRef text) {
    std::string lower = text.lower();
    if (!lower.empty() && lower.back() == 'j')
        return ConstantKind::Complex;
    if (lower.size() > 1 && lower[0] == '0' &&
        (lower[1] == 'x' || lower[1] == 'o' || lower[1] == 'b'))
        return ConstantKind::Int;
    if (lower.find('.') != std::string::npos ||
        lower.find('e') != std::string::npos)
        return ConstantKind::Float;
    return ConstantKind::Int;
}

struct StringParts {
    bool raw = false;
    bool bytes = false;
    bool format = false;
    std::string_view body;
};

StringParts splitString(std::string_view spelling) {
    StringParts p;
    size_t i = 0;
    while (i < spelling.size() && spelling[i] != '\'' && spelling[i] != '"') {
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(spelling[i])));
        p.raw |= c == 'r';
        p.bytes |= c == 'b';
        p.format |= c == 'f';
        ++i;
    }
    size_t quoteLen = 1;
    if (i + 2 < spelling.size() && spelling[i + 1] == spelling[i] &&
        spelling[i + 2] == spelling[i] && spelling.size() >= i + 6)
        quoteLen = 3;
    size_t bodyOffset = std::min(i + quoteLen, spelling.size());
    size_t bodyEnd = spelling.size() >= bodyOffset + quoteLen
        ? spelling.size() - quoteLen : bodyOffset;
    p.body = spelling.substr(bodyOffset, bodyEnd - bodyOffset);
    return p;
}

std::string decodeEscapes(std::string_view body, bool raw) {
    if (raw)
        return std::string(body);
    std::string out;
    out.reserve(body.size());
    for (size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (c != '\\' || i + 1 >= body.size()) {
            out += c;
            continue;
        }
        char n = body[++i];
        switch (n) {
            case 'n':  out += '\n'; break;
            case 't':  out += '\t'; break;
            case 'r':  out += '\r'; break;
            case '0':  out += '\0'; break;
            case '\\': out += '\\'; break;
            case '\'': out += '\''; break;
            case '"':  out += '"';  break;
            case '\n': break;
            default:
                out += '\\';
                out += n;
                break;
        }
    }
    return out;
}

// Converts the tree-sitter-python concrete syntax tree into Nodes. Every
// recursive entry point charges `depth_`, so input nested deeper than
// kMaxTreeDepth fails with a Syntax error instead of exhausting the stack.
class TreeBuilder {
public:
    TreeBuilder(std::string_view source, SyntaxTree &tree)
        : source_(source), tree_(tree) {}

    llvm::Expected<const Node *> buildModule(TSNode root);

private:
    using NodeResult = llvm::Expected<Node *>;
    using NodeList = std::vector<const Node *>;

    std::string_view text(TSNode n) const;
    Node *make(NodeKind kind, TSNode at);
    llvm::Error errorAt(TSNode at, const std::string &what) const;
    llvm::Error enter(TSNode at);

    // statements
    llvm::Error buildBody(TSNode container, NodeList &out);
    llvm::Error buildBlock(TSNode block, NodeList &out);
    NodeResult buildStatement(TSNode n);
    NodeResult buildExpressionStatement(TSNode n);
    NodeResult buildAssignment(TSNode a, TSNode stmt);
    NodeResult buildDecorated(TSNode n);
    NodeResult buildFunction(TSNode n);
    NodeResult buildClass(TSNode n);
    NodeResult buildIf(TSNode n);
    NodeResult buildFor(TSNode n);
    NodeResult buildWhile(TSNode n);
    NodeResult buildTry(TSNode n);
    NodeResult buildHandler(TSNode clause);
    NodeResult buildWith(TSNode n);
    NodeResult buildWithItem(TSNode item);
    NodeResult buildMatch(TSNode n);
    NodeResult buildCase(TSNode clause);
    NodeResult buildPattern(TSNode p);
    NodeResult buildPatternKind(TSNode p);
    NodeResult buildImport(TSNode n);
    NodeResult buildImportFrom(TSNode n);
    NodeResult buildAlias(TSNode n);
    llvm::Error buildElse(TSNode clause, NodeList &orelse);

    // signatures
    NodeResult buildParameters(TSNode params, TSNode at);

    // expressions
    NodeResult buildExpr(TSNode n);
    NodeResult buildExprKind(TSNode n);
    NodeResult buildSequence(NodeKind kind, TSNode at, const std::vector<TSNode> &elts);
    NodeResult buildOneOrTuple(TSNode at, const std::vector<TSNode> &elts);
    NodeResult buildDotted(TSNode dotted);
    NodeResult buildBoolOp(TSNode n);
    NodeResult buildCompare(TSNode n);
    NodeResult buildSlice(TSNode n);
    NodeResult buildDict(TSNode n);
    NodeResult buildComprehension(NodeKind kind, TSNode n);
    NodeResult buildString(TSNode n);
    NodeResult buildStarred(TSNode n);
    llvm::Error buildArgumentList(TSNode list, NodeList &positional, NodeList &keywords);
    llvm::Error collectFields(TSNode n, Node *joined);

    // Builds `n` into `slot`; a null `n` leaves the slot empty.
    llvm::Error set(const Node *&slot, TSNode n);
    llvm::Error append(NodeList &out, TSNode n);

    std::string_view source_;
    SyntaxTree &tree_;
    unsigned depth_ = 0;
};

std::string_view TreeBuilder::text(TSNode n) const {
    if (!present(n))
        return {};
    uint32_t begin = ts_node_start_byte(n);
    uint32_t end = ts_node_end_byte(n);
    if (begin > source_.size() || end < begin)
        return {};
    return source_.substr(begin, end - begin);
}

Node *TreeBuilder::make(NodeKind kind, TSNode at) {
    TSPoint start = ts_node_start_point(at);
    Node *n = tree_.make(kind, start.row + 1, start.column);
    n->endLine = endLineOf(at);
    return n;
}

llvm::Error TreeBuilder::errorAt(TSNode at, const std::string &what) const {
    TSPoint start = ts_node_start_point(at);
    return makeError(ErrorKind::Syntax, what, start.row + 1, start.column);
}

llvm::Error TreeBuilder::enter(TSNode at) {
    if (depth_ >= kMaxTreeDepth)
        return errorAt(at, "syntax nested too deeply");
    ++depth_;
    return llvm::Error::success();
}

llvm::Error TreeBuilder::set(const Node *&slot, TSNode n) {
    if (!present(n))
        return llvm::Error::success();
    auto built = buildExpr(n);
    if (!built)
        return built.takeError();
    slot = *built;
    return llvm::Error::success();
}

llvm::Error TreeBuilder::append(NodeList &out, TSNode n) {
    auto built = buildExpr(n);
    if (!built)
        return built.takeError();
    out.push_back(*built);
    return llvm::Error::success();
}

// --- module / statements ---

llvm::Expected<const Node *> TreeBuilder::buildModule(TSNode root) {
    Node *module = tree_.make(NodeKind::Module, 1, 0);
    module->endLine = endLineOf(root);
    if (auto err = buildBody(root, module->body))
        return std::move(err);
    return module;
}

llvm::Error TreeBuilder::buildBody(TSNode container, NodeList &out) {
    for (TSNode s : namedChildren(container)) {
        auto stmt = buildStatement(s);
        if (!stmt)
            return stmt.takeError();
        out.push_back(*stmt);
    }
    return llvm::Error::success();
}

llvm::Error TreeBuilder::buildBlock(TSNode block, NodeList &out) {
    if (!present(block))
        return makeError(ErrorKind::Syntax, "expected an indented block");
    if (auto err = enter(block))
        return err;
    auto leave = llvm::make_scope_exit([this] { --depth_; });
    return buildBody(block, out);
}

llvm::Error TreeBuilder::buildElse(TSNode clause, NodeList &orelse) {
    if (!present(clause))
        return llvm::Error::success();
    return buildBlock(blockOf(clause), orelse);
}

TreeBuilder::NodeResult TreeBuilder::buildStatement(TSNode n) {
    llvm::StringRef t = typeOf(n);
    if (t == "expression_statement")
        return buildExpressionStatement(n);
    if (t == "decorated_definition")
        return buildDecorated(n);
    if (t == "function_definition")
        return buildFunction(n);
    if (t == "class_definition")
        return buildClass(n);
    if (t == "if_statement")
        return buildIf(n);
    if (t == "for_statement")
        return buildFor(n);
    if (t == "while_statement")
        return buildWhile(n);
    if (t == "try_statement")
        return buildTry(n);
    if (t == "with_statement")
        return buildWith(n);
    if (t == "match_statement")
        return buildMatch(n);
    if (t == "import_statement")
        return buildImport(n);
    if (t == "import_from_statement" || t == "future_import_statement")
        return buildImportFrom(n);
    if (t == "pass_statement")
        return make(NodeKind::Pass, n);
    if (t == "break_statement")
        return make(NodeKind::Break, n);
    if (t == "continue_statement")
        return make(NodeKind::Continue, n);

    if (t == "return_statement") {
        Node *r = make(NodeKind::Return, n);
        auto kids = namedChildren(n);
        if (!kids.empty()) {
            if (auto err = set(r->value, kids.front()))
                return std::move(err);
        }
        return r;
    }
    if (t == "raise_statement") {
        Node *r = make(NodeKind::Raise, n);
        for (const Child &c : childrenOf(n)) {
            if (!ts_node_is_named(c.node))
                continue;
            const Node *&slot = c.field == "cause" ? r->cause : r->value;
            if (auto err = set(slot, c.node))
                return std::move(err);
        }
        return r;
    }
    if (t == "delete_statement") {
        Node *d = make(NodeKind::Delete, n);
        for (TSNode target : namedChildren(n)) {
            std::vector<TSNode> elts = typeOf(target) == "expression_list"
                ? namedChildren(target) : std::vector<TSNode>{target};
            for (TSNode e : elts) {
                if (auto err = append(d->targets, e))
                    return std::move(err);
            }
        }
        return d;
    }
    if (t == "assert_statement") {
        Node *a = make(NodeKind::Assert, n);
        auto kids = namedChildren(n);
        if (kids.empty())
            return errorAt(n, "expected assertion");
        if (auto err = set(a->test, kids[0]))
            return std::move(err);
        if (kids.size() > 1) {
            if (auto err = set(a->value, kids[1]))
                return std::move(err);
        }
        return a;
    }
    if (t == "global_statement" || t == "nonlocal_statement") {
        Node *g = make(t == "global_statement" ? NodeKind::Global : NodeKind::Nonlocal, n);
        for (TSNode id : namedChildren(n))
            g->identifiers.emplace_back(text(id));
        return g;
    }
    if (t == "type_alias_statement") {
        auto kids = namedChildren(n);
        if (kids.size() < 2)
            return errorAt(n, "expected type alias");
        Node *a = make(NodeKind::Assign, n);
        if (auto err = append(a->targets, kids.front()))
            return std::move(err);
        if (auto err = set(a->value, kids.back()))
            return std::move(err);
        return a;
    }
    if (t == "print_statement" || t == "exec_statement")
        return errorAt(n, "Python 2 '" + t.split('_').first.str() + "' statement");
    return errorAt(n, "unsupported statement '" + t.str() + "'");
}

TreeBuilder::NodeResult TreeBuilder::buildExpressionStatement(TSNode n) {
    auto kids = namedChildren(n);
    if (kids.empty())
        return errorAt(n, "expected expression");
    if (kids.size() == 1) {
        llvm::StringRef t = typeOf(kids[0]);
        if (t == "assignment")
            return buildAssignment(kids[0], n);
        if (t == "augmented_assignment") {
            TSNode a = kids[0];
            Node *aug = make(NodeKind::AugAssign, n);
            llvm::StringRef op = typeOf(field(a, "operator"));
            aug->op = op.drop_back().str();
            if (auto err = set(aug->target, field(a, "left")))
                return std::move(err);
            if (auto err = set(aug->value, field(a, "right")))
                return std::move(err);
            return aug;
        }
    }

    Node *stmt = make(NodeKind::ExprStmt, n);
    auto value = buildOneOrTuple(n, kids);
    if (!value)
        return value.takeError();
    stmt->value = *value;
    return stmt;
}

TreeBuilder::NodeResult TreeBuilder::buildAssignment(TSNode a, TSNode stmt) {
    TSNode annotation = field(a, "type");
    if (present(annotation)) {
        Node *n = make(NodeKind::AnnAssign, stmt);
        if (auto err = set(n->target, field(a, "left")))
            return std::move(err);
        if (auto err = set(n->annotation, annotation))
            return std::move(err);
        if (auto err = set(n->value, field(a, "right")))
            return std::move(err);
        return n;
    }

    // a = b = value arrives right-nested; it is unrolled here.
    Node *n = make(NodeKind::Assign, stmt);
    TSNode cur = a;
    while (true) {
        if (auto err = append(n->targets, field(cur, "left")))
            return std::move(err);
        TSNode right = field(cur, "right");
        if (!present(right))
            return errorAt(cur, "expected value after '='");
        llvm::StringRef rt = typeOf(right);
        if (rt == "assignment" && !present(field(right, "type"))) {
            cur = right;
            continue;
        }
        if (rt == "assignment" || rt == "augmented_assignment")
            return errorAt(right, "invalid assignment target");
        if (auto err = set(n->value, right))
            return std::move(err);
        return n;
    }
}

TreeBuilder::NodeResult TreeBuilder::buildDecorated(TSNode n) {
    NodeList decorators;
    for (TSNode d : namedChildren(n)) {
        if (typeOf(d) != "decorator")
            continue;
        auto kids = namedChildren(d);
        if (kids.empty())
            return errorAt(d, "expected decorator expression");
        if (auto err = append(decorators, kids.front()))
            return std::move(err);
    }

    TSNode def = field(n, "definition");
    if (!present(def))
        return errorAt(n, "expected function or class after decorator");
    auto built = typeOf(def) == "class_definition" ? buildClass(def) : buildFunction(def);
    if (!built)
        return built.takeError();
    (*built)->decorators = std::move(decorators);
    return *built;
}

TreeBuilder::NodeResult TreeBuilder::buildFunction(TSNode n) {
    bool isAsync = hasToken(n, "async");
    Node *f = make(isAsync ? NodeKind::AsyncFunctionDef : NodeKind::FunctionDef, n);
    f->name = std::string(text(field(n, "name")));

    auto params = buildParameters(field(n, "parameters"), n);
    if (!params)
        return params.takeError();
    f->args = *params;
    if (auto err = set(f->returns, field(n, "return_type")))
        return std::move(err);
    if (auto err = buildBlock(field(n, "body"), f->body))
        return std::move(err);
    return f;
}

TreeBuilder::NodeResult TreeBuilder::buildClass(TSNode n) {
    Node *c = make(NodeKind::ClassDef, n);
    c->name = std::string(text(field(n, "name")));
    TSNode bases = field(n, "superclasses");
    if (present(bases)) {
        if (auto err = buildArgumentList(bases, c->elts, c->keywords))
            return std::move(err);
    }
    if (auto err = buildBlock(field(n, "body"), c->body))
        return std::move(err);
    return c;
}

TreeBuilder::NodeResult TreeBuilder::buildIf(TSNode n) {
    Node *top = make(NodeKind::If, n);
    if (auto err = set(top->test, field(n, "condition")))
        return std::move(err);
    if (auto err = buildBlock(field(n, "consequence"), top->body))
        return std::move(err);

    // elif clauses become If nodes nested in the previous orelse.
    Node *cur = top;
    for (TSNode alt : fieldChildren(n, "alternative")) {
        if (typeOf(alt) == "elif_clause") {
            Node *elif = make(NodeKind::If, alt);
            elif->isElif = true;
            elif->endLine = top->endLine;
            if (auto err = set(elif->test, field(alt, "condition")))
                return std::move(err);
            if (auto err = buildBlock(blockOf(alt), elif->body))
                return std::move(err);
            cur->orelse.push_back(elif);
            cur = elif;
        } else {
            if (auto err = buildElse(alt, cur->orelse))
                return std::move(err);
        }
    }
    return top;
}

TreeBuilder::NodeResult TreeBuilder::buildFor(TSNode n) {
    Node *f = make(hasToken(n, "async") ? NodeKind::AsyncFor : NodeKind::For, n);
    if (auto err = set(f->target, field(n, "left")))
        return std::move(err);
    if (auto err = set(f->iter, field(n, "right")))
        return std::move(err);
    if (auto err = buildBlock(field(n, "body"), f->body))
        return std::move(err);
    if (auto err = buildElse(field(n, "alternative"), f->orelse))
        return std::move(err);
    return f;
}

TreeBuilder::NodeResult TreeBuilder::buildWhile(TSNode n) {
    Node *w = make(NodeKind::While, n);
    if (auto err = set(w->test, field(n, "condition")))
        return std::move(err);
    if (auto err = buildBlock(field(n, "body"), w->body))
        return std::move(err);
    if (auto err = buildElse(field(n, "alternative"), w->orelse))
        return std::move(err);
    return w;
}

TreeBuilder::NodeResult TreeBuilder::buildTry(TSNode n) {
    Node *t = make(NodeKind::Try, n);
    if (auto err = buildBlock(field(n, "body"), t->body))
        return std::move(err);

    for (TSNode clause : namedChildren(n)) {
        llvm::StringRef ct = typeOf(clause);
        if (ct == "except_clause" || ct == "except_group_clause") {
            auto handler = buildHandler(clause);
            if (!handler)
                return handler.takeError();
            t->handlers.push_back(*handler);
        } else if (ct == "else_clause") {
            if (auto err = buildElse(clause, t->orelse))
                return std::move(err);
        } else if (ct == "finally_clause") {
            if (auto err = buildBlock(blockOf(clause), t->finalbody))
                return std::move(err);
        }
    }
    return t;
}

TreeBuilder::NodeResult TreeBuilder::buildHandler(TSNode clause) {
    Node *h = make(NodeKind::ExceptHandler, clause);
    std::vector<TSNode> parts;
    for (TSNode c : namedChildren(clause)) {
        if (typeOf(c) != "block")
            parts.push_back(c);
    }
    if (!parts.empty()) {
        TSNode type = parts[0];
        if (typeOf(type) == "as_pattern") {
            auto inner = namedChildren(type);
            if (inner.empty())
                return errorAt(type, "expected exception type");
            if (auto err = set(h->test, inner.front()))
                return std::move(err);
            h->name = std::string(text(unwrapAlias(field(type, "alias"))));
        } else {
            if (auto err = set(h->test, type))
                return std::move(err);
            if (parts.size() > 1)
                h->name = std::string(text(unwrapAlias(parts[1])));
        }
    }
    if (auto err = buildBlock(blockOf(clause), h->body))
        return std::move(err);
    return h;
}

TreeBuilder::NodeResult TreeBuilder::buildWith(TSNode n) {
    Node *w = make(hasToken(n, "async") ? NodeKind::AsyncWith : NodeKind::With, n);
    for (TSNode c : namedChildren(n)) {
        std::vector<TSNode> items;
        if (typeOf(c) == "with_clause")
            items = namedChildren(c);
        else if (typeOf(c) == "with_item")
            items.push_back(c);
        for (TSNode item : items) {
            if (typeOf(item) != "with_item")
                continue;
            auto built = buildWithItem(item);
            if (!built)
                return built.takeError();
            w->items.push_back(*built);
        }
    }
    if (w->items.empty())
        return errorAt(n, "expected context manager");
    if (auto err = buildBlock(field(n, "body"), w->body))
        return std::move(err);
    return w;
}

TreeBuilder::NodeResult TreeBuilder::buildWithItem(TSNode item) {
    Node *i = make(NodeKind::WithItem, item);
    TSNode value = field(item, "value");
    if (!present(value))
        return errorAt(item, "expected context manager");
    if (typeOf(value) == "as_pattern") {
        auto inner = namedChildren(value);
        if (inner.empty())
            return errorAt(value, "expected context manager");
        if (auto err = set(i->value, inner.front()))
            return std::move(err);
        if (auto err = set(i->target, unwrapAlias(field(value, "alias"))))
            return std::move(err);
        return i;
    }
    if (auto err = set(i->value, value))
        return std::move(err);
    if (auto err = set(i->target, unwrapAlias(field(item, "alias"))))
        return std::move(err);
    return i;
}

TreeBuilder::NodeResult TreeBuilder::buildMatch(TSNode n) {
    Node *m = make(NodeKind::Match, n);
    auto subject = buildOneOrTuple(n, fieldChildren(n, "subject"));
    if (!subject)
        return subject.takeError();
    m->value = *subject;

    std::vector<TSNode> clauses;
    for (TSNode c : namedChildren(n)) {
        if (typeOf(c) == "case_clause") {
            clauses.push_back(c);
        } else if (typeOf(c) == "block") {
            for (TSNode inner : namedChildren(c)) {
                if (typeOf(inner) == "case_clause")
                    clauses.push_back(inner);
            }
        }
    }
    for (TSNode clause : clauses) {
        auto c = buildCase(clause);
        if (!c)
            return c.takeError();
        m->handlers.push_back(*c);
    }
    if (m->handlers.empty())
        return errorAt(n, "expected 'case' block");
    return m;
}

TreeBuilder::NodeResult TreeBuilder::buildCase(TSNode clause) {
    Node *c = make(NodeKind::MatchCase, clause);
    NodeList patterns;
    for (TSNode p : namedChildren(clause)) {
        if (typeOf(p) != "case_pattern")
            continue;
        auto built = buildPattern(p);
        if (!built)
            return built.takeError();
        patterns.push_back(*built);
    }
    if (patterns.size() == 1) {
        c->target = patterns.front();
    } else if (!patterns.empty()) {
        Node *tuple = make(NodeKind::Tuple, clause);
        tuple->line = patterns.front()->line;
        tuple->column = patterns.front()->column;
        tuple->elts = std::move(patterns);
        c->target = tuple;
    }

    TSNode guard = field(clause, "guard");
    if (present(guard)) {
        auto kids = namedChildren(guard);
        if (kids.empty())
            return errorAt(guard, "expected guard expression");
        if (auto err = set(c->test, kids.front()))
            return std::move(err);
    }
    if (auto err = buildBlock(blockOf(clause), c->body))
        return std::move(err);
    return c;
}

// Patterns are kept as the expressions they read as: class patterns as
// calls, captures as names, `p as x` as a named expression.
TreeBuilder::NodeResult TreeBuilder::buildPattern(TSNode p) {
    if (auto err = enter(p))
        return std::move(err);
    auto leave = llvm::make_scope_exit([this] { --depth_; });
    return buildPatternKind(p);
}

TreeBuilder::NodeResult TreeBuilder::buildPatternKind(TSNode p) {
    llvm::StringRef t = typeOf(p);
    if (t == "case_pattern") {
        bool negative = false;
        for (const Child &c : childrenOf(p)) {
            if (!ts_node_is_named(c.node)) {
                negative |= typeOf(c.node) == "-";
                continue;
            }
            auto inner = buildPattern(c.node);
            if (!inner || !negative)
                return inner;
            Node *neg = make(NodeKind::UnaryOp, p);
            neg->op = "-";
            neg->value = *inner;
            return neg;
        }
        Node *wildcard = make(NodeKind::Name, p);
        wildcard->name = "_";
        return wildcard;
    }
    if (t == "dotted_name")
        return buildDotted(p);
    if (t == "as_pattern") {
        auto kids = namedChildren(p);
        if (kids.empty())
            return errorAt(p, "expected pattern before 'as'");
        Node *capture = make(NodeKind::NamedExpr, p);
        auto value = buildPattern(kids.front());
        if (!value)
            return value.takeError();
        capture->value = *value;
        TSNode alias = unwrapAlias(field(p, "alias"));
        if (!present(alias))
            alias = kids.back();
        Node *name = make(NodeKind::Name, alias);
        name->name = std::string(text(alias));
        capture->target = name;
        return capture;
    }
    if (t == "class_pattern" || t == "keyword_pattern") {
        auto kids = namedChildren(p);
        if (kids.empty())
            return errorAt(p, "expected pattern");
        if (t == "keyword_pattern") {
            Node *kw = make(NodeKind::Keyword, p);
            kw->name = std::string(text(kids.front()));
            if (kids.size() > 1) {
                auto value = buildPattern(kids[1]);
                if (!value)
                    return value.takeError();
                kw->value = *value;
            }
            return kw;
        }
        Node *call = make(NodeKind::Call, p);
        auto func = buildDotted(kids.front());
        if (!func)
            return func.takeError();
        call->func = *func;
        for (size_t i = 1; i < kids.size(); ++i) {
            auto arg = buildPattern(kids[i]);
            if (!arg)
                return arg.takeError();
            if ((*arg)->is(NodeKind::Keyword))
                call->keywords.push_back(*arg);
            else
                call->elts.push_back(*arg);
        }
        return call;
    }
    if (t == "list_pattern" || t == "tuple_pattern") {
        Node *seq = make(t == "list_pattern" ? NodeKind::List : NodeKind::Tuple, p);
        for (TSNode c : namedChildren(p)) {
            auto elt = buildPattern(c);
            if (!elt)
                return elt.takeError();
            seq->elts.push_back(*elt);
        }
        return seq;
    }
    if (t == "dict_pattern") {
        Node *dict = make(NodeKind::Dict, p);
        for (const Child &c : childrenOf(p)) {
            if (!ts_node_is_named(c.node))
                continue;
            bool splat = typeOf(c.node) == "splat_pattern";
            if (c.field != "key" && c.field != "value" && !splat)
                continue;
            auto built = buildPattern(c.node);
            if (!built)
                return built.takeError();
            if (c.field == "key") {
                dict->keys.push_back(*built);
            } else {
                if (splat)
                    dict->keys.push_back(nullptr);
                dict->elts.push_back(*built);
            }
        }
        if (dict->keys.size() != dict->elts.size())
            return errorAt(p, "malformed mapping pattern");
        return dict;
    }
    if (t == "union_pattern") {
        Node *result = nullptr;
        for (TSNode c : namedChildren(p)) {
            auto alt = buildPattern(c);
            if (!alt)
                return alt.takeError();
            if (!result) {
                result = *alt;
                continue;
            }
            Node *bin = make(NodeKind::BinOp, p);
            bin->op = "|";
            bin->left = result;
            bin->right = *alt;
            result = bin;
        }
        if (!result)
            return errorAt(p, "expected pattern");
        return result;
    }
    if (t == "splat_pattern") {
        Node *star = make(NodeKind::Starred, p);
        auto kids = namedChildren(p);
        Node *name = make(NodeKind::Name, kids.empty() ? p : kids.front());
        name->name = kids.empty() ? "_" : std::string(text(kids.front()));
        star->value = name;
        return star;
    }
    if (t == "complex_pattern") {
        Node *c = make(NodeKind::Constant, p);
        c->constant = ConstantKind::Complex;
        c->text = std::string(text(p));
        return c;
    }
    return buildExpr(p);
}

TreeBuilder::NodeResult TreeBuilder::buildImport(TSNode n) {
    Node *imp = make(NodeKind::Import, n);
    for (TSNode name : fieldChildren(n, "name")) {
        auto alias = buildAlias(name);
        if (!alias)
            return alias.takeError();
        imp->names.push_back(*alias);
    }
    if (imp->names.empty())
        return errorAt(n, "expected module name");
    return imp;
}

TreeBuilder::NodeResult TreeBuilder::buildImportFrom(TSNode n) {
    Node *imp = make(NodeKind::ImportFrom, n);
    if (typeOf(n) == "future_import_statement") {
        imp->name = "__future__";
    } else {
        TSNode module = field(n, "module_name");
        if (typeOf(module) == "relative_import") {
            for (TSNode part : namedChildren(module)) {
                if (typeOf(part) == "import_prefix") {
                    std::string_view dots = text(part);
                    imp->level = static_cast<unsigned>(
                        std::count(dots.begin(), dots.end(), '.'));
                } else if (typeOf(part) == "dotted_name") {
                    auto dotted = buildDotted(part);
                    if (!dotted)
                        return dotted.takeError();
                    imp->name = dottedName(*dotted);
                }
            }
        } else if (present(module)) {
            auto dotted = buildDotted(module);
            if (!dotted)
                return dotted.takeError();
            imp->name = dottedName(*dotted);
        }
    }

    for (const Child &c : childrenOf(n)) {
        if (typeOf(c.node) == "wildcard_import") {
            Node *star = make(NodeKind::Alias, c.node);
            star->name = "*";
            imp->names.push_back(star);
        } else if (c.field == "name") {
            auto alias = buildAlias(c.node);
            if (!alias)
                return alias.takeError();
            imp->names.push_back(*alias);
        }
    }
    if (imp->names.empty())
        return errorAt(n, "expected name to import");
    return imp;
}

TreeBuilder::NodeResult TreeBuilder::buildAlias(TSNode n) {
    Node *alias = make(NodeKind::Alias, n);
    TSNode name = n;
    if (typeOf(n) == "aliased_import") {
        name = field(n, "name");
        alias->asName = std::string(text(field(n, "alias")));
    }
    auto dotted = buildDotted(name);
    if (!dotted)
        return dotted.takeError();
    alias->name = dottedName(*dotted);
    return alias;
}

// --- signatures ---

TreeBuilder::NodeResult TreeBuilder::buildParameters(TSNode params, TSNode at) {
    Node *args = make(NodeKind::Arguments, present(params) ? params : at);
    if (!present(params))
        return args;

    bool keywordOnly = false;
    auto addArg = [&](TSNode nameNode, ArgKind kind, TSNode annotation,
                      TSNode value) -> llvm::Error {
        Node *arg = make(NodeKind::Arg, nameNode);
        arg->name = std::string(text(nameNode));
        arg->argKind = kind;
        if (auto err = set(arg->annotation, annotation))
            return err;
        if (auto err = set(arg->value, value))
            return err;
        args->elts.push_back(arg);
        return llvm::Error::success();
    };
    auto plain = [&]() {
        return keywordOnly ? ArgKind::KeywordOnly : ArgKind::Positional;
    };
    // *args / **kwargs, bare or annotated.
    auto addSplat = [&](TSNode splat, TSNode annotation) -> llvm::Error {
        TSNode id = firstNamedOfType(splat, "identifier");
        if (typeOf(splat) == "dictionary_splat_pattern")
            return present(id) ? addArg(id, ArgKind::KwArgs, annotation, TSNode{})
                               : errorAt(splat, "expected parameter name");
        keywordOnly = true;
        if (!present(id))
            return llvm::Error::success();
        return addArg(id, ArgKind::VarArgs, annotation, TSNode{});
    };

    auto addParam = [&](TSNode p) -> llvm::Error {
        llvm::StringRef t = typeOf(p);
        if (t == "identifier")
            return addArg(p, plain(), TSNode{}, TSNode{});
        if (t == "default_parameter" || t == "typed_default_parameter")
            return addArg(field(p, "name"), plain(), field(p, "type"), field(p, "value"));
        if (t == "typed_parameter") {
            TSNode annotation = field(p, "type");
            TSNode inner{};
            for (TSNode c : namedChildren(p)) {
                if (!ts_node_eq(c, annotation)) {
                    inner = c;
                    break;
                }
            }
            if (!present(inner))
                return errorAt(p, "expected parameter name");
            if (typeOf(inner) == "identifier")
                return addArg(inner, plain(), annotation, TSNode{});
            return addSplat(inner, annotation);
        }
        if (t == "list_splat_pattern" || t == "dictionary_splat_pattern")
            return addSplat(p, TSNode{});
        if (t == "keyword_separator") {
            keywordOnly = true;
            return llvm::Error::success();
        }
        if (t == "positional_separator") {
            for (const auto *a : args->elts)
                const_cast<Node *>(a)->argKind = ArgKind::PositionalOnly;
            return llvm::Error::success();
        }
        return errorAt(p, "unsupported parameter '" + t.str() + "'");
    };

    for (TSNode p : namedChildren(params)) {
        if (auto err = addParam(p))
            return std::move(err);
    }
    return args;
}

// --- expressions ---

TreeBuilder::NodeResult TreeBuilder::buildExpr(TSNode n) {
    if (auto err = enter(n))
        return std::move(err);
    auto leave = llvm::make_scope_exit([this] { --depth_; });
    return buildExprKind(n);
}

TreeBuilder::NodeResult TreeBuilder::buildSequence(NodeKind kind, TSNode at,
                                                   const std::vector<TSNode> &elts) {
    Node *seq = make(kind, at);
    for (TSNode e : elts) {
        if (auto err = append(seq->elts, e))
            return std::move(err);
    }
    return seq;
}

TreeBuilder::NodeResult TreeBuilder::buildOneOrTuple(TSNode at,
                                                     const std::vector<TSNode> &elts) {
    if (elts.size() == 1)
        return buildExpr(elts.front());
    if (elts.empty())
        return errorAt(at, "expected expression");
    return buildSequence(NodeKind::Tuple, elts.front(), elts);
}

TreeBuilder::NodeResult TreeBuilder::buildDotted(TSNode dotted) {
    if (!present(dotted))
        return makeError(ErrorKind::Syntax, "expected name");
    if (typeOf(dotted) != "dotted_name") {
        Node *name = make(NodeKind::Name, dotted);
        name->name = std::string(text(dotted));
        return name;
    }
    Node *expr = nullptr;
    for (TSNode id : namedChildren(dotted)) {
        if (!expr) {
            expr = make(NodeKind::Name, id);
            expr->name = std::string(text(id));
            continue;
        }
        Node *attr = make(NodeKind::Attribute, dotted);
        attr->value = expr;
        attr->name = std::string(text(id));
        expr = attr;
    }
    if (!expr)
        return errorAt(dotted, "expected name");
    return expr;
}

TreeBuilder::NodeResult TreeBuilder::buildExprKind(TSNode n) {
    llvm::StringRef t = typeOf(n);

    if (t == "identifier") {
        Node *name = make(NodeKind::Name, n);
        name->name = std::string(text(n));
        return name;
    }
    if (t == "true" || t == "false" || t == "none" || t == "ellipsis" ||
        t == "integer" || t == "float") {
        Node *c = make(NodeKind::Constant, n);
        c->text = std::string(text(n));
        if (t == "true")
            c->constant = ConstantKind::True;
        else if (t == "false")
            c->constant = ConstantKind::False;
        else if (t == "none")
            c->constant = ConstantKind::None;
        else if (t == "ellipsis")
            c->constant = ConstantKind::Ellipsis;
        else
            c->constant = numberKind(c->text);
        return c;
    }
    if (t == "string" || t == "concatenated_string")
        return buildString(n);

    if (t == "attribute") {
        Node *attr = make(NodeKind::Attribute, n);
        if (auto err = set(attr->value, field(n, "object")))
            return std::move(err);
        attr->name = std::string(text(field(n, "attribute")));
        return attr;
    }
    if (t == "call") {
        Node *call = make(NodeKind::Call, n);
        if (auto err = set(call->func, field(n, "function")))
            return std::move(err);
        TSNode arguments = field(n, "arguments");
        if (present(arguments)) {
            llvm::Error err = typeOf(arguments) == "generator_expression"
                ? append(call->elts, arguments)
                : buildArgumentList(arguments, call->elts, call->keywords);
            if (err)
                return std::move(err);
        }
        return call;
    }
    if (t == "subscript") {
        Node *sub = make(NodeKind::Subscript, n);
        if (auto err = set(sub->value, field(n, "value")))
            return std::move(err);
        auto slice = buildOneOrTuple(n, fieldChildren(n, "subscript"));
        if (!slice)
            return slice.takeError();
        sub->slice = *slice;
        return sub;
    }
    if (t == "slice")
        return buildSlice(n);

    if (t == "binary_operator") {
        Node *bin = make(NodeKind::BinOp, n);
        bin->op = typeOf(field(n, "operator")).str();
        if (auto err = set(bin->left, field(n, "left")))
            return std::move(err);
        if (auto err = set(bin->right, field(n, "right")))
            return std::move(err);
        return bin;
    }
    if (t == "unary_operator" || t == "not_operator") {
        Node *un = make(NodeKind::UnaryOp, n);
        un->op = t == "not_operator" ? "not" : typeOf(field(n, "operator")).str();
        if (auto err = set(un->value, field(n, "argument")))
            return std::move(err);
        return un;
    }
    if (t == "boolean_operator")
        return buildBoolOp(n);
    if (t == "comparison_operator")
        return buildCompare(n);

    if (t == "conditional_expression") {
        auto kids = namedChildren(n);
        if (kids.size() != 3)
            return errorAt(n, "malformed conditional expression");
        Node *ifExp = make(NodeKind::IfExp, n);
        if (auto err = set(ifExp->value, kids[0]))
            return std::move(err);
        if (auto err = set(ifExp->test, kids[1]))
            return std::move(err);
        if (auto err = append(ifExp->orelse, kids[2]))
            return std::move(err);
        return ifExp;
    }
    if (t == "named_expression") {
        Node *walrus = make(NodeKind::NamedExpr, n);
        if (auto err = set(walrus->target, field(n, "name")))
            return std::move(err);
        if (auto err = set(walrus->value, field(n, "value")))
            return std::move(err);
        return walrus;
    }
    if (t == "lambda") {
        Node *lambda = make(NodeKind::Lambda, n);
        auto params = buildParameters(field(n, "parameters"), n);
        if (!params)
            return params.takeError();
        lambda->args = *params;
        if (auto err = set(lambda->value, field(n, "body")))
            return std::move(err);
        return lambda;
    }
    if (t == "await") {
        Node *aw = make(NodeKind::Await, n);
        auto kids = namedChildren(n);
        if (kids.empty())
            return errorAt(n, "expected expression after 'await'");
        if (auto err = set(aw->value, kids.front()))
            return std::move(err);
        return aw;
    }
    if (t == "yield") {
        Node *y = make(NodeKind::Yield, n);
        for (const Child &c : childrenOf(n)) {
            if (!ts_node_is_named(c.node)) {
                if (typeOf(c.node) == "from")
                    y->kind = NodeKind::YieldFrom;
                continue;
            }
            if (auto err = set(y->value, c.node))
                return std::move(err);
        }
        return y;
    }

    if (t == "list" || t == "list_pattern")
        return buildSequence(NodeKind::List, n, namedChildren(n));
    if (t == "tuple" || t == "tuple_pattern" || t == "expression_list" ||
        t == "pattern_list")
        return buildSequence(NodeKind::Tuple, n, namedChildren(n));
    if (t == "set")
        return buildSequence(NodeKind::Set, n, namedChildren(n));
    if (t == "dictionary")
        return buildDict(n);
    if (t == "list_comprehension")
        return buildComprehension(NodeKind::ListComp, n);
    if (t == "set_comprehension")
        return buildComprehension(NodeKind::SetComp, n);
    if (t == "dictionary_comprehension")
        return buildComprehension(NodeKind::DictComp, n);
    if (t == "generator_expression")
        return buildComprehension(NodeKind::GeneratorExp, n);

    if (t == "list_splat" || t == "list_splat_pattern" ||
        t == "parenthesized_list_splat" || t == "splat_type")
        return buildStarred(n);

    // Wrappers that add nothing to the tree.
    if (t == "parenthesized_expression" || t == "type" || t == "constrained_type" ||
        t == "as_pattern_target" || t == "as_pattern" || t == "case_pattern") {
        auto kids = namedChildren(n);
        if (kids.empty())
            return errorAt(n, "expected expression");
        if (t == "case_pattern")
            return buildPattern(n);
        return buildExpr(kids.front());
    }

    // Annotation-only forms: list[int], A | B, mod.T.
    if (t == "generic_type") {
        auto kids = namedChildren(n);
        if (kids.size() < 2)
            return errorAt(n, "malformed generic type");
        Node *sub = make(NodeKind::Subscript, n);
        if (auto err = set(sub->value, kids[0]))
            return std::move(err);
        auto slice = buildOneOrTuple(kids[1], namedChildren(kids[1]));
        if (!slice)
            return slice.takeError();
        sub->slice = *slice;
        return sub;
    }
    if (t == "union_type") {
        auto kids = namedChildren(n);
        if (kids.size() != 2)
            return errorAt(n, "malformed union type");
        Node *bin = make(NodeKind::BinOp, n);
        bin->op = "|";
        if (auto err = set(bin->left, kids[0]))
            return std::move(err);
        if (auto err = set(bin->right, kids[1]))
            return std::move(err);
        return bin;
    }
    if (t == "member_type") {
        auto kids = namedChildren(n);
        if (kids.size() != 2)
            return errorAt(n, "malformed member type");
        Node *attr = make(NodeKind::Attribute, n);
        if (auto err = set(attr->value, kids[0]))
            return std::move(err);
        attr->name = std::string(text(kids[1]));
        return attr;
    }
    if (t == "dotted_name")
        return buildDotted(n);

    return errorAt(n, "unsupported expression '" + t.str() + "'");
}

TreeBuilder::NodeResult TreeBuilder::buildStarred(TSNode n) {
    Node *star = make(NodeKind::Starred, n);
    auto kids = namedChildren(n);
    if (kids.empty())
        return errorAt(n, "expected expression after '*'");
    if (auto err = set(star->value, kids.front()))
        return std::move(err);
    return star;
}

// `a or b or c` arrives left-nested; the spine is walked iteratively and
// flattened into one BoolOp.
TreeBuilder::NodeResult TreeBuilder::buildBoolOp(TSNode n) {
    llvm::StringRef op = typeOf(field(n, "operator"));
    std::vector<TSNode> operands;
    TSNode cur = n;
    while (present(cur) && typeOf(cur) == "boolean_operator" &&
           typeOf(field(cur, "operator")) == op) {
        operands.push_back(field(cur, "right"));
        cur = field(cur, "left");
    }
    operands.push_back(cur);
    std::reverse(operands.begin(), operands.end());

    Node *b = make(NodeKind::BoolOp, n);
    b->op = op.str();
    for (TSNode operand : operands) {
        if (!present(operand))
            return errorAt(n, "expected operand");
        if (auto err = append(b->elts, operand))
            return std::move(err);
    }
    return b;
}

TreeBuilder::NodeResult TreeBuilder::buildCompare(TSNode n) {
    Node *cmp = make(NodeKind::Compare, n);
    std::string pending;
    for (const Child &c : childrenOf(n)) {
        if (!ts_node_is_named(c.node)) {
            // `not in` and `is not` may arrive as one token or as two.
            if (!pending.empty())
                pending += ' ';
            pending += typeOf(c.node).str();
            continue;
        }
        auto operand = buildExpr(c.node);
        if (!operand)
            return operand.takeError();
        if (!cmp->left) {
            cmp->left = *operand;
        } else {
            cmp->identifiers.push_back(std::move(pending));
            cmp->elts.push_back(*operand);
        }
        pending.clear();
    }
    if (!cmp->left || cmp->elts.empty())
        return errorAt(n, "malformed comparison");
    return cmp;
}

TreeBuilder::NodeResult TreeBuilder::buildSlice(TSNode n) {
    Node *slice = make(NodeKind::Slice, n);
    unsigned colons = 0;
    for (const Child &c : childrenOf(n)) {
        if (!ts_node_is_named(c.node)) {
            colons += typeOf(c.node) == ":";
            continue;
        }
        const Node *&slot = colons == 0 ? slice->left
                          : colons == 1 ? slice->right
                                        : slice->value;
        if (auto err = set(slot, c.node))
            return std::move(err);
    }
    return slice;
}

TreeBuilder::NodeResult TreeBuilder::buildDict(TSNode n) {
    Node *dict = make(NodeKind::Dict, n);
    for (TSNode entry : namedChildren(n)) {
        if (typeOf(entry) == "pair") {
            if (auto err = append(dict->keys, field(entry, "key")))
                return std::move(err);
            if (auto err = append(dict->elts, field(entry, "value")))
                return std::move(err);
        } else if (typeOf(entry) == "dictionary_splat") {
            auto kids = namedChildren(entry);
            if (kids.empty())
                return errorAt(entry, "expected expression after '**'");
            dict->keys.push_back(nullptr);
            if (auto err = append(dict->elts, kids.front()))
                return std::move(err);
        } else {
            return errorAt(entry, "expected dictionary entry");
        }
    }
    return dict;
}

TreeBuilder::NodeResult TreeBuilder::buildComprehension(NodeKind kind, TSNode n) {
    Node *comp = make(kind, n);
    TSNode body = field(n, "body");
    if (!present(body))
        return errorAt(n, "expected comprehension body");
    if (kind == NodeKind::DictComp) {
        if (typeOf(body) != "pair")
            return errorAt(body, "expected 'key: value'");
        if (auto err = set(comp->key, field(body, "key")))
            return std::move(err);
        if (auto err = set(comp->value, field(body, "value")))
            return std::move(err);
    } else if (auto err = set(comp->value, body)) {
        return std::move(err);
    }

    Node *current = nullptr;
    for (TSNode clause : namedChildren(n)) {
        llvm::StringRef ct = typeOf(clause);
        if (ct == "for_in_clause") {
            current = make(NodeKind::Comprehension, clause);
            current->isAsync = hasToken(clause, "async");
            auto target = buildOneOrTuple(clause, fieldChildren(clause, "left"));
            if (!target)
                return target.takeError();
            current->target = *target;
            auto iter = buildOneOrTuple(clause, fieldChildren(clause, "right"));
            if (!iter)
                return iter.takeError();
            current->iter = *iter;
            comp->generators.push_back(current);
        } else if (ct == "if_clause") {
            auto kids = namedChildren(clause);
            if (!current || kids.empty())
                return errorAt(clause, "misplaced comprehension filter");
            if (auto err = append(current->elts, kids.front()))
                return std::move(err);
        }
    }
    if (comp->generators.empty())
        return errorAt(n, "expected 'for' clause");
    return comp;
}

llvm::Error TreeBuilder::buildArgumentList(TSNode list, NodeList &positional,
                                           NodeList &keywords) {
    for (TSNode arg : namedChildren(list)) {
        llvm::StringRef t = typeOf(arg);
        if (t == "keyword_argument") {
            Node *kw = make(NodeKind::Keyword, arg);
            kw->name = std::string(text(field(arg, "name")));
            if (auto err = set(kw->value, field(arg, "value")))
                return err;
            keywords.push_back(kw);
        } else if (t == "dictionary_splat") {
            auto kids = namedChildren(arg);
            if (kids.empty())
                return errorAt(arg, "expected expression after '**'");
            Node *kw = make(NodeKind::Keyword, arg);
            if (auto err = set(kw->value, kids.front()))
                return err;
            keywords.push_back(kw);
        } else if (auto err = append(positional, arg)) {
            return err;
        }
    }
    return llvm::Error::success();
}

TreeBuilder::NodeResult TreeBuilder::buildString(TSNode n) {
    std::vector<TSNode> parts;
    if (typeOf(n) == "concatenated_string")
        parts = namedChildren(n);
    else
        parts.push_back(n);

    bool format = false;
    bool bytes = false;
    std::string value;
    for (TSNode p : parts) {
        StringParts sp = splitString(text(p));
        format |= sp.format;
        bytes |= sp.bytes;
        if (sp.format)
            value += std::string(sp.body);
        else
            value += decodeEscapes(sp.body, sp.raw);
    }

    if (!format) {
        Node *c = make(NodeKind::Constant, n);
        c->constant = bytes ? ConstantKind::Bytes : ConstantKind::Str;
        c->text = std::move(value);
        return c;
    }

    Node *joined = make(NodeKind::JoinedStr, n);
    joined->text = std::move(value);
    for (TSNode p : parts) {
        if (!splitString(text(p)).format)
            continue;
        if (auto err = collectFields(p, joined))
            return std::move(err);
    }
    return joined;
}

// Replacement fields of an f-string, including those nested in a format
// specifier (`{value:>{width}}`).
llvm::Error TreeBuilder::collectFields(TSNode n, Node *joined) {
    for (TSNode c : namedChildren(n)) {
        llvm::StringRef t = typeOf(c);
        if (t == "format_specifier") {
            if (auto err = collectFields(c, joined))
                return err;
            continue;
        }
        if (t != "interpolation" && t != "format_expression")
            continue;

        TSNode expr = field(c, "expression");
        if (!present(expr)) {
            for (TSNode k : namedChildren(c)) {
                llvm::StringRef kt = typeOf(k);
                if (kt != "type_conversion" && kt != "format_specifier") {
                    expr = k;
                    break;
                }
            }
        }
        if (!present(expr))
            return errorAt(c, "f-string: empty expression not allowed");
        if (auto err = append(joined->elts, expr))
            return err;
        if (auto err = collectFields(c, joined))
            return err;
    }
    return llvm::Error::success();
}

} // anonymous namespace

llvm::Expected<SyntaxTree> parseModule(std::string_view source) {
    if (source.size() > std::numeric_limits<uint32_t>::max())
        return makeError(ErrorKind::Syntax, "source too large to parse");
    if (llvm::StringRef(source.data(), source.size()).startswith("\xEF\xBB\xBF"))
        source.remove_prefix(3);

    std::unique_ptr<TSParser, ParserDeleter> parser(ts_parser_new());
    if (!ts_parser_set_language(parser.get(), tree_sitter_python()))
        return makeError(ErrorKind::Syntax,
                         "tree-sitter-python grammar does not match the runtime ABI");

    std::unique_ptr<TSTree, TreeDeleter> cst(ts_parser_parse_string(
        parser.get(), nullptr, source.data(), static_cast<uint32_t>(source.size())));
    if (!cst)
        return makeError(ErrorKind::Syntax, "parser produced no tree");

    TSNode root = ts_tree_root_node(cst.get());
    if (ts_node_has_error(root)) {
        TSNode bad = firstErrorNode(root);
        TSPoint at = ts_node_start_point(bad);
        std::string what = ts_node_is_missing(bad)
            ? "expected '" + std::string(ts_node_type(bad)) + "'"
            : "invalid syntax";
        return makeError(ErrorKind::Syntax, what, at.row + 1, at.column);
    }

    SyntaxTree tree;
    TreeBuilder builder(source, tree);
    auto module = builder.buildModule(root);
    if (!module)
        return module.takeError();
    tree.setRoot(*module);
    tree.finalize();
    return std::move(tree);
}

} // namespace pyhazard::python
