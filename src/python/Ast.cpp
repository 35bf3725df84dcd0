#include "pyhazard/python/Ast.h"

namespace pyhazard::python {

namespace {

void append(std::vector<const Node *> &out, const Node *n) {
    if (n)
        out.push_back(n);
}

void append(std::vector<const Node *> &out, const std::vector<const Node *> &ns) {
    for (const auto *n : ns)
        append(out, n);
}

bool summarize(const Node *cn, Node *scope, Node *module) {
    if (!cn)
        return false;

    // Nodes are owned by the tree as mutable objects; only the links are
    // const so that rules cannot modify them.
    auto *n = const_cast<Node *>(cn);
    if (n->isScope())
        scope = n;

    ScopeFacts &sf = scope->facts;
    switch (n->kind) {
        case NodeKind::If:
        case NodeKind::For:
        case NodeKind::AsyncFor:
        case NodeKind::While:
        case NodeKind::ExceptHandler:
        case NodeKind::IfExp:
        case NodeKind::MatchCase:
            ++sf.branches;
            break;
        case NodeKind::BoolOp:
            if (n->elts.size() > 1)
                sf.branches += static_cast<unsigned>(n->elts.size() - 1);
            break;
        case NodeKind::Comprehension:
            sf.branches += static_cast<unsigned>(n->elts.size());
            break;
        case NodeKind::Return:
            ++sf.returns;
            break;
        case NodeKind::Assign:
            if (n->targets.size() == 1 && n->targets[0]->is(NodeKind::Name)) {
                const std::string &id = n->targets[0]->name;
                if (n->value && n->value->isStringLiteral())
                    sf.stringNames.push_back(id);
                if (id == "__all__" && n->value &&
                    (n->value->is(NodeKind::List) || n->value->is(NodeKind::Tuple))) {
                    for (const auto *e : n->value->elts) {
                        if (e->is(NodeKind::Constant) &&
                            e->constant == ConstantKind::Str)
                            module->facts.referencedNames.insert(e->text);
                    }
                }
            }
            break;
        case NodeKind::AnnAssign:
            if (n->target && n->target->is(NodeKind::Name) && n->value &&
                n->value->isStringLiteral())
                sf.stringNames.push_back(n->target->name);
            break;
        case NodeKind::Name:
            module->facts.referencedNames.insert(n->name);
            break;
        default:
            break;
    }

    bool guard = n->is(NodeKind::Try);
    std::vector<const Node *> kids;
    childrenOf(*n, kids);
    for (const auto *k : kids)
        guard = summarize(k, scope, module) || guard;

    if (n->isScope())
        n->facts.containsGuard = guard;
    return guard;
}

} // anonymous namespace

std::string_view nodeKindName(NodeKind k) {
    switch (k) {
        case NodeKind::Module:           return "Module";
        case NodeKind::FunctionDef:      return "FunctionDef";
        case NodeKind::AsyncFunctionDef: return "AsyncFunctionDef";
        case NodeKind::ClassDef:         return "ClassDef";
        case NodeKind::Return:           return "Return";
        case NodeKind::Delete:           return "Delete";
        case NodeKind::Assign:           return "Assign";
        case NodeKind::AugAssign:        return "AugAssign";
        case NodeKind::AnnAssign:        return "AnnAssign";
        case NodeKind::For:              return "For";
        case NodeKind::AsyncFor:         return "AsyncFor";
        case NodeKind::While:            return "While";
        case NodeKind::If:               return "If";
        case NodeKind::With:             return "With";
        case NodeKind::AsyncWith:        return "AsyncWith";
        case NodeKind::WithItem:         return "WithItem";
        case NodeKind::Match:            return "Match";
        case NodeKind::MatchCase:        return "MatchCase";
        case NodeKind::Raise:            return "Raise";
        case NodeKind::Try:              return "Try";
        case NodeKind::ExceptHandler:    return "ExceptHandler";
        case NodeKind::Assert:           return "Assert";
        case NodeKind::Import:           return "Import";
        case NodeKind::ImportFrom:       return "ImportFrom";
        case NodeKind::Alias:            return "Alias";
        case NodeKind::Global:           return "Global";
        case NodeKind::Nonlocal:         return "Nonlocal";
        case NodeKind::ExprStmt:         return "Expr";
        case NodeKind::Pass:             return "Pass";
        case NodeKind::Break:            return "Break";
        case NodeKind::Continue:         return "Continue";
        case NodeKind::BoolOp:           return "BoolOp";
        case NodeKind::NamedExpr:        return "NamedExpr";
        case NodeKind::BinOp:            return "BinOp";
        case NodeKind::UnaryOp:          return "UnaryOp";
        case NodeKind::Lambda:           return "Lambda";
        case NodeKind::IfExp:            return "IfExp";
        case NodeKind::Dict:             return "Dict";
        case NodeKind::Set:              return "Set";
        case NodeKind::ListComp:         return "ListComp";
        case NodeKind::SetComp:          return "SetComp";
        case NodeKind::DictComp:         return "DictComp";
        case NodeKind::GeneratorExp:     return "GeneratorExp";
        case NodeKind::Comprehension:    return "comprehension";
        case NodeKind::Await:            return "Await";
        case NodeKind::Yield:            return "Yield";
        case NodeKind::YieldFrom:        return "YieldFrom";
        case NodeKind::Compare:          return "Compare";
        case NodeKind::Call:             return "Call";
        case NodeKind::Keyword:          return "keyword";
        case NodeKind::JoinedStr:        return "JoinedStr";
        case NodeKind::Constant:         return "Constant";
        case NodeKind::Attribute:        return "Attribute";
        case NodeKind::Subscript:        return "Subscript";
        case NodeKind::Starred:          return "Starred";
        case NodeKind::Name:             return "Name";
        case NodeKind::List:             return "List";
        case NodeKind::Tuple:            return "Tuple";
        case NodeKind::Slice:            return "Slice";
        case NodeKind::Arguments:        return "arguments";
        case NodeKind::Arg:              return "arg";
    }
    return "?";
}

void childrenOf(const Node &n, std::vector<const Node *> &out) {
    switch (n.kind) {
        case NodeKind::Module:
            append(out, n.body);
            break;
        case NodeKind::FunctionDef:
        case NodeKind::AsyncFunctionDef:
            append(out, n.decorators);
            append(out, n.args);
            append(out, n.returns);
            append(out, n.body);
            break;
        case NodeKind::ClassDef:
            append(out, n.decorators);
            append(out, n.elts);
            append(out, n.keywords);
            append(out, n.body);
            break;
        case NodeKind::Delete:
            append(out, n.targets);
            break;
        case NodeKind::Assign:
            append(out, n.targets);
            append(out, n.value);
            break;
        case NodeKind::AugAssign:
        case NodeKind::NamedExpr:
            append(out, n.target);
            append(out, n.value);
            break;
        case NodeKind::AnnAssign:
            append(out, n.target);
            append(out, n.annotation);
            append(out, n.value);
            break;
        case NodeKind::For:
        case NodeKind::AsyncFor:
            append(out, n.target);
            append(out, n.iter);
            append(out, n.body);
            append(out, n.orelse);
            break;
        case NodeKind::While:
        case NodeKind::If:
            append(out, n.test);
            append(out, n.body);
            append(out, n.orelse);
            break;
        case NodeKind::With:
        case NodeKind::AsyncWith:
            append(out, n.items);
            append(out, n.body);
            break;
        case NodeKind::WithItem:
            append(out, n.value);
            append(out, n.target);
            break;
        case NodeKind::Match:
            append(out, n.value);
            append(out, n.handlers);
            break;
        case NodeKind::MatchCase:
            append(out, n.target);
            append(out, n.test);
            append(out, n.body);
            break;
        case NodeKind::Raise:
            append(out, n.value);
            append(out, n.cause);
            break;
        case NodeKind::Try:
            append(out, n.body);
            append(out, n.handlers);
            append(out, n.orelse);
            append(out, n.finalbody);
            break;
        case NodeKind::ExceptHandler:
            append(out, n.test);
            append(out, n.body);
            break;
        case NodeKind::Assert:
            append(out, n.test);
            append(out, n.value);
            break;
        case NodeKind::Import:
        case NodeKind::ImportFrom:
            append(out, n.names);
            break;
        case NodeKind::Return:
        case NodeKind::ExprStmt:
        case NodeKind::UnaryOp:
        case NodeKind::Await:
        case NodeKind::Yield:
        case NodeKind::YieldFrom:
        case NodeKind::Starred:
        case NodeKind::Keyword:
            append(out, n.value);
            break;
        case NodeKind::BoolOp:
        case NodeKind::Set:
        case NodeKind::List:
        case NodeKind::Tuple:
        case NodeKind::JoinedStr:
        case NodeKind::Arguments:
            append(out, n.elts);
            break;
        case NodeKind::BinOp:
            append(out, n.left);
            append(out, n.right);
            break;
        case NodeKind::Lambda:
            append(out, n.args);
            append(out, n.value);
            break;
        case NodeKind::IfExp:
            append(out, n.value);
            append(out, n.test);
            append(out, n.orelse);
            break;
        case NodeKind::Dict:
            for (size_t i = 0; i < n.elts.size(); ++i) {
                if (i < n.keys.size())
                    append(out, n.keys[i]);
                append(out, n.elts[i]);
            }
            break;
        case NodeKind::ListComp:
        case NodeKind::SetComp:
        case NodeKind::GeneratorExp:
            append(out, n.value);
            append(out, n.generators);
            break;
        case NodeKind::DictComp:
            append(out, n.key);
            append(out, n.value);
            append(out, n.generators);
            break;
        case NodeKind::Comprehension:
            append(out, n.target);
            append(out, n.iter);
            append(out, n.elts);
            break;
        case NodeKind::Compare:
            append(out, n.left);
            append(out, n.elts);
            break;
        case NodeKind::Call:
            append(out, n.func);
            append(out, n.elts);
            append(out, n.keywords);
            break;
        case NodeKind::Attribute:
            append(out, n.value);
            break;
        case NodeKind::Subscript:
            append(out, n.value);
            append(out, n.slice);
            break;
        case NodeKind::Slice:
            append(out, n.left);
            append(out, n.right);
            append(out, n.value);
            break;
        case NodeKind::Arg:
            append(out, n.annotation);
            append(out, n.value);
            break;
        case NodeKind::Alias:
        case NodeKind::Global:
        case NodeKind::Nonlocal:
        case NodeKind::Pass:
        case NodeKind::Break:
        case NodeKind::Continue:
        case NodeKind::Constant:
        case NodeKind::Name:
            break;
    }
}

std::string dottedName(const Node *n) {
    if (!n)
        return {};
    if (n->is(NodeKind::Name))
        return n->name;
    if (n->is(NodeKind::Attribute)) {
        std::string base = dottedName(n->value);
        if (base.empty())
            return {};
        return base + "." + n->name;
    }
    return {};
}

std::string_view calleeName(const Node &call) {
    if (!call.is(NodeKind::Call) || !call.func)
        return {};
    if (call.func->is(NodeKind::Name) || call.func->is(NodeKind::Attribute))
        return call.func->name;
    return {};
}

Node *SyntaxTree::make(NodeKind kind, unsigned line, unsigned column) {
    nodes_.push_back(std::make_unique<Node>(kind));
    Node *n = nodes_.back().get();
    n->line = line;
    n->column = column;
    n->endLine = line;
    return n;
}

void SyntaxTree::finalize() {
    if (!root_)
        return;
    auto *module = const_cast<Node *>(root_);
    summarize(root_, module, module);
}

} // namespace pyhazard::python
