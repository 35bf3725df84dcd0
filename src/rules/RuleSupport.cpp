#include "RuleSupport.h"

#include <llvm/ADT/StringRef.h>

#include <algorithm>

namespace pyhazard::rules {

bool oneOf(std::string_view s, llvm::ArrayRef<std::string_view> set) {
    return std::find(set.begin(), set.end(), s) != set.end();
}

bool isConstant(const Node *n, ConstantKind kind) {
    return n && n->is(NodeKind::Constant) && n->constant == kind;
}

bool isNoneLiteral(const Node *n) { return isConstant(n, ConstantKind::None); }

bool isBoolLiteral(const Node *n) {
    return isConstant(n, ConstantKind::True) || isConstant(n, ConstantKind::False);
}

bool isValueLiteral(const Node *n) {
    if (!n)
        return false;
    switch (n->kind) {
        case NodeKind::Constant:
            return n->constant == ConstantKind::Int ||
                   n->constant == ConstantKind::Float ||
                   n->constant == ConstantKind::Complex ||
                   n->constant == ConstantKind::Str ||
                   n->constant == ConstantKind::Bytes;
        case NodeKind::JoinedStr:
        case NodeKind::List:
        case NodeKind::Dict:
        case NodeKind::Set:
            return true;
        case NodeKind::Tuple:
            return !n->elts.empty();
        case NodeKind::UnaryOp:
            return n->op == "-" && isValueLiteral(n->value);
        default:
            return false;
    }
}

bool isMutableValue(const Node *n) {
    if (!n)
        return false;
    switch (n->kind) {
        case NodeKind::List:
        case NodeKind::Dict:
        case NodeKind::Set:
        case NodeKind::ListComp:
        case NodeKind::DictComp:
        case NodeKind::SetComp:
            return true;
        case NodeKind::Call:
            return isCallNamed(n, {"list", "dict", "set", "defaultdict",
                                   "OrderedDict", "Counter", "deque",
                                   "bytearray"}) ||
                   isCallDotted(n, {"collections.defaultdict",
                                    "collections.OrderedDict",
                                    "collections.Counter",
                                    "collections.deque"});
        default:
            return false;
    }
}

bool isCallNamed(const Node *n, llvm::ArrayRef<std::string_view> names) {
    return n && n->is(NodeKind::Call) && n->func &&
           n->func->is(NodeKind::Name) && oneOf(n->func->name, names);
}

bool isCallDotted(const Node *n, llvm::ArrayRef<std::string_view> names) {
    if (!n || !n->is(NodeKind::Call))
        return false;
    std::string dotted = python::dottedName(n->func);
    return !dotted.empty() && oneOf(dotted, names);
}

const Node *firstArg(const Node &call) {
    return call.elts.empty() ? nullptr : call.elts.front();
}

const Node *keywordArg(const Node &call, std::string_view name) {
    for (const auto *kw : call.keywords) {
        if (kw->name == name)
            return kw->value;
    }
    return nullptr;
}

namespace {

bool involvesString(const Node *n) {
    if (!n)
        return false;
    if (n->isStringLiteral())
        return true;
    if (n->is(NodeKind::BinOp) && n->op == "+")
        return involvesString(n->left) || involvesString(n->right);
    return false;
}

} // anonymous namespace

bool isDynamicString(const Node *n) {
    if (!n)
        return false;
    switch (n->kind) {
        case NodeKind::JoinedStr:
            return !n->elts.empty();
        case NodeKind::BinOp:
            if (n->op == "%")
                return n->left && n->left->isStringLiteral();
            if (n->op == "+")
                return involvesString(n);
            return false;
        case NodeKind::Call:
            return n->func && n->func->is(NodeKind::Attribute) &&
                   n->func->name == "format";
        default:
            return false;
    }
}

bool anyCallInExpression(const Node *n, bool (*pred)(const Node &call)) {
    if (!n || n->isScope())
        return false;
    if (n->is(NodeKind::Call) && pred(*n))
        return true;
    std::vector<const Node *> kids;
    python::childrenOf(*n, kids);
    return std::any_of(kids.begin(), kids.end(), [pred](const Node *k) {
        return anyCallInExpression(k, pred);
    });
}

void collectNames(const Node *n, std::vector<std::string> &out) {
    if (!n)
        return;
    if (n->is(NodeKind::Name))
        out.push_back(n->name);
    std::vector<const Node *> kids;
    python::childrenOf(*n, kids);
    for (const auto *k : kids)
        collectNames(k, out);
}

namespace {

void returnsIn(const Node *n, std::vector<const Node *> &out) {
    if (!n || n->isScope())
        return;
    if (n->is(NodeKind::Return))
        out.push_back(n);
    std::vector<const Node *> kids;
    python::childrenOf(*n, kids);
    for (const auto *k : kids)
        returnsIn(k, out);
}

} // anonymous namespace

void collectReturns(const Node &fn, std::vector<const Node *> &out) {
    for (const auto *stmt : fn.body)
        returnsIn(stmt, out);
}

std::string targetName(const Node *target) {
    if (!target)
        return {};
    if (target->is(NodeKind::Name) || target->is(NodeKind::Attribute))
        return target->name;
    return {};
}

std::string lower(std::string_view s) {
    return llvm::StringRef(s.data(), s.size()).lower();
}

std::string plural(unsigned n, const char *noun) {
    return std::to_string(n) + " " + noun + (n == 1 ? "" : "s");
}

// Splits `a < b < c` into its pairwise comparisons.
std::vector<Comparison> comparisons(const Node &cmp) {
    std::vector<Comparison> pairs;
    const Node *lhs = cmp.left;
    for (size_t i = 0; i < cmp.identifiers.size() && i < cmp.elts.size(); ++i) {
        pairs.push_back({lhs, cmp.identifiers[i], cmp.elts[i]});
        lhs = cmp.elts[i];
    }
    return pairs;
}

bool isEquality(std::string_view op) { return op == "==" || op == "!="; }

// Name an alias binds in the importing scope.
std::string boundName(const Node &import, const Node &alias) {
    if (!alias.asName.empty())
        return alias.asName;
    if (import.is(NodeKind::ImportFrom))
        return alias.name;
    return alias.name.substr(0, alias.name.find('.'));
}

bool isModuleLevel(const TraversalContext &ctx) {
    return ctx.frames().back().kind == FrameKind::Module;
}

// Loop frames only: comprehensions cannot hold statements.
bool insideStatementLoop(const TraversalContext &ctx) {
    auto loops = ctx.loopsInScope();
    return std::any_of(loops.begin(), loops.end(), [](const Frame *f) {
        return f->kind == FrameKind::Loop;
    });
}

bool containsAny(const std::string &haystack, llvm::ArrayRef<std::string_view> needles) {
    for (auto needle : needles) {
        if (haystack.find(needle) != std::string::npos)
            return true;
    }
    return false;
}

} // namespace pyhazard::rules
