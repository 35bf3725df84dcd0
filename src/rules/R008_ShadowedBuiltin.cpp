#include "RuleSupport.h"

namespace pyhazard::rules {

namespace {

constexpr std::string_view kBuiltins[] = {
    "abs", "all", "any", "bin", "bool", "bytes", "callable", "chr", "dict",
    "dir", "divmod", "enumerate", "filter", "float", "format", "frozenset",
    "getattr", "hash", "help", "hex", "id", "input", "int", "isinstance",
    "iter", "len", "list", "map", "max", "min", "next", "object", "oct",
    "open", "ord", "pow", "print", "range", "repr", "reversed", "round",
    "set", "setattr", "slice", "sorted", "str", "sum", "super", "tuple",
    "type", "vars", "zip",
};

} // anonymous namespace

class R008_ShadowedBuiltin : public Rule {
public:
    std::string_view getID() const override { return "shadowed-builtin"; }
    std::string_view getCode() const override { return "R008"; }
    std::string_view getTitle() const override { return "Builtin name shadowed"; }
    Category getCategory() const override { return Category::Runtime; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::FunctionDef, NodeKind::AsyncFunctionDef,
                NodeKind::ClassDef, NodeKind::Assign};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        std::vector<std::string> shadowed;
        if (n.is(NodeKind::Assign)) {
            // Class bodies define attributes, not variables.
            if (ctx.frames().back().kind == FrameKind::Class)
                return;
            for (const auto *t : n.targets) {
                if (t->is(NodeKind::Name) && oneOf(t->name, kBuiltins))
                    shadowed.push_back(t->name);
            }
        } else {
            bool method = ctx.frames().back().kind == FrameKind::Class;
            if (!method && oneOf(n.name, kBuiltins))
                shadowed.push_back(n.name);
            if (n.args) {
                for (const auto *arg : n.args->elts) {
                    if (oneOf(arg->name, kBuiltins))
                        shadowed.push_back(arg->name);
                }
            }
        }
        if (shadowed.empty())
            return;

        std::string names;
        for (const auto &s : shadowed)
            names += (names.empty() ? "'" : ", '") + s + "'";
        out.push_back(ctx.makeFinding(
            *this, n, "Shadows builtin " + names,
            "Rename it, e.g. 'items' instead of 'list' or 'item_id' instead of 'id'"));
    }
};

PYHAZARD_REGISTER_RULE(R008_ShadowedBuiltin)

} // namespace pyhazard::rules
