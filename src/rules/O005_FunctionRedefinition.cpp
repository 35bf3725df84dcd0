#include "RuleSupport.h"

namespace pyhazard::rules {

namespace {

// Decorators that legitimately define one name more than once.
bool allowsRedefinition(const Node &def) {
    for (const auto *d : def.decorators) {
        const Node *target = d->is(NodeKind::Call) ? d->func : d;
        std::string name = targetName(target);
        if (oneOf(name, {"overload", "setter", "getter", "deleter", "register"}))
            return true;
    }
    return false;
}

bool definesName(const Node &stmt) {
    return stmt.isFunction() || stmt.is(NodeKind::ClassDef);
}

} // anonymous namespace

class O005_FunctionRedefinition : public Rule {
public:
    std::string_view getID() const override { return "function-redefinition"; }
    std::string_view getCode() const override { return "O005"; }
    std::string_view getTitle() const override { return "Redefined function or class"; }
    Category getCategory() const override { return Category::Organization; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::FunctionDef, NodeKind::AsyncFunctionDef, NodeKind::ClassDef};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        // Definitions under if/try are usually deliberate alternatives.
        const Frame &top = ctx.frames().back();
        if (!isScopeFrame(top.kind) || allowsRedefinition(n))
            return;
        for (const auto *stmt : top.node->body) {
            if (stmt == &n)
                return;
            if (!definesName(*stmt) || stmt->name != n.name || allowsRedefinition(*stmt))
                continue;
            out.push_back(ctx.makeFinding(
                *this, n,
                "'" + n.name + "' redefines the definition on line " +
                    std::to_string(stmt->line),
                "Rename one of them or delete the stale definition"));
            return;
        }
    }
};

PYHAZARD_REGISTER_RULE(O005_FunctionRedefinition)

} // namespace pyhazard::rules
