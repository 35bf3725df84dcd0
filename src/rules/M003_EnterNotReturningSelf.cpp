#include "RuleSupport.h"

namespace pyhazard::rules {

namespace {

// Stub bodies: docstring, pass, ... or a bare raise.
bool isStubBody(const Node &fn) {
    for (const auto *stmt : fn.body) {
        if (stmt->is(NodeKind::Pass) || stmt->is(NodeKind::Raise))
            continue;
        if (stmt->is(NodeKind::ExprStmt) &&
            (isConstant(stmt->value, ConstantKind::Str) ||
             isConstant(stmt->value, ConstantKind::Ellipsis)))
            continue;
        return false;
    }
    return true;
}

} // anonymous namespace

class M003_EnterNotReturningSelf : public Rule {
public:
    std::string_view getID() const override { return "enter-not-returning-self"; }
    std::string_view getCode() const override { return "M003"; }
    std::string_view getTitle() const override { return "__enter__ returns nothing"; }
    Category getCategory() const override { return Category::Resource; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::FunctionDef, NodeKind::AsyncFunctionDef};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (n.name != "__enter__" && n.name != "__aenter__")
            return;
        if (ctx.frames().back().kind != FrameKind::Class || isStubBody(n))
            return;
        std::vector<const Node *> returns;
        collectReturns(n, returns);
        for (const auto *r : returns) {
            if (r->value && !isNoneLiteral(r->value))
                return;
        }
        out.push_back(ctx.makeFinding(
            *this, n,
            n.name + " returns None, so 'with ... as x' binds None",
            "Return self, or the resource the block should use"));
    }
};

PYHAZARD_REGISTER_RULE(M003_EnterNotReturningSelf)

} // namespace pyhazard::rules
