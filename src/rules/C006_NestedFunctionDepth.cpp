#include "RuleSupport.h"

namespace pyhazard::rules {

class C006_NestedFunctionDepth : public Rule {
public:
    std::string_view getID() const override { return "nested-function-depth"; }
    std::string_view getCode() const override { return "C006"; }
    std::string_view getTitle() const override { return "Deeply nested function"; }
    Category getCategory() const override { return Category::Complexity; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::FunctionDef, NodeKind::AsyncFunctionDef};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        unsigned depth = ctx.functionDepth();
        unsigned limit = ctx.config().maxFunctionNesting;
        if (depth < limit)
            return;
        out.push_back(ctx.makeFinding(
            *this, n,
            "Function '" + n.name + "' is nested inside " +
                plural(depth, "function"),
            "Move the inner function to module level or into a class"));
    }
};

PYHAZARD_REGISTER_RULE(C006_NestedFunctionDepth)

} // namespace pyhazard::rules
