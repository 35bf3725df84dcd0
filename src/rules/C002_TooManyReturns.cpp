#include "RuleSupport.h"

namespace pyhazard::rules {

class C002_TooManyReturns : public Rule {
public:
    std::string_view getID() const override { return "too-many-returns"; }
    std::string_view getCode() const override { return "C002"; }
    std::string_view getTitle() const override { return "Too many return statements"; }
    Category getCategory() const override { return Category::Complexity; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::FunctionDef, NodeKind::AsyncFunctionDef};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        unsigned limit = ctx.config().maxReturns;
        if (n.facts.returns <= limit)
            return;
        out.push_back(ctx.makeFinding(
            *this, n,
            "Function '" + n.name + "' has " +
                plural(n.facts.returns, "return statement") + " (limit " +
                std::to_string(limit) + ")",
            "Compute the result in one place, or split the function"));
    }
};

PYHAZARD_REGISTER_RULE(C002_TooManyReturns)

} // namespace pyhazard::rules
