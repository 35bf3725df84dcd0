#include "RuleSupport.h"

namespace pyhazard::rules {

class P008_UnnecessaryListComprehension : public Rule {
public:
    std::string_view getID() const override { return "unnecessary-list-comprehension"; }
    std::string_view getCode() const override { return "P008"; }
    std::string_view getTitle() const override { return "List comprehension passed to a reducer"; }
    Category getCategory() const override { return Category::Performance; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Call}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (!isCallNamed(&n, {"sum", "any", "all", "min", "max", "set",
                              "tuple", "frozenset", "list"}))
            return;
        if (n.elts.size() != 1 || !n.elts.front()->is(NodeKind::ListComp))
            return;
        out.push_back(ctx.makeFinding(
            *this, n,
            "List comprehension inside " + n.func->name +
                "() materializes a temporary list",
            "Pass a generator expression instead: " + n.func->name + "(x for x in ...)"));
    }
};

PYHAZARD_REGISTER_RULE(P008_UnnecessaryListComprehension)

} // namespace pyhazard::rules
