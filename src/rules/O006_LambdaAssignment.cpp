#include "RuleSupport.h"

namespace pyhazard::rules {

class O006_LambdaAssignment : public Rule {
public:
    std::string_view getID() const override { return "lambda-assignment"; }
    std::string_view getCode() const override { return "O006"; }
    std::string_view getTitle() const override { return "Lambda assigned to a name"; }
    Category getCategory() const override { return Category::Organization; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Assign}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (n.targets.size() != 1 || !n.targets.front()->is(NodeKind::Name) ||
            !n.value || !n.value->is(NodeKind::Lambda))
            return;
        const std::string &name = n.targets.front()->name;
        out.push_back(ctx.makeFinding(
            *this, n, "Lambda bound to '" + name + "' loses its name in tracebacks",
            "Define it with 'def " + name + "(...):' instead"));
    }
};

PYHAZARD_REGISTER_RULE(O006_LambdaAssignment)

} // namespace pyhazard::rules
