#include "RuleSupport.h"

namespace pyhazard::rules {

class R002_DangerousEval : public Rule {
public:
    std::string_view getID() const override { return "dangerous-eval"; }
    std::string_view getCode() const override { return "R002"; }
    std::string_view getTitle() const override { return "eval/exec usage"; }
    Category getCategory() const override { return Category::Runtime; }
    Severity getBaseSeverity() const override { return Severity::High; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Call}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (!isCallNamed(&n, {"eval", "exec"}))
            return;
        out.push_back(ctx.makeFinding(
            *this, n, "Use of " + n.func->name + "() executes arbitrary code",
            "Use ast.literal_eval for data, or a dispatch table for behavior"));
    }
};

PYHAZARD_REGISTER_RULE(R002_DangerousEval)

} // namespace pyhazard::rules
