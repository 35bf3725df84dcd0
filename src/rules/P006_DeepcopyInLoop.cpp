#include "RuleSupport.h"

namespace pyhazard::rules {

class P006_DeepcopyInLoop : public Rule {
public:
    std::string_view getID() const override { return "deepcopy-in-loop"; }
    std::string_view getCode() const override { return "P006"; }
    std::string_view getTitle() const override { return "deepcopy inside a loop"; }
    Category getCategory() const override { return Category::Performance; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Call}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (!(isCallNamed(&n, {"deepcopy"}) || isCallDotted(&n, {"copy.deepcopy"})))
            return;
        if (!ctx.insideLoop())
            return;
        out.push_back(ctx.makeFinding(
            *this, n, "copy.deepcopy() runs on every iteration",
            "Copy once outside the loop, or copy only the fields that change"));
    }
};

PYHAZARD_REGISTER_RULE(P006_DeepcopyInLoop)

} // namespace pyhazard::rules
