#include "RuleSupport.h"

namespace pyhazard::rules {

class R004_AssertInProduction : public Rule {
public:
    std::string_view getID() const override { return "assert-in-production"; }
    std::string_view getCode() const override { return "R004"; }
    std::string_view getTitle() const override { return "assert used for validation"; }
    Category getCategory() const override { return Category::Runtime; }
    Severity getBaseSeverity() const override { return Severity::High; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Assert}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (ctx.isTestFile())
            return;
        out.push_back(ctx.makeFinding(
            *this, n, "assert statements are removed when running with -O",
            "Raise an explicit exception such as ValueError instead"));
    }
};

PYHAZARD_REGISTER_RULE(R004_AssertInProduction)

} // namespace pyhazard::rules
