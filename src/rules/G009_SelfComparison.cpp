#include "RuleSupport.h"

namespace pyhazard::rules {

class G009_SelfComparison : public Rule {
public:
    std::string_view getID() const override { return "self-comparison"; }
    std::string_view getCode() const override { return "G009"; }
    std::string_view getTitle() const override { return "Value compared with itself"; }
    Category getCategory() const override { return Category::Gotcha; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Compare}; }

    // `x != x` is the portable NaN test and is left alone.
    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        for (const auto &c : comparisons(n)) {
            if (c.op == "!=")
                continue;
            std::string lhs = python::dottedName(c.lhs);
            if (lhs.empty() || lhs != python::dottedName(c.rhs))
                continue;
            out.push_back(ctx.makeFinding(
                *this, n, "'" + lhs + "' is compared with itself",
                "Compare against the intended value; use math.isnan() for NaN "
                "checks"));
            return;
        }
    }
};

PYHAZARD_REGISTER_RULE(G009_SelfComparison)

} // namespace pyhazard::rules
