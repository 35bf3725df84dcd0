#include "RuleSupport.h"

namespace pyhazard::rules {

class G006_EqualityBool : public Rule {
public:
    std::string_view getID() const override { return "equality-bool"; }
    std::string_view getCode() const override { return "G006"; }
    std::string_view getTitle() const override { return "Equality comparison with bool"; }
    Category getCategory() const override { return Category::Gotcha; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Compare}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        for (const auto &c : comparisons(n)) {
            if (!isEquality(c.op) || !(isBoolLiteral(c.lhs) || isBoolLiteral(c.rhs)))
                continue;
            out.push_back(ctx.makeFinding(
                *this, n,
                "Comparison to a bool literal with '" + std::string(c.op) + "'",
                "Test truthiness directly: 'if flag:' or 'if not flag:'"));
            return;
        }
    }
};

PYHAZARD_REGISTER_RULE(G006_EqualityBool)

} // namespace pyhazard::rules
