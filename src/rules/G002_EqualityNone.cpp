#include "RuleSupport.h"

namespace pyhazard::rules {

class G002_EqualityNone : public Rule {
public:
    std::string_view getID() const override { return "equality-none"; }
    std::string_view getCode() const override { return "G002"; }
    std::string_view getTitle() const override { return "Equality comparison with None"; }
    Category getCategory() const override { return Category::Gotcha; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Compare}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        for (const auto &c : comparisons(n)) {
            if (!isEquality(c.op) || !(isNoneLiteral(c.lhs) || isNoneLiteral(c.rhs)))
                continue;
            out.push_back(ctx.makeFinding(
                *this, n,
                "Comparison to None with '" + std::string(c.op) +
                    "' can be overridden by __eq__",
                std::string("Use '") + (c.op == "==" ? "is None" : "is not None") + "'"));
            return;
        }
    }
};

PYHAZARD_REGISTER_RULE(G002_EqualityNone)

} // namespace pyhazard::rules
