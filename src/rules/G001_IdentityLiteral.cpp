#include "RuleSupport.h"

namespace pyhazard::rules {

class G001_IdentityLiteral : public Rule {
public:
    std::string_view getID() const override { return "identity-literal"; }
    std::string_view getCode() const override { return "G001"; }
    std::string_view getTitle() const override { return "Identity comparison with literal"; }
    Category getCategory() const override { return Category::Gotcha; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Compare}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        for (const auto &c : comparisons(n)) {
            if (c.op != "is" && c.op != "is not")
                continue;
            if (!isValueLiteral(c.lhs) && !isValueLiteral(c.rhs))
                continue;
            out.push_back(ctx.makeFinding(
                *this, n,
                "'" + std::string(c.op) + "' compares object identity, which is "
                "unreliable for literals",
                std::string("Use '") + (c.op == "is" ? "==" : "!=") +
                    "' to compare values"));
            return;
        }
    }
};

PYHAZARD_REGISTER_RULE(G001_IdentityLiteral)

} // namespace pyhazard::rules
