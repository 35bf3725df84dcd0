#include "RuleSupport.h"

namespace pyhazard::rules {

class P002_ListMembershipTest : public Rule {
public:
    std::string_view getID() const override { return "list-membership-test"; }
    std::string_view getCode() const override { return "P002"; }
    std::string_view getTitle() const override { return "Membership test against a list"; }
    Category getCategory() const override { return Category::Performance; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Compare}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        for (size_t i = 0; i < n.identifiers.size() && i < n.elts.size(); ++i) {
            if (n.identifiers[i] != "in" && n.identifiers[i] != "not in")
                continue;
            const Node *rhs = n.elts[i];
            bool linear = (rhs->is(NodeKind::List) && rhs->elts.size() >= 3) ||
                          rhs->is(NodeKind::ListComp);
            if (!linear)
                continue;
            out.push_back(ctx.makeFinding(
                *this, n, "Membership test scans a list in linear time",
                "Use a set literal or a precomputed set for constant-time lookup"));
            return;
        }
    }
};

PYHAZARD_REGISTER_RULE(P002_ListMembershipTest)

} // namespace pyhazard::rules
