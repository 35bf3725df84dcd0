#include "RuleSupport.h"

namespace pyhazard::rules {

class G008_AssertOnTuple : public Rule {
public:
    std::string_view getID() const override { return "assert-on-tuple"; }
    std::string_view getCode() const override { return "G008"; }
    std::string_view getTitle() const override { return "assert on a tuple"; }
    Category getCategory() const override { return Category::Gotcha; }
    Severity getBaseSeverity() const override { return Severity::High; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Assert}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (!n.test || !n.test->is(NodeKind::Tuple) || n.test->elts.empty())
            return;
        out.push_back(ctx.makeFinding(
            *this, n, "assert on a non-empty tuple always passes",
            "Write 'assert condition, \"message\"' without parentheses"));
    }
};

PYHAZARD_REGISTER_RULE(G008_AssertOnTuple)

} // namespace pyhazard::rules
