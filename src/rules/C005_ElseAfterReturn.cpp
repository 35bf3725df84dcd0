#include "RuleSupport.h"

namespace pyhazard::rules {

class C005_ElseAfterReturn : public Rule {
public:
    std::string_view getID() const override { return "else-after-return"; }
    std::string_view getCode() const override { return "C005"; }
    std::string_view getTitle() const override { return "Unnecessary else after return"; }
    Category getCategory() const override { return Category::Complexity; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override { return {NodeKind::If}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (n.body.empty() || n.orelse.empty())
            return;
        const Node *last = n.body.back();
        if (!last->is(NodeKind::Return) && !last->is(NodeKind::Raise))
            return;
        out.push_back(ctx.makeFinding(
            *this, n,
            std::string(n.orelse.front()->isElif ? "elif" : "else") + " after " +
                (last->is(NodeKind::Return) ? "return" : "raise") +
                " adds a needless level of nesting",
            "Drop the else and dedent its body"));
    }
};

PYHAZARD_REGISTER_RULE(C005_ElseAfterReturn)

} // namespace pyhazard::rules
