#include "RuleSupport.h"

namespace pyhazard::rules {

class P003_RangeLenLoop : public Rule {
public:
    std::string_view getID() const override { return "range-len-loop"; }
    std::string_view getCode() const override { return "P003"; }
    std::string_view getTitle() const override { return "range(len(...)) iteration"; }
    Category getCategory() const override { return Category::Performance; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::For, NodeKind::AsyncFor, NodeKind::Comprehension};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (!isCallNamed(n.iter, {"range"}) || n.iter->elts.size() != 1)
            return;
        if (!isCallNamed(n.iter->elts.front(), {"len"}))
            return;
        out.push_back(ctx.makeFinding(
            *this, n, "Iterating over range(len(...)) to index a sequence",
            "Iterate directly, or use enumerate() when the index is needed"));
    }
};

PYHAZARD_REGISTER_RULE(P003_RangeLenLoop)

} // namespace pyhazard::rules
