#include "RuleSupport.h"

namespace pyhazard::rules {

class P004_DictKeysIteration : public Rule {
public:
    std::string_view getID() const override { return "dict-keys-iteration"; }
    std::string_view getCode() const override { return "P004"; }
    std::string_view getTitle() const override { return "Iterating over dict.keys()"; }
    Category getCategory() const override { return Category::Performance; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::For, NodeKind::AsyncFor, NodeKind::Comprehension};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        const Node *it = n.iter;
        if (!it || !it->is(NodeKind::Call) || !it->elts.empty() ||
            !it->keywords.empty() || !it->func ||
            !it->func->is(NodeKind::Attribute) || it->func->name != "keys")
            return;
        out.push_back(ctx.makeFinding(
            *this, n, "Iterating over .keys() builds an unnecessary view",
            "Iterate over the dict directly, or use .items() when values are needed"));
    }
};

PYHAZARD_REGISTER_RULE(P004_DictKeysIteration)

} // namespace pyhazard::rules
