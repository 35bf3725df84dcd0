#include "RuleSupport.h"

namespace pyhazard::rules {

class C001_DeepNesting : public Rule {
public:
    std::string_view getID() const override { return "deep-nesting"; }
    std::string_view getCode() const override { return "C001"; }
    std::string_view getTitle() const override { return "Deeply nested block"; }
    Category getCategory() const override { return Category::Complexity; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::If,   NodeKind::For,       NodeKind::AsyncFor,
                NodeKind::While, NodeKind::With,     NodeKind::AsyncWith,
                NodeKind::Try,  NodeKind::Match};
    }

    // Reported once, at the first block past the limit; deeper blocks in
    // the same chain would only repeat the finding.
    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (n.isElif)
            return;
        unsigned level = ctx.blockDepth() + 1;
        unsigned limit = ctx.config().maxNestingDepth;
        if (level != limit + 1)
            return;
        out.push_back(ctx.makeFinding(
            *this, n,
            "Block nested " + std::to_string(level) + " levels deep (limit " +
                std::to_string(limit) + ")",
            "Return early with guard clauses or extract the inner block into "
            "a function"));
    }
};

PYHAZARD_REGISTER_RULE(C001_DeepNesting)

} // namespace pyhazard::rules
