#include "RuleSupport.h"

namespace pyhazard::rules {

class M001_OpenWithoutContextManager : public Rule {
public:
    std::string_view getID() const override { return "open-without-context-manager"; }
    std::string_view getCode() const override { return "M001"; }
    std::string_view getTitle() const override { return "File opened without with"; }
    Category getCategory() const override { return Category::Resource; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Call}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (!isCallNamed(&n, {"open"}) &&
            !isCallDotted(&n, {"io.open", "codecs.open"}))
            return;
        if (ctx.insideWithItem())
            return;
        // Returned handles are owned by the caller.
        const Node *parent = ctx.ancestor();
        if (parent && parent->is(NodeKind::Return))
            return;
        out.push_back(ctx.makeFinding(
            *this, n, "File handle is not closed if an exception is raised",
            "Open it in a with statement: 'with open(...) as f:'"));
    }
};

PYHAZARD_REGISTER_RULE(M001_OpenWithoutContextManager)

} // namespace pyhazard::rules
