#include "RuleSupport.h"

namespace pyhazard::rules {

class R007_ControlFlowInFinally : public Rule {
public:
    std::string_view getID() const override { return "control-flow-in-finally"; }
    std::string_view getCode() const override { return "R007"; }
    std::string_view getTitle() const override { return "return/break/continue in finally"; }
    Category getCategory() const override { return Category::Runtime; }
    Severity getBaseSeverity() const override { return Severity::High; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::Return, NodeKind::Break, NodeKind::Continue};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (!ctx.insideFinally())
            return;
        // A loop opened inside the finally block owns break/continue.
        if (!n.is(NodeKind::Return)) {
            const auto &frames = ctx.frames();
            for (auto it = frames.rbegin(); it->kind != FrameKind::Finally; ++it) {
                if (it->kind == FrameKind::Loop)
                    return;
            }
        }
        std::string stmt(python::nodeKindName(n.kind));
        out.push_back(ctx.makeFinding(
            *this, n,
            llvm::StringRef(stmt).lower() +
                " inside finally silently discards any in-flight exception",
            "Move the control flow out of the finally block"));
    }
};

PYHAZARD_REGISTER_RULE(R007_ControlFlowInFinally)

} // namespace pyhazard::rules
