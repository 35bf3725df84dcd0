#include "RuleSupport.h"

namespace pyhazard::rules {

class R010_RaiseWithoutFrom : public Rule {
public:
    std::string_view getID() const override { return "raise-without-from"; }
    std::string_view getCode() const override { return "R010"; }
    std::string_view getTitle() const override { return "raise in except without from"; }
    Category getCategory() const override { return Category::Runtime; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Raise}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (!n.value || n.cause)
            return;
        const Node *handler = nullptr;
        const auto &frames = ctx.frames();
        for (auto it = frames.rbegin(); it != frames.rend(); ++it) {
            if (isScopeFrame(it->kind))
                break;
            if (it->kind == FrameKind::Handler) {
                handler = it->node;
                break;
            }
        }
        if (!handler)
            return;
        // Re-raising the caught exception keeps its traceback.
        if (n.value->is(NodeKind::Name) && n.value->name == handler->name)
            return;
        out.push_back(ctx.makeFinding(
            *this, n, "Exception raised in an except block loses its cause",
            "Use 'raise NewError(...) from err' to chain the original exception"));
    }
};

PYHAZARD_REGISTER_RULE(R010_RaiseWithoutFrom)

} // namespace pyhazard::rules
