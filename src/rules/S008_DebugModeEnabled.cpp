#include "RuleSupport.h"

namespace pyhazard::rules {

class S008_DebugModeEnabled : public Rule {
public:
    std::string_view getID() const override { return "debug-mode-enabled"; }
    std::string_view getCode() const override { return "S008"; }
    std::string_view getTitle() const override { return "Debug mode enabled"; }
    Category getCategory() const override { return Category::Security; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::Call, NodeKind::Assign};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (n.is(NodeKind::Call)) {
            if (python::calleeName(n) != "run" ||
                !isConstant(keywordArg(n, "debug"), ConstantKind::True))
                return;
        } else {
            if (ctx.frames().back().kind != FrameKind::Module ||
                n.targets.size() != 1 || targetName(n.targets.front()) != "DEBUG" ||
                !isConstant(n.value, ConstantKind::True))
                return;
        }
        out.push_back(ctx.makeFinding(
            *this, n, "Debug mode exposes tracebacks and interactive debuggers",
            "Read the debug flag from the environment and default it to off"));
    }
};

PYHAZARD_REGISTER_RULE(S008_DebugModeEnabled)

} // namespace pyhazard::rules
