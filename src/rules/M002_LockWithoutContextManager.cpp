#include "RuleSupport.h"

namespace pyhazard::rules {

class M002_LockWithoutContextManager : public Rule {
public:
    std::string_view getID() const override { return "lock-without-context-manager"; }
    std::string_view getCode() const override { return "M002"; }
    std::string_view getTitle() const override { return "Lock acquired without with"; }
    Category getCategory() const override { return Category::Resource; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Call}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (!n.func || !n.func->is(NodeKind::Attribute) || n.func->name != "acquire")
            return;
        std::string receiver = lower(targetName(n.func->value));
        if (receiver.find("lock") == std::string::npos &&
            receiver.find("mutex") == std::string::npos &&
            receiver.find("sem") == std::string::npos)
            return;
        if (ctx.insideWithItem())
            return;
        out.push_back(ctx.makeFinding(
            *this, n,
            "'" + targetName(n.func->value) +
                "' is acquired manually and stays held if an exception is raised",
            "Use 'with " + targetName(n.func->value) + ":' to release it reliably"));
    }
};

PYHAZARD_REGISTER_RULE(M002_LockWithoutContextManager)

} // namespace pyhazard::rules
