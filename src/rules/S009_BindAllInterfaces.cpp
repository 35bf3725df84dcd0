#include "RuleSupport.h"

namespace pyhazard::rules {

class S009_BindAllInterfaces : public Rule {
public:
    std::string_view getID() const override { return "bind-all-interfaces"; }
    std::string_view getCode() const override { return "S009"; }
    std::string_view getTitle() const override { return "Binding to all interfaces"; }
    Category getCategory() const override { return Category::Security; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Constant}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (n.constant != ConstantKind::Str || n.text != "0.0.0.0")
            return;
        const Node *parent = ctx.ancestor();
        if (!parent ||
            !(parent->is(NodeKind::Call) || parent->is(NodeKind::Keyword) ||
              parent->is(NodeKind::Assign) || parent->is(NodeKind::Tuple)))
            return;
        out.push_back(ctx.makeFinding(
            *this, n, "Service listens on every network interface",
            "Bind to 127.0.0.1 unless external access is intended, and make "
            "the host configurable"));
    }
};

PYHAZARD_REGISTER_RULE(S009_BindAllInterfaces)

} // namespace pyhazard::rules
