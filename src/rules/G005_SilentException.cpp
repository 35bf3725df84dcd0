#include "RuleSupport.h"

namespace pyhazard::rules {

class G005_SilentException : public Rule {
public:
    std::string_view getID() const override { return "silent-exception"; }
    std::string_view getCode() const override { return "G005"; }
    std::string_view getTitle() const override { return "Exception silently ignored"; }
    Category getCategory() const override { return Category::Gotcha; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::ExceptHandler};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (n.body.size() != 1)
            return;
        const Node *stmt = n.body.front();
        bool silent = stmt->is(NodeKind::Pass) ||
                      (stmt->is(NodeKind::ExprStmt) &&
                       isConstant(stmt->value, ConstantKind::Ellipsis));
        if (!silent)
            return;
        out.push_back(ctx.makeFinding(
            *this, n, "Exception is swallowed without any handling",
            "Log it, handle it, or use contextlib.suppress() to make the intent "
            "explicit"));
    }
};

PYHAZARD_REGISTER_RULE(G005_SilentException)

} // namespace pyhazard::rules
