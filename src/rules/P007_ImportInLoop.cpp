#include "RuleSupport.h"

namespace pyhazard::rules {

class P007_ImportInLoop : public Rule {
public:
    std::string_view getID() const override { return "import-in-loop"; }
    std::string_view getCode() const override { return "P007"; }
    std::string_view getTitle() const override { return "import inside a loop"; }
    Category getCategory() const override { return Category::Performance; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::Import, NodeKind::ImportFrom};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (!insideStatementLoop(ctx))
            return;
        out.push_back(ctx.makeFinding(
            *this, n, "import statement executes on every iteration",
            "Move the import to the top of the module"));
    }
};

PYHAZARD_REGISTER_RULE(P007_ImportInLoop)

} // namespace pyhazard::rules
