#include "RuleSupport.h"

namespace pyhazard::rules {

class C010_LongFunction : public Rule {
public:
    std::string_view getID() const override { return "long-function"; }
    std::string_view getCode() const override { return "C010"; }
    std::string_view getTitle() const override { return "Long function"; }
    Category getCategory() const override { return Category::Complexity; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::FunctionDef, NodeKind::AsyncFunctionDef};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (n.endLine < n.line)
            return;
        unsigned length = n.endLine - n.line + 1;
        unsigned limit = ctx.config().maxFunctionLines;
        if (length <= limit)
            return;
        out.push_back(ctx.makeFinding(
            *this, n,
            "Function '" + n.name + "' spans " + plural(length, "line") +
                " (limit " + std::to_string(limit) + ")",
            "Extract cohesive steps into well-named helper functions"));
    }
};

PYHAZARD_REGISTER_RULE(C010_LongFunction)

} // namespace pyhazard::rules
