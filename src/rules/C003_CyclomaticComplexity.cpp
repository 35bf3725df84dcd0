#include "RuleSupport.h"

namespace pyhazard::rules {

class C003_CyclomaticComplexity : public Rule {
public:
    std::string_view getID() const override { return "cyclomatic-complexity"; }
    std::string_view getCode() const override { return "C003"; }
    std::string_view getTitle() const override { return "High cyclomatic complexity"; }
    Category getCategory() const override { return Category::Complexity; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::FunctionDef, NodeKind::AsyncFunctionDef};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        unsigned complexity = 1 + n.facts.branches;
        unsigned limit = ctx.config().complexityThreshold;
        if (complexity <= limit)
            return;
        out.push_back(ctx.makeFinding(
            *this, n,
            "Function '" + n.name + "' has cyclomatic complexity " +
                std::to_string(complexity) + " (limit " +
                std::to_string(limit) + ")",
            "Split the function into smaller helpers or replace branching "
            "with a lookup table"));
    }
};

PYHAZARD_REGISTER_RULE(C003_CyclomaticComplexity)

} // namespace pyhazard::rules
