#include "RuleSupport.h"

namespace pyhazard::rules {

class R005_GlobalStatement : public Rule {
public:
    std::string_view getID() const override { return "global-statement"; }
    std::string_view getCode() const override { return "R005"; }
    std::string_view getTitle() const override { return "global statement"; }
    Category getCategory() const override { return Category::Runtime; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Global}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (!ctx.insideFunction())
            return;
        std::string names;
        for (const auto &id : n.identifiers)
            names += (names.empty() ? "" : ", ") + id;
        out.push_back(ctx.makeFinding(
            *this, n, "Function mutates module state through 'global " + names + "'",
            "Pass the value in and return the result, or wrap state in a class"));
    }
};

PYHAZARD_REGISTER_RULE(R005_GlobalStatement)

} // namespace pyhazard::rules
