#include "RuleSupport.h"

namespace pyhazard::rules {

class O002_MultipleImportsPerLine : public Rule {
public:
    std::string_view getID() const override { return "multiple-imports-per-line"; }
    std::string_view getCode() const override { return "O002"; }
    std::string_view getTitle() const override { return "Multiple modules in one import"; }
    Category getCategory() const override { return Category::Organization; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Import}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (n.names.size() < 2)
            return;
        out.push_back(ctx.makeFinding(
            *this, n,
            "One import statement pulls in " + std::to_string(n.names.size()) +
                " modules",
            "Import one module per line"));
    }
};

PYHAZARD_REGISTER_RULE(O002_MultipleImportsPerLine)

} // namespace pyhazard::rules
