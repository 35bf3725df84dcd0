#include "RuleSupport.h"

namespace pyhazard::rules {

class O003_WildcardImport : public Rule {
public:
    std::string_view getID() const override { return "wildcard-import"; }
    std::string_view getCode() const override { return "O003"; }
    std::string_view getTitle() const override { return "Wildcard import"; }
    Category getCategory() const override { return Category::Organization; }
    Severity getBaseSeverity() const override { return Severity::High; }

    std::vector<NodeKind> interests() const override { return {NodeKind::ImportFrom}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (n.names.size() != 1 || n.names.front()->name != "*")
            return;
        std::string module = std::string(n.level, '.') + n.name;
        out.push_back(ctx.makeFinding(
            *this, n,
            "'from " + module + " import *' hides where names come from and "
            "may shadow local definitions",
            "Import the names you use explicitly, or import the module itself"));
    }
};

PYHAZARD_REGISTER_RULE(O003_WildcardImport)

} // namespace pyhazard::rules
