#include "RuleSupport.h"

namespace pyhazard::rules {

class C009_GodClass : public Rule {
public:
    std::string_view getID() const override { return "god-class"; }
    std::string_view getCode() const override { return "C009"; }
    std::string_view getTitle() const override { return "Class with too many methods"; }
    Category getCategory() const override { return Category::Complexity; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override { return {NodeKind::ClassDef}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        unsigned methods = 0;
        for (const auto *stmt : n.body)
            methods += stmt->isFunction() ? 1 : 0;
        unsigned limit = ctx.config().maxMethods;
        if (methods <= limit)
            return;
        out.push_back(ctx.makeFinding(
            *this, n,
            "Class '" + n.name + "' defines " + plural(methods, "method") +
                " (limit " + std::to_string(limit) + ")",
            "Split responsibilities into smaller collaborating classes"));
    }
};

PYHAZARD_REGISTER_RULE(C009_GodClass)

} // namespace pyhazard::rules
