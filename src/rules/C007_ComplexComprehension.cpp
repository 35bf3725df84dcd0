#include "RuleSupport.h"

namespace pyhazard::rules {

class C007_ComplexComprehension : public Rule {
public:
    std::string_view getID() const override { return "complex-comprehension"; }
    std::string_view getCode() const override { return "C007"; }
    std::string_view getTitle() const override { return "Complex comprehension"; }
    Category getCategory() const override { return Category::Complexity; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::ListComp, NodeKind::SetComp, NodeKind::DictComp,
                NodeKind::GeneratorExp};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        size_t loops = n.generators.size();
        size_t conditions = 0;
        for (const auto *g : n.generators)
            conditions += g->elts.size();
        if (loops <= 2 && loops + conditions <= 3)
            return;
        out.push_back(ctx.makeFinding(
            *this, n,
            "Comprehension combines " + plural(unsigned(loops), "loop") +
                " and " + plural(unsigned(conditions), "condition"),
            "Rewrite it as an explicit loop or split it into steps"));
    }
};

PYHAZARD_REGISTER_RULE(C007_ComplexComprehension)

} // namespace pyhazard::rules
