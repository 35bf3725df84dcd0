#include "RuleSupport.h"

namespace pyhazard::rules {

namespace {

bool isTypeCall(const Node *n) {
    return isCallNamed(n, {"type"}) && n->elts.size() == 1;
}

} // anonymous namespace

class G003_TypeComparison : public Rule {
public:
    std::string_view getID() const override { return "type-comparison"; }
    std::string_view getCode() const override { return "G003"; }
    std::string_view getTitle() const override { return "Comparison of type()"; }
    Category getCategory() const override { return Category::Gotcha; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Compare}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        for (const auto &c : comparisons(n)) {
            if (!isEquality(c.op) && c.op != "is" && c.op != "is not")
                continue;
            if (!isTypeCall(c.lhs) && !isTypeCall(c.rhs))
                continue;
            out.push_back(ctx.makeFinding(
                *this, n, "type() comparison ignores subclasses",
                "Use isinstance(obj, cls)"));
            return;
        }
    }
};

PYHAZARD_REGISTER_RULE(G003_TypeComparison)

} // namespace pyhazard::rules
