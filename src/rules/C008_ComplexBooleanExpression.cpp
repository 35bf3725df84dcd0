#include "RuleSupport.h"

namespace pyhazard::rules {

namespace {

unsigned boolOperandCount(const Node *n) {
    if (!n)
        return 0;
    if (!n->is(NodeKind::BoolOp))
        return 1;
    unsigned count = 0;
    for (const auto *e : n->elts)
        count += boolOperandCount(e);
    return count;
}

} // anonymous namespace

class C008_ComplexBooleanExpression : public Rule {
public:
    std::string_view getID() const override { return "complex-boolean-expression"; }
    std::string_view getCode() const override { return "C008"; }
    std::string_view getTitle() const override { return "Complex boolean expression"; }
    Category getCategory() const override { return Category::Complexity; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override { return {NodeKind::BoolOp}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        // Only the outermost operator of a chain.
        const Node *parent = ctx.ancestor();
        if (parent && parent->is(NodeKind::BoolOp))
            return;
        unsigned operands = boolOperandCount(&n);
        unsigned limit = ctx.config().maxBoolOperands;
        if (operands <= limit)
            return;
        out.push_back(ctx.makeFinding(
            *this, n,
            "Boolean expression has " + plural(operands, "operand") +
                " (limit " + std::to_string(limit) + ")",
            "Name the sub-conditions with intermediate variables or a helper "
            "predicate"));
    }
};

PYHAZARD_REGISTER_RULE(C008_ComplexBooleanExpression)

} // namespace pyhazard::rules
