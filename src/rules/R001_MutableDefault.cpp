#include "RuleSupport.h"

namespace pyhazard::rules {

class R001_MutableDefault : public Rule {
public:
    std::string_view getID() const override { return "mutable-default"; }
    std::string_view getCode() const override { return "R001"; }
    std::string_view getTitle() const override { return "Mutable default argument"; }
    Category getCategory() const override { return Category::Runtime; }
    Severity getBaseSeverity() const override { return Severity::High; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::FunctionDef, NodeKind::AsyncFunctionDef, NodeKind::Lambda};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (!n.args)
            return;
        for (const auto *arg : n.args->elts) {
            if (!isMutableValue(arg->value))
                continue;
            out.push_back(ctx.makeFinding(
                *this, *arg->value,
                "Mutable default argument '" + arg->name +
                    "' is shared between calls",
                "Default to None and create the object inside the function"));
            return;
        }
    }
};

PYHAZARD_REGISTER_RULE(R001_MutableDefault)

} // namespace pyhazard::rules
