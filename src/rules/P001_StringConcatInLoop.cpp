#include "RuleSupport.h"

#include <algorithm>

namespace pyhazard::rules {

class P001_StringConcatInLoop : public Rule {
public:
    std::string_view getID() const override { return "string-concat-in-loop"; }
    std::string_view getCode() const override { return "P001"; }
    std::string_view getTitle() const override { return "String concatenation in loop"; }
    Category getCategory() const override { return Category::Performance; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override { return {NodeKind::AugAssign}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (n.op != "+" || !n.target || !n.target->is(NodeKind::Name))
            return;
        if (!insideStatementLoop(ctx))
            return;

        const auto &strings = ctx.enclosingScope().node->facts.stringNames;
        bool isString =
            std::find(strings.begin(), strings.end(), n.target->name) != strings.end() ||
            (n.value && n.value->isStringLiteral()) || isCallNamed(n.value, {"str"});
        if (!isString)
            return;
        out.push_back(ctx.makeFinding(
            *this, n,
            "String '" + n.target->name + "' is rebuilt on every iteration",
            "Collect the parts in a list and call ''.join(parts) after the loop"));
    }
};

PYHAZARD_REGISTER_RULE(P001_StringConcatInLoop)

} // namespace pyhazard::rules
