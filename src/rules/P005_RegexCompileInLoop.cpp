#include "RuleSupport.h"

namespace pyhazard::rules {

class P005_RegexCompileInLoop : public Rule {
public:
    std::string_view getID() const override { return "regex-compile-in-loop"; }
    std::string_view getCode() const override { return "P005"; }
    std::string_view getTitle() const override { return "re.compile inside a loop"; }
    Category getCategory() const override { return Category::Performance; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Call}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (!isCallDotted(&n, {"re.compile", "regex.compile"}) || !ctx.insideLoop())
            return;
        out.push_back(ctx.makeFinding(
            *this, n, "Regular expression is compiled on every iteration",
            "Compile the pattern once at module level and reuse it"));
    }
};

PYHAZARD_REGISTER_RULE(P005_RegexCompileInLoop)

} // namespace pyhazard::rules
