#include "RuleSupport.h"

namespace pyhazard::rules {

class S001_InjectionHeuristic : public Rule {
public:
    std::string_view getID() const override { return "injection-heuristic"; }
    std::string_view getCode() const override { return "S001"; }
    std::string_view getTitle() const override { return "Query built from dynamic string"; }
    Category getCategory() const override { return Category::Security; }
    Severity getBaseSeverity() const override { return Severity::Critical; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Call}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        std::string_view callee = python::calleeName(n);
        if (!oneOf(callee, {"execute", "executemany", "executescript", "raw",
                            "query", "text", "mogrify"}))
            return;
        if (!isDynamicString(firstArg(n)))
            return;
        out.push_back(ctx.makeFinding(
            *this, n,
            "Query passed to " + std::string(callee) +
                "() is built by string formatting, allowing injection",
            "Use parameter placeholders and pass values separately, e.g. "
            "execute(\"... WHERE id = %s\", (user_id,))"));
    }
};

PYHAZARD_REGISTER_RULE(S001_InjectionHeuristic)

} // namespace pyhazard::rules
