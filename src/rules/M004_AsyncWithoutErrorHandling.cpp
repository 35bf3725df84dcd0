#include "RuleSupport.h"

namespace pyhazard::rules {

class M004_AsyncWithoutErrorHandling : public Rule {
public:
    std::string_view getID() const override { return "async-without-error-handling"; }
    std::string_view getCode() const override { return "M004"; }
    std::string_view getTitle() const override { return "Async function without error handling"; }
    Category getCategory() const override { return Category::Resource; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::AsyncFunctionDef};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (n.facts.containsGuard)
            return;
        out.push_back(ctx.makeFinding(
            *this, n,
            "Async function '" + n.name + "' has no try/except; failures "
            "surface only when the task is awaited",
            "Handle expected exceptions inside the coroutine and log them"));
    }
};

PYHAZARD_REGISTER_RULE(M004_AsyncWithoutErrorHandling)

} // namespace pyhazard::rules
