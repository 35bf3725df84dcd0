#include "RuleSupport.h"

namespace pyhazard::rules {

class R003_BareExcept : public Rule {
public:
    std::string_view getID() const override { return "bare-except"; }
    std::string_view getCode() const override { return "R003"; }
    std::string_view getTitle() const override { return "Bare except clause"; }
    Category getCategory() const override { return Category::Runtime; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::ExceptHandler};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (n.test)
            return;
        out.push_back(ctx.makeFinding(
            *this, n,
            "Bare except also catches SystemExit and KeyboardInterrupt",
            "Catch a specific exception, or 'except Exception:' at most"));
    }
};

PYHAZARD_REGISTER_RULE(R003_BareExcept)

} // namespace pyhazard::rules
