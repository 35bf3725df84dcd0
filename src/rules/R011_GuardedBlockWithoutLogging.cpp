#include "RuleSupport.h"

namespace pyhazard::rules {

namespace {

constexpr std::string_view kLogCallees[] = {
    "debug", "info", "warning", "warn", "error", "critical", "exception", "log",
};

bool isLoggingCall(const Node &call) {
    if (!call.func)
        return false;
    if (call.func->is(NodeKind::Name) && call.func->name == "print")
        return true;
    return oneOf(python::calleeName(call), kLogCallees);
}

} // anonymous namespace

class R011_GuardedBlockWithoutLogging : public Rule {
public:
    std::string_view getID() const override { return "guarded-block-without-logging"; }
    std::string_view getCode() const override { return "R011"; }
    std::string_view getTitle() const override { return "Exception handler without logging"; }
    Category getCategory() const override { return Category::Runtime; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::ExceptHandler};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        for (const auto *stmt : n.body) {
            if (anyCallInExpression(stmt->value, isLoggingCall) ||
                anyCallInExpression(stmt->test, isLoggingCall))
                return;
        }
        out.push_back(ctx.makeFinding(
            *this, n, "Exception handler does not log the error",
            "Call logger.exception(...) or logger.error(...) so failures "
            "leave a trace"));
    }
};

PYHAZARD_REGISTER_RULE(R011_GuardedBlockWithoutLogging)

} // namespace pyhazard::rules
