#include "RuleSupport.h"

namespace pyhazard::rules {

namespace {

constexpr std::string_view kRouteDecorators[] = {
    "route", "get", "post", "put", "delete", "patch", "api_view",
};

bool isRouteDecorator(const Node *d) {
    const Node *target = d->is(NodeKind::Call) ? d->func : d;
    if (!target)
        return false;
    if (target->is(NodeKind::Attribute))
        return oneOf(target->name, kRouteDecorators);
    return target->is(NodeKind::Name) && target->name == "api_view";
}

} // anonymous namespace

class M007_EndpointWithoutErrorHandling : public Rule {
public:
    std::string_view getID() const override { return "endpoint-without-error-handling"; }
    std::string_view getCode() const override { return "M007"; }
    std::string_view getTitle() const override { return "Endpoint without error handling"; }
    Category getCategory() const override { return Category::Resource; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::FunctionDef, NodeKind::AsyncFunctionDef};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (n.facts.containsGuard)
            return;
        bool endpoint = false;
        for (const auto *d : n.decorators)
            endpoint |= isRouteDecorator(d);
        if (!endpoint)
            return;
        out.push_back(ctx.makeFinding(
            *this, n,
            "Endpoint '" + n.name + "' returns a bare 500 on any exception",
            "Catch expected errors and map them to explicit responses"));
    }
};

PYHAZARD_REGISTER_RULE(M007_EndpointWithoutErrorHandling)

} // namespace pyhazard::rules
