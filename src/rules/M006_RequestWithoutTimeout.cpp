#include "RuleSupport.h"

namespace pyhazard::rules {

namespace {

constexpr std::string_view kHttpMethods[] = {
    "get", "post", "put", "patch", "delete", "head", "options", "request",
};

} // anonymous namespace

class M006_RequestWithoutTimeout : public Rule {
public:
    std::string_view getID() const override { return "request-without-timeout"; }
    std::string_view getCode() const override { return "M006"; }
    std::string_view getTitle() const override { return "HTTP request without timeout"; }
    Category getCategory() const override { return Category::Resource; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Call}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        bool http = isCallNamed(&n, {"urlopen"}) ||
                    isCallDotted(&n, {"urllib.request.urlopen", "request.urlopen"});
        if (!http && n.func && n.func->is(NodeKind::Attribute) &&
            oneOf(n.func->name, kHttpMethods)) {
            std::string module = python::dottedName(n.func->value);
            http = module == "requests" || module == "httpx";
        }
        if (!http || keywordArg(n, "timeout"))
            return;
        out.push_back(ctx.makeFinding(
            *this, n, "HTTP request can block forever without a timeout",
            "Pass timeout=..., e.g. requests.get(url, timeout=10)"));
    }
};

PYHAZARD_REGISTER_RULE(M006_RequestWithoutTimeout)

} // namespace pyhazard::rules
