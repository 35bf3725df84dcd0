#include "RuleSupport.h"

#include <set>

namespace pyhazard::rules {

namespace {

bool isBroadHandler(const Node &h) {
    if (!h.test)
        return true;
    std::string name = python::dottedName(h.test);
    return name == "Exception" || name == "BaseException";
}

void handlerTypes(const Node &h, std::vector<std::string> &out) {
    if (!h.test)
        return;
    if (h.test->is(NodeKind::Tuple)) {
        for (const auto *e : h.test->elts)
            out.push_back(python::dottedName(e));
    } else {
        out.push_back(python::dottedName(h.test));
    }
}

} // anonymous namespace

class G010_UnreachableExceptHandler : public Rule {
public:
    std::string_view getID() const override { return "unreachable-except-handler"; }
    std::string_view getCode() const override { return "G010"; }
    std::string_view getTitle() const override { return "Unreachable except handler"; }
    Category getCategory() const override { return Category::Gotcha; }
    Severity getBaseSeverity() const override { return Severity::High; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Try}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        std::set<std::string> seen;
        const Node *broad = nullptr;
        for (const auto *h : n.handlers) {
            if (broad) {
                out.push_back(ctx.makeFinding(
                    *this, *h,
                    "Handler can never run: the handler on line " +
                        std::to_string(broad->line) + " already catches everything",
                    "Move the broad handler last"));
                return;
            }
            std::vector<std::string> types;
            handlerTypes(*h, types);
            for (const auto &t : types) {
                if (t.empty())
                    continue;
                if (!seen.insert(t).second) {
                    out.push_back(ctx.makeFinding(
                        *this, *h, "'" + t + "' is already caught by an earlier handler",
                        "Remove the duplicate handler or merge their bodies"));
                    return;
                }
            }
            if (isBroadHandler(*h))
                broad = h;
        }
    }
};

PYHAZARD_REGISTER_RULE(G010_UnreachableExceptHandler)

} // namespace pyhazard::rules
