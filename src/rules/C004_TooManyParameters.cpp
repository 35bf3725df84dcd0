#include "RuleSupport.h"

namespace pyhazard::rules {

class C004_TooManyParameters : public Rule {
public:
    std::string_view getID() const override { return "too-many-parameters"; }
    std::string_view getCode() const override { return "C004"; }
    std::string_view getTitle() const override { return "Too many parameters"; }
    Category getCategory() const override { return Category::Complexity; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::FunctionDef, NodeKind::AsyncFunctionDef};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (!n.args)
            return;
        unsigned count = static_cast<unsigned>(n.args->elts.size());
        bool method = ctx.frames().back().kind == FrameKind::Class;
        if (method && count > 0) {
            const std::string &first = n.args->elts.front()->name;
            if (first == "self" || first == "cls")
                --count;
        }
        unsigned limit = ctx.config().maxParameters;
        if (count <= limit)
            return;
        out.push_back(ctx.makeFinding(
            *this, n,
            "Function '" + n.name + "' takes " + plural(count, "parameter") +
                " (limit " + std::to_string(limit) + ")",
            "Group related parameters into a dataclass or split the function"));
    }
};

PYHAZARD_REGISTER_RULE(C004_TooManyParameters)

} // namespace pyhazard::rules
