#include "RuleSupport.h"

#include <algorithm>
#include <set>

namespace pyhazard::rules {

class G007_LateBindingClosure : public Rule {
public:
    std::string_view getID() const override { return "late-binding-closure"; }
    std::string_view getCode() const override { return "G007"; }
    std::string_view getTitle() const override { return "Closure captures loop variable"; }
    Category getCategory() const override { return Category::Gotcha; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::Lambda, NodeKind::FunctionDef, NodeKind::AsyncFunctionDef};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        auto loops = ctx.loopsInScope();
        if (loops.empty())
            return;

        std::set<std::string> params;
        if (n.args) {
            for (const auto *arg : n.args->elts)
                params.insert(arg->name);
        }
        std::vector<std::string> used;
        if (n.is(NodeKind::Lambda)) {
            collectNames(n.value, used);
        } else {
            for (const auto *stmt : n.body)
                collectNames(stmt, used);
        }

        for (const Frame *loop : loops) {
            for (const auto &bound : loop->boundNames) {
                if (params.count(bound) ||
                    std::find(used.begin(), used.end(), bound) == used.end())
                    continue;
                out.push_back(ctx.makeFinding(
                    *this, n,
                    "Closure captures loop variable '" + bound +
                        "' by reference; every closure sees its last value",
                    "Bind it as a default argument: lambda " + bound + "=" +
                        bound + ": ..."));
                return;
            }
        }
    }
};

PYHAZARD_REGISTER_RULE(G007_LateBindingClosure)

} // namespace pyhazard::rules
