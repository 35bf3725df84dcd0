#include "RuleSupport.h"

#include <algorithm>

namespace pyhazard::rules {

namespace {

constexpr std::string_view kMutatingMethods[] = {
    "append", "remove", "pop", "insert", "clear", "extend", "add", "discard",
    "update", "popitem", "setdefault",
};

} // anonymous namespace

class G004_MutateWhileIterating : public Rule {
public:
    std::string_view getID() const override { return "mutate-while-iterating"; }
    std::string_view getCode() const override { return "G004"; }
    std::string_view getTitle() const override { return "Collection modified while iterating"; }
    Category getCategory() const override { return Category::Gotcha; }
    Severity getBaseSeverity() const override { return Severity::High; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::Call, NodeKind::Delete};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        std::vector<std::string> mutated;
        if (n.is(NodeKind::Call)) {
            if (!n.func || !n.func->is(NodeKind::Attribute) ||
                !oneOf(n.func->name, kMutatingMethods))
                return;
            mutated.push_back(python::dottedName(n.func->value));
        } else {
            for (const auto *t : n.targets) {
                const Node *base = t->is(NodeKind::Subscript) ? t->value : t;
                mutated.push_back(python::dottedName(base));
            }
        }

        for (const Frame *loop : ctx.loopsInScope()) {
            if (loop->iterated.empty())
                continue;
            if (std::find(mutated.begin(), mutated.end(), loop->iterated) == mutated.end())
                continue;
            out.push_back(ctx.makeFinding(
                *this, n,
                "'" + loop->iterated + "' is modified while the loop iterates over it",
                "Iterate over a copy (list(" + loop->iterated +
                    ")) or build a new collection"));
            return;
        }
    }
};

PYHAZARD_REGISTER_RULE(G004_MutateWhileIterating)

} // namespace pyhazard::rules
