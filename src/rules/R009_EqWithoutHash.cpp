#include "RuleSupport.h"

namespace pyhazard::rules {

class R009_EqWithoutHash : public Rule {
public:
    std::string_view getID() const override { return "eq-without-hash"; }
    std::string_view getCode() const override { return "R009"; }
    std::string_view getTitle() const override { return "__eq__ without __hash__"; }
    Category getCategory() const override { return Category::Runtime; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override { return {NodeKind::ClassDef}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        bool eq = false;
        bool hash = false;
        for (const auto *stmt : n.body) {
            if (stmt->isFunction()) {
                eq |= stmt->name == "__eq__";
                hash |= stmt->name == "__hash__";
            } else if (stmt->is(NodeKind::Assign)) {
                for (const auto *t : stmt->targets)
                    hash |= t->is(NodeKind::Name) && t->name == "__hash__";
            }
        }
        if (!eq || hash)
            return;
        out.push_back(ctx.makeFinding(
            *this, n,
            "Class '" + n.name + "' defines __eq__ but not __hash__, so "
            "instances are unhashable",
            "Define __hash__ consistently with __eq__, or set __hash__ = None "
            "explicitly"));
    }
};

PYHAZARD_REGISTER_RULE(R009_EqWithoutHash)

} // namespace pyhazard::rules
