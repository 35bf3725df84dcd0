#include "RuleSupport.h"

namespace pyhazard::rules {

class R006_MutableClassAttribute : public Rule {
public:
    std::string_view getID() const override { return "mutable-class-attribute"; }
    std::string_view getCode() const override { return "R006"; }
    std::string_view getTitle() const override { return "Mutable class attribute"; }
    Category getCategory() const override { return Category::Runtime; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::Assign, NodeKind::AnnAssign};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (ctx.frames().back().kind != FrameKind::Class)
            return;
        if (!isMutableValue(n.value))
            return;
        const Node *target = n.is(NodeKind::Assign) && n.targets.size() == 1
                                 ? n.targets.front()
                                 : n.target;
        if (!target || !target->is(NodeKind::Name))
            return;
        llvm::StringRef name(target->name);
        if (name.startswith("__") && name.endswith("__"))
            return;
        out.push_back(ctx.makeFinding(
            *this, n,
            "Class attribute '" + target->name + "' is shared by all instances",
            "Initialize it per instance in __init__, or use "
            "dataclasses.field(default_factory=...)"));
    }
};

PYHAZARD_REGISTER_RULE(R006_MutableClassAttribute)

} // namespace pyhazard::rules
