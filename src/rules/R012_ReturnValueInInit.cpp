#include "RuleSupport.h"

namespace pyhazard::rules {

class R012_ReturnValueInInit : public Rule {
public:
    std::string_view getID() const override { return "return-value-in-init"; }
    std::string_view getCode() const override { return "R012"; }
    std::string_view getTitle() const override { return "__init__ returns a value"; }
    Category getCategory() const override { return Category::Runtime; }
    Severity getBaseSeverity() const override { return Severity::High; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Return}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (!n.value || isNoneLiteral(n.value))
            return;
        const auto &frames = ctx.frames();
        for (size_t i = frames.size(); i-- > 1;) {
            if (!isFunctionFrame(frames[i].kind))
                continue;
            if (frames[i].node->name == "__init__" &&
                frames[i - 1].kind == FrameKind::Class)
                out.push_back(ctx.makeFinding(
                    *this, n, "__init__ returns a value, raising TypeError "
                              "at instantiation",
                    "Remove the return value; use a classmethod factory "
                    "if a different object is needed"));
            return;
        }
    }
};

PYHAZARD_REGISTER_RULE(R012_ReturnValueInInit)

} // namespace pyhazard::rules
