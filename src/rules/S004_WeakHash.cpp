#include "RuleSupport.h"

namespace pyhazard::rules {

class S004_WeakHash : public Rule {
public:
    std::string_view getID() const override { return "weak-hash"; }
    std::string_view getCode() const override { return "S004"; }
    std::string_view getTitle() const override { return "Weak hash algorithm"; }
    Category getCategory() const override { return Category::Security; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Call}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        std::string algorithm;
        if (isCallDotted(&n, {"hashlib.md5", "hashlib.sha1"})) {
            algorithm = n.func->name;
        } else if (isCallDotted(&n, {"hashlib.new"})) {
            const Node *arg = firstArg(n);
            if (!isConstant(arg, ConstantKind::Str))
                return;
            algorithm = lower(arg->text);
            if (algorithm != "md5" && algorithm != "sha1")
                return;
        } else {
            return;
        }
        if (isConstant(keywordArg(n, "usedforsecurity"), ConstantKind::False))
            return;
        out.push_back(ctx.makeFinding(
            *this, n, algorithm + " is not collision resistant",
            "Use hashlib.sha256 or better; pass usedforsecurity=False for "
            "non-security checksums"));
    }
};

PYHAZARD_REGISTER_RULE(S004_WeakHash)

} // namespace pyhazard::rules
