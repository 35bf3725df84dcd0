#include "RuleSupport.h"

namespace pyhazard::rules {

namespace {

constexpr std::string_view kSecurityTokenNames[] = {
    "token", "secret", "password", "passwd", "key", "nonce", "salt", "otp",
    "session", "csrf",
};

bool isRandomCall(const Node &call) {
    std::string dotted = python::dottedName(call.func);
    return llvm::StringRef(dotted).startswith("random.");
}

} // anonymous namespace

class S007_InsecureRandom : public Rule {
public:
    std::string_view getID() const override { return "insecure-random"; }
    std::string_view getCode() const override { return "S007"; }
    std::string_view getTitle() const override { return "Predictable random for secrets"; }
    Category getCategory() const override { return Category::Security; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::Assign, NodeKind::AnnAssign};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        std::string name = n.is(NodeKind::Assign) && n.targets.size() == 1
                               ? targetName(n.targets.front())
                               : targetName(n.target);
        if (name.empty() || !containsAny(lower(name), kSecurityTokenNames))
            return;
        if (!anyCallInExpression(n.value, isRandomCall))
            return;
        out.push_back(ctx.makeFinding(
            *this, n,
            "'" + name + "' is generated with the predictable random module",
            "Use the secrets module, e.g. secrets.token_hex() or "
            "secrets.randbelow()"));
    }
};

PYHAZARD_REGISTER_RULE(S007_InsecureRandom)

} // namespace pyhazard::rules
