#include "RuleSupport.h"

namespace pyhazard::rules {

class S006_TlsVerificationDisabled : public Rule {
public:
    std::string_view getID() const override { return "tls-verification-disabled"; }
    std::string_view getCode() const override { return "S006"; }
    std::string_view getTitle() const override { return "TLS verification disabled"; }
    Category getCategory() const override { return Category::Security; }
    Severity getBaseSeverity() const override { return Severity::High; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::Keyword, NodeKind::Attribute};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (n.is(NodeKind::Keyword)) {
            if (n.name != "verify" || !isConstant(n.value, ConstantKind::False))
                return;
        } else {
            std::string dotted = python::dottedName(&n);
            if (dotted != "ssl.CERT_NONE" && dotted != "ssl._create_unverified_context")
                return;
        }
        out.push_back(ctx.makeFinding(
            *this, n, "Certificate verification is disabled",
            "Keep verification on; point verify= at a CA bundle for private "
            "certificates"));
    }
};

PYHAZARD_REGISTER_RULE(S006_TlsVerificationDisabled)

} // namespace pyhazard::rules
