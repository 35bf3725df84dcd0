#include "RuleSupport.h"

namespace pyhazard::rules {

class S010_InsecureTempfile : public Rule {
public:
    std::string_view getID() const override { return "insecure-tempfile"; }
    std::string_view getCode() const override { return "S010"; }
    std::string_view getTitle() const override { return "Insecure temporary file"; }
    Category getCategory() const override { return Category::Security; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Call}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (!isCallDotted(&n, {"tempfile.mktemp", "os.tempnam", "os.tmpnam"})) {
            const Node *path = firstArg(n);
            if (!isCallNamed(&n, {"open"}) || !isConstant(path, ConstantKind::Str) ||
                !llvm::StringRef(path->text).startswith("/tmp/"))
                return;
        }
        out.push_back(ctx.makeFinding(
            *this, n, "Temporary file path is predictable and open to races",
            "Use tempfile.NamedTemporaryFile or tempfile.mkstemp"));
    }
};

PYHAZARD_REGISTER_RULE(S010_InsecureTempfile)

} // namespace pyhazard::rules
