#include "RuleSupport.h"

namespace pyhazard::rules {

namespace {

// A string whose value is fixed at parse time.
bool isPlainString(const Node *n) {
    if (!n)
        return false;
    if (isConstant(n, ConstantKind::Str))
        return true;
    return n->is(NodeKind::JoinedStr) && n->elts.empty();
}

} // anonymous namespace

class S002_ShellInjection : public Rule {
public:
    std::string_view getID() const override { return "shell-injection"; }
    std::string_view getCode() const override { return "S002"; }
    std::string_view getTitle() const override { return "Shell command built from input"; }
    Category getCategory() const override { return Category::Security; }
    Severity getBaseSeverity() const override { return Severity::Critical; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Call}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        const Node *command = firstArg(n);
        if (!command)
            return;
        if (isCallDotted(&n, {"subprocess.run", "subprocess.call",
                              "subprocess.Popen", "subprocess.check_call",
                              "subprocess.check_output"})) {
            if (!isConstant(keywordArg(n, "shell"), ConstantKind::True) ||
                isPlainString(command))
                return;
        } else if (isCallDotted(&n, {"os.system", "os.popen"})) {
            if (isPlainString(command))
                return;
        } else {
            return;
        }
        out.push_back(ctx.makeFinding(
            *this, n, "Shell command is assembled at runtime and run through a shell",
            "Pass an argument list without shell=True, and quote untrusted "
            "parts with shlex.quote"));
    }
};

PYHAZARD_REGISTER_RULE(S002_ShellInjection)

} // namespace pyhazard::rules
