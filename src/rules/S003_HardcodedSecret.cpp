#include "RuleSupport.h"

namespace pyhazard::rules {

namespace {

constexpr std::string_view kSecretNames[] = {
    "password", "passwd", "pwd", "secret", "api_key", "apikey", "token",
    "private_key", "access_key", "credential",
};

constexpr std::string_view kPlaceholders[] = {
    "todo", "changeme", "change_me", "xxx", "placeholder", "example",
    "dummy", "fixme",
};

bool looksLikePlaceholder(llvm::StringRef value) {
    std::string v = value.lower();
    llvm::StringRef lv(v);
    if (lv.startswith("your-") || lv.startswith("your_") || lv.startswith("<") ||
        lv.startswith("${") || lv.startswith("{{"))
        return true;
    return containsAny(v, kPlaceholders);
}

} // anonymous namespace

class S003_HardcodedSecret : public Rule {
public:
    std::string_view getID() const override { return "hardcoded-secret"; }
    std::string_view getCode() const override { return "S003"; }
    std::string_view getTitle() const override { return "Hardcoded secret"; }
    Category getCategory() const override { return Category::Security; }
    Severity getBaseSeverity() const override { return Severity::High; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::Assign, NodeKind::AnnAssign, NodeKind::Keyword};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        std::string name;
        if (n.is(NodeKind::Keyword))
            name = n.name;
        else if (n.is(NodeKind::Assign) && n.targets.size() == 1)
            name = targetName(n.targets.front());
        else if (n.is(NodeKind::AnnAssign))
            name = targetName(n.target);
        if (name.empty() || !containsAny(lower(name), kSecretNames))
            return;

        if (!isConstant(n.value, ConstantKind::Str) || n.value->text.empty())
            return;
        if (looksLikePlaceholder(n.value->text))
            return;
        out.push_back(ctx.makeFinding(
            *this, n, "Secret '" + name + "' is hardcoded in source",
            "Load it from the environment or a secrets manager, e.g. "
            "os.environ[\"" + llvm::StringRef(name).upper() + "\"]"));
    }
};

PYHAZARD_REGISTER_RULE(S003_HardcodedSecret)

} // namespace pyhazard::rules
