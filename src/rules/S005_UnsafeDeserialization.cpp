#include "RuleSupport.h"

namespace pyhazard::rules {

class S005_UnsafeDeserialization : public Rule {
public:
    std::string_view getID() const override { return "unsafe-deserialization"; }
    std::string_view getCode() const override { return "S005"; }
    std::string_view getTitle() const override { return "Unsafe deserialization"; }
    Category getCategory() const override { return Category::Security; }
    Severity getBaseSeverity() const override { return Severity::High; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Call}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        bool unsafe = isCallDotted(&n, {"pickle.load", "pickle.loads",
                                        "cPickle.load", "cPickle.loads",
                                        "dill.load", "dill.loads",
                                        "marshal.load", "marshal.loads",
                                        "shelve.open", "yaml.unsafe_load",
                                        "jsonpickle.decode"});
        if (!unsafe && isCallDotted(&n, {"yaml.load"})) {
            const Node *loader = keywordArg(n, "Loader");
            if (!loader && n.elts.size() > 1)
                loader = n.elts[1];
            unsafe = !loader ||
                     python::dottedName(loader).find("Safe") == std::string::npos;
        }
        if (!unsafe)
            return;
        out.push_back(ctx.makeFinding(
            *this, n,
            python::dottedName(n.func) +
                "() can execute arbitrary code when fed untrusted data",
            "Use json, or yaml.safe_load, for data that crosses a trust boundary"));
    }
};

PYHAZARD_REGISTER_RULE(S005_UnsafeDeserialization)

} // namespace pyhazard::rules
