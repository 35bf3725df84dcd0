#include "RuleSupport.h"

#include <llvm/Support/Path.h>

namespace pyhazard::rules {

class O001_UnusedImport : public Rule {
public:
    std::string_view getID() const override { return "unused-import"; }
    std::string_view getCode() const override { return "O001"; }
    std::string_view getTitle() const override { return "Unused import"; }
    Category getCategory() const override { return Category::Organization; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::Import, NodeKind::ImportFrom};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        // Package initializers and stubs import to re-export.
        llvm::StringRef path(ctx.source().path);
        if (llvm::sys::path::filename(path) == "__init__.py" || path.endswith(".pyi"))
            return;
        if (!isModuleLevel(ctx) || n.name == "__future__")
            return;

        const auto &used = ctx.enclosingScope().node->facts.referencedNames;
        std::string unused;
        for (const auto *alias : n.names) {
            if (alias->name == "*" || alias->asName == alias->name)
                continue;
            std::string bound = boundName(n, *alias);
            if (used.count(bound))
                continue;
            unused += (unused.empty() ? "'" : ", '") + bound + "'";
        }
        if (unused.empty())
            return;
        out.push_back(ctx.makeFinding(
            *this, n, "Imported name " + unused + " is never used",
            "Remove the import, or list the name in __all__ if it is re-exported"));
    }
};

PYHAZARD_REGISTER_RULE(O001_UnusedImport)

} // namespace pyhazard::rules
