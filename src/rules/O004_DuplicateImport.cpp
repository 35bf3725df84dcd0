#include "RuleSupport.h"

namespace pyhazard::rules {

namespace {

// Identity of one imported binding, for duplicate detection.
std::string importKey(const Node &import, const Node &alias) {
    std::string key;
    if (import.is(NodeKind::ImportFrom))
        key = std::string(import.level, '.') + import.name + ":";
    return key + alias.name + " as " + alias.asName;
}

} // anonymous namespace

class O004_DuplicateImport : public Rule {
public:
    std::string_view getID() const override { return "duplicate-import"; }
    std::string_view getCode() const override { return "O004"; }
    std::string_view getTitle() const override { return "Duplicate import"; }
    Category getCategory() const override { return Category::Organization; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override {
        return {NodeKind::Import, NodeKind::ImportFrom};
    }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (!isModuleLevel(ctx))
            return;
        for (const auto *stmt : ctx.enclosingScope().node->body) {
            if (stmt == &n)
                return;
            if (!stmt->is(NodeKind::Import) && !stmt->is(NodeKind::ImportFrom))
                continue;
            for (const auto *prev : stmt->names) {
                for (const auto *alias : n.names) {
                    if (importKey(*stmt, *prev) != importKey(n, *alias))
                        continue;
                    out.push_back(ctx.makeFinding(
                        *this, n,
                        "'" + boundName(n, *alias) + "' was already imported on line " +
                            std::to_string(stmt->line),
                        "Remove the repeated import"));
                    return;
                }
            }
        }
    }
};

PYHAZARD_REGISTER_RULE(O004_DuplicateImport)

} // namespace pyhazard::rules
