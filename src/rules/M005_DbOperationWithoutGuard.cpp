#include "RuleSupport.h"

namespace pyhazard::rules {

namespace {

constexpr std::string_view kDbMethods[] = {
    "execute",    "executemany", "executescript", "query",       "filter",
    "filter_by",  "commit",      "rollback",      "save",        "create",
    "insert",     "insert_one",  "insert_many",   "update",      "update_one",
    "update_many", "delete",     "delete_one",    "delete_many", "bulk_create",
    "get_or_create",
};

bool isDbCall(const Node *n) {
    return n && n->is(NodeKind::Call) && n->func &&
           n->func->is(NodeKind::Attribute) && oneOf(n->func->name, kDbMethods);
}

} // anonymous namespace

class M005_DbOperationWithoutGuard : public Rule {
public:
    std::string_view getID() const override { return "db-operation-without-guard"; }
    std::string_view getCode() const override { return "M005"; }
    std::string_view getTitle() const override { return "Database call without error handling"; }
    Category getCategory() const override { return Category::Resource; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Call}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &out) const override {
        if (!isDbCall(&n) || !ctx.insideFunction() || ctx.insideGuardedBlock())
            return;
        // In `q.filter(...).update(...)` only the outer call is reported.
        const Node *attr = ctx.ancestor(1);
        const Node *outer = ctx.ancestor(2);
        if (attr && attr->is(NodeKind::Attribute) && attr->value == &n &&
            outer && outer->func == attr && isDbCall(outer))
            return;
        out.push_back(ctx.makeFinding(
            *this, n,
            "Database call " + n.func->name + "() is not wrapped in error handling",
            "Wrap it in try/except, roll back on failure and log the error"));
    }
};

PYHAZARD_REGISTER_RULE(M005_DbOperationWithoutGuard)

} // namespace pyhazard::rules
