#pragma once

#include "pyhazard/analysis/SourceLoader.h"
#include "pyhazard/analysis/TraversalContext.h"
#include "pyhazard/core/Config.h"
#include "pyhazard/core/Finding.h"
#include "pyhazard/core/Rule.h"
#include "pyhazard/python/Ast.h"

#include <array>
#include <memory>
#include <vector>

namespace pyhazard {

class RuleRegistry;

// Single pre-order walk over a finalized tree. Every node is dispatched to
// the rules interested in its kind while the frame stack describes where
// the node sits.
class HazardWalker {
public:
    HazardWalker(const RuleRegistry &registry, const Config &cfg);

    std::vector<Finding> run(const python::SyntaxTree &tree,
                             const SourceFile &file);

    size_t ruleCount(python::NodeKind kind) const {
        return table_[static_cast<size_t>(kind)].size();
    }

private:
    using NodeList = std::vector<const python::Node *>;

    void visit(const python::Node *n);
    void visitAll(const NodeList &ns);
    void visitInFrame(const NodeList &ns, Frame frame);
    void visitChildren(const python::Node &n);
    void dispatch(const python::Node &n);

    void walkFunction(const python::Node &n);
    void walkClass(const python::Node &n);
    void walkFor(const python::Node &n);
    void walkWhile(const python::Node &n);
    void walkTry(const python::Node &n);
    void walkIf(const python::Node &n);
    void walkWith(const python::Node &n);
    void walkMatch(const python::Node &n);
    void walkComprehension(const python::Node &n);

    const Config &config_;
    std::array<std::vector<const Rule *>, python::kNodeKindCount> table_;
    std::unique_ptr<TraversalContext> ctx_;
    std::vector<Finding> findings_;
};

// Names bound by an assignment or loop target (a, (b, *c), d.e -> a b c).
void collectBoundNames(const python::Node *target, std::vector<std::string> &out);

} // namespace pyhazard
