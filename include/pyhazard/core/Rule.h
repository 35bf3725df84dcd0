#pragma once

#include "pyhazard/core/Finding.h"
#include "pyhazard/core/Severity.h"
#include "pyhazard/python/Ast.h"

#include <string_view>
#include <vector>

namespace pyhazard {

class TraversalContext;

class Rule {
public:
    virtual ~Rule() = default;

    virtual std::string_view getID() const = 0;
    virtual std::string_view getCode() const = 0;
    virtual std::string_view getTitle() const = 0;
    virtual Category getCategory() const = 0;
    virtual Severity getBaseSeverity() const = 0;

    // Node kinds the walker dispatches to this rule.
    virtual std::vector<python::NodeKind> interests() const = 0;

    // Examine one node in its traversal context. Implementations append at
    // most one finding to `out` per call.
    virtual void check(const python::Node &node,
                       const TraversalContext &ctx,
                       std::vector<Finding> &out) const = 0;
};

} // namespace pyhazard
