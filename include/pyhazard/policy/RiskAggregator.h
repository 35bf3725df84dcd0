#pragma once

#include "pyhazard/core/Config.h"
#include "pyhazard/core/Finding.h"
#include "pyhazard/core/Severity.h"

#include <array>
#include <vector>

namespace pyhazard {

// Per-severity tallies, indexed by the Severity enumerator.
struct SeverityCounts {
    std::array<unsigned, 4> bySeverity{};

    unsigned operator[](Severity s) const {
        return bySeverity[static_cast<size_t>(s)];
    }
    void add(Severity s) { ++bySeverity[static_cast<size_t>(s)]; }
    unsigned total() const;
};

SeverityCounts countBySeverity(const std::vector<Finding> &findings);

struct RiskSummary {
    std::vector<Finding> findings; // filtered, CRITICAL first
    SeverityCounts counts;
};

class RiskAggregator {
public:
    explicit RiskAggregator(const Config &cfg) : config_(cfg) {}

    // Drops findings whose id or code is disabled or whose severity is
    // not enabled, then orders the rest by severity, line, column, code.
    RiskSummary aggregate(std::vector<Finding> raw) const;

private:
    const Config &config_;
};

} // namespace pyhazard
