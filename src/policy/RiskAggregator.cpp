#include "pyhazard/policy/RiskAggregator.h"

#include <algorithm>

namespace pyhazard {

unsigned SeverityCounts::total() const {
    unsigned sum = 0;
    for (unsigned c : bySeverity)
        sum += c;
    return sum;
}

SeverityCounts countBySeverity(const std::vector<Finding> &findings) {
    SeverityCounts counts;
    for (const auto &f : findings)
        counts.add(f.severity);
    return counts;
}

RiskSummary RiskAggregator::aggregate(std::vector<Finding> raw) const {
    raw.erase(
        std::remove_if(raw.begin(), raw.end(),
                       [&](const Finding &f) {
                           return config_.isRuleDisabled(f.ruleID, f.ruleCode) ||
                                  !config_.isSeverityEnabled(f.severity);
                       }),
        raw.end());

    std::stable_sort(raw.begin(), raw.end(),
                     [](const Finding &a, const Finding &b) {
                         if (a.severity != b.severity)
                             return static_cast<uint8_t>(a.severity) >
                                    static_cast<uint8_t>(b.severity);
                         if (a.location.line != b.location.line)
                             return a.location.line < b.location.line;
                         if (a.location.column != b.location.column)
                             return a.location.column < b.location.column;
                         return a.ruleCode < b.ruleCode;
                     });

    RiskSummary summary;
    summary.counts = countBySeverity(raw);
    summary.findings = std::move(raw);
    return summary;
}

} // namespace pyhazard
