#include "pyhazard/policy/PolicyEngine.h"

namespace pyhazard {

Verdict PolicyEngine::decide(RiskSummary summary) const {
    Verdict v;
    if (summary.findings.empty())
        v.decision = Decision::Silent;
    else if (config_.blockOnCritical && summary.counts[Severity::Critical] > 0)
        v.decision = Decision::Block;
    else
        v.decision = Decision::Warn;
    v.summary = std::move(summary);
    return v;
}

} // namespace pyhazard
