#pragma once

#include "pyhazard/core/Config.h"
#include "pyhazard/policy/RiskAggregator.h"

#include <string_view>

namespace pyhazard {

enum class Decision {
    Silent,
    Warn,
    Block,
};

constexpr std::string_view decisionName(Decision d) {
    switch (d) {
        case Decision::Silent: return "silent";
        case Decision::Warn:   return "warn";
        case Decision::Block:  return "block";
    }
    return "unknown";
}

struct Verdict {
    Decision decision = Decision::Silent;
    RiskSummary summary;
};

// Empty -> Silent; any CRITICAL under block-on-critical -> Block;
// otherwise Warn.
class PolicyEngine {
public:
    explicit PolicyEngine(const Config &cfg) : config_(cfg) {}

    Verdict decide(RiskSummary summary) const;

private:
    const Config &config_;
};

} // namespace pyhazard
