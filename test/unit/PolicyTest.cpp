#include "TestSupport.h"

#include "pyhazard/policy/PolicyEngine.h"
#include "pyhazard/policy/RiskAggregator.h"

#include <gtest/gtest.h>

using namespace pyhazard;
using namespace pyhazard::test;

namespace {

std::vector<Finding> mixedFindings() {
    return {
        makeFinding("O001", "unused-import", Severity::Low, 1, "unused"),
        makeFinding("R001", "mutable-default", Severity::High, 7, "shared default"),
        makeFinding("S001", "injection-heuristic", Severity::Critical, 12, "sql"),
        makeFinding("R003", "bare-except", Severity::Medium, 3, "bare"),
        makeFinding("R002", "dangerous-eval", Severity::High, 2, "eval"),
    };
}

} // anonymous namespace

TEST(PolicyTest, AggregatorOrdersBySeverityThenLine) {
    Config cfg = Config::defaults();
    RiskSummary summary = RiskAggregator(cfg).aggregate(mixedFindings());

    ASSERT_EQ(summary.findings.size(), 5u);
    EXPECT_EQ(summary.findings[0].ruleCode, "S001");
    EXPECT_EQ(summary.findings[1].ruleCode, "R002");
    EXPECT_EQ(summary.findings[2].ruleCode, "R001");
    EXPECT_EQ(summary.findings[3].ruleCode, "R003");
    EXPECT_EQ(summary.findings[4].ruleCode, "O001");

    EXPECT_EQ(summary.counts[Severity::Critical], 1u);
    EXPECT_EQ(summary.counts[Severity::High], 2u);
    EXPECT_EQ(summary.counts[Severity::Medium], 1u);
    EXPECT_EQ(summary.counts[Severity::Low], 1u);
    EXPECT_EQ(summary.counts.total(), 5u);
}

TEST(PolicyTest, SameLineOrdersByColumnThenCode) {
    auto a = makeFinding("G002", "equality-none", Severity::Medium, 4, "a");
    auto b = makeFinding("G001", "identity-literal", Severity::Medium, 4, "b");
    auto c = makeFinding("G009", "self-comparison", Severity::Medium, 4, "c");
    c.location.column = 0;
    a.location.column = 8;
    b.location.column = 8;

    RiskSummary summary = RiskAggregator(Config::defaults()).aggregate({a, b, c});
    ASSERT_EQ(summary.findings.size(), 3u);
    EXPECT_EQ(summary.findings[0].ruleCode, "G009");
    EXPECT_EQ(summary.findings[1].ruleCode, "G001");
    EXPECT_EQ(summary.findings[2].ruleCode, "G002");
}

TEST(PolicyTest, DisabledRulesMatchIdOrCode) {
    Config cfg = Config::defaults();
    cfg.disabledRules = {"mutable-default", "O001"};
    RiskSummary summary = RiskAggregator(cfg).aggregate(mixedFindings());
    ASSERT_EQ(summary.findings.size(), 3u);
    for (const auto &f : summary.findings) {
        EXPECT_NE(f.ruleCode, "R001");
        EXPECT_NE(f.ruleCode, "O001");
    }
}

TEST(PolicyTest, SeverityLevelsFilter) {
    Config cfg = Config::defaults();
    cfg.enabledSeverities = {Severity::Critical, Severity::High};
    RiskSummary summary = RiskAggregator(cfg).aggregate(mixedFindings());
    EXPECT_EQ(summary.findings.size(), 3u);
    EXPECT_EQ(summary.counts[Severity::Medium], 0u);
    EXPECT_EQ(summary.counts[Severity::Low], 0u);
}

TEST(PolicyTest, EmptyIsSilent) {
    Config cfg = Config::defaults();
    Verdict v = PolicyEngine(cfg).decide(RiskAggregator(cfg).aggregate({}));
    EXPECT_EQ(v.decision, Decision::Silent);
    EXPECT_EQ(decisionName(v.decision), "silent");
}

TEST(PolicyTest, CriticalBlocks) {
    Config cfg = Config::defaults();
    Verdict v = PolicyEngine(cfg).decide(RiskAggregator(cfg).aggregate(mixedFindings()));
    EXPECT_EQ(v.decision, Decision::Block);
    EXPECT_EQ(v.summary.findings.size(), 5u);
}

TEST(PolicyTest, CriticalWarnsWhenBlockingIsOff) {
    Config cfg = Config::defaults();
    cfg.blockOnCritical = false;
    Verdict v = PolicyEngine(cfg).decide(RiskAggregator(cfg).aggregate(mixedFindings()));
    EXPECT_EQ(v.decision, Decision::Warn);
}

TEST(PolicyTest, NonCriticalWarns) {
    Config cfg = Config::defaults();
    std::vector<Finding> raw = {
        makeFinding("R001", "mutable-default", Severity::High, 1, "shared default"),
    };
    Verdict v = PolicyEngine(cfg).decide(RiskAggregator(cfg).aggregate(raw));
    EXPECT_EQ(v.decision, Decision::Warn);
    EXPECT_EQ(decisionName(v.decision), "warn");
}

TEST(PolicyTest, FilteredCriticalDoesNotBlock) {
    Config cfg = Config::defaults();
    cfg.disabledRules = {"S001"};
    Verdict v = PolicyEngine(cfg).decide(RiskAggregator(cfg).aggregate(mixedFindings()));
    EXPECT_EQ(v.decision, Decision::Warn);
    EXPECT_EQ(v.summary.counts[Severity::Critical], 0u);
}
