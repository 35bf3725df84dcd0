#include "TestSupport.h"

#include "pyhazard/analysis/HazardWalker.h"
#include "pyhazard/analysis/TraversalContext.h"
#include "pyhazard/core/RuleRegistry.h"
#include "pyhazard/python/Parser.h"

#include <gtest/gtest.h>

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pyhazard;
using namespace pyhazard::test;
using python::Node;
using python::NodeKind;

namespace {

// What the context looked like at each Name `marker`.
struct ContextSample {
    unsigned line = 0;
    unsigned blockDepth = 0;
    unsigned functionDepth = 0;
    bool insideLoop = false;
    bool insideFunction = false;
    bool guarded = false;
    bool inFinally = false;
    bool inWithItem = false;
    NodeKind parent = NodeKind::Module;
    FrameKind scope = FrameKind::Module;
    std::vector<std::string> loopNames;
};

std::vector<ContextSample> &contextSamples() {
    static std::vector<ContextSample> samples;
    return samples;
}

class X901_ContextRecorder : public Rule {
public:
    std::string_view getID() const override { return "context-recorder"; }
    std::string_view getCode() const override { return "X901"; }
    std::string_view getTitle() const override { return "Context recorder"; }
    Category getCategory() const override { return Category::Gotcha; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Name}; }

    void check(const Node &n, const TraversalContext &ctx,
               std::vector<Finding> &) const override {
        if (n.name != "marker")
            return;
        ContextSample s;
        s.line = n.line;
        s.blockDepth = ctx.blockDepth();
        s.functionDepth = ctx.functionDepth();
        s.insideLoop = ctx.insideLoop();
        s.insideFunction = ctx.insideFunction();
        s.guarded = ctx.insideGuardedBlock();
        s.inFinally = ctx.insideFinally();
        s.inWithItem = ctx.insideWithItem();
        if (const Node *parent = ctx.ancestor())
            s.parent = parent->kind;
        s.scope = ctx.enclosingScope().kind;
        for (const Frame *loop : ctx.loopsInScope())
            s.loopNames.insert(s.loopNames.end(), loop->boundNames.begin(),
                               loop->boundNames.end());
        contextSamples().push_back(std::move(s));
    }
};

PYHAZARD_REGISTER_RULE(X901_ContextRecorder)

// Throws on Name `explode`; the walker must carry on with other rules.
class X902_ThrowingRule : public Rule {
public:
    std::string_view getID() const override { return "throwing-rule"; }
    std::string_view getCode() const override { return "X902"; }
    std::string_view getTitle() const override { return "Throwing rule"; }
    Category getCategory() const override { return Category::Gotcha; }
    Severity getBaseSeverity() const override { return Severity::Low; }

    std::vector<NodeKind> interests() const override { return {NodeKind::Name}; }

    void check(const Node &n, const TraversalContext &,
               std::vector<Finding> &) const override {
        if (n.name == "explode")
            throw std::runtime_error("rule failure");
    }
};

PYHAZARD_REGISTER_RULE(X902_ThrowingRule)

std::vector<ContextSample> sampleContext(std::string_view source,
                                         std::string path = "/project/app/module.py") {
    contextSamples().clear();
    scan(source, Config::defaults(), std::move(path));
    return contextSamples();
}

} // anonymous namespace

TEST(TraversalTest, TestFileDetection) {
    EXPECT_TRUE(looksLikeTestFile("/repo/test_models.py"));
    EXPECT_TRUE(looksLikeTestFile("/repo/models_test.py"));
    EXPECT_TRUE(looksLikeTestFile("/repo/conftest.py"));
    EXPECT_TRUE(looksLikeTestFile("/repo/tests/helpers.py"));
    EXPECT_FALSE(looksLikeTestFile("/repo/app/models.py"));
    EXPECT_FALSE(looksLikeTestFile("/repo/app/contest.py"));
}

TEST(TraversalTest, FrameKindClasses) {
    EXPECT_TRUE(isScopeFrame(FrameKind::Class));
    EXPECT_FALSE(isFunctionFrame(FrameKind::Class));
    EXPECT_TRUE(isFunctionFrame(FrameKind::Lambda));
}

TEST(TraversalTest, ModuleLevelContext) {
    auto samples = sampleContext("x = marker\n");
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_EQ(samples[0].blockDepth, 0u);
    EXPECT_EQ(samples[0].functionDepth, 0u);
    EXPECT_FALSE(samples[0].insideFunction);
    EXPECT_EQ(samples[0].parent, NodeKind::Assign);
    EXPECT_EQ(samples[0].scope, FrameKind::Module);
}

TEST(TraversalTest, BlockDepthCountsControlBlocks) {
    auto samples = sampleContext("def f(items):\n"
                                 "    for item in items:\n"
                                 "        if item:\n"
                                 "            with ctx():\n"
                                 "                marker\n");
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_EQ(samples[0].blockDepth, 3u);
    EXPECT_EQ(samples[0].functionDepth, 1u);
    EXPECT_TRUE(samples[0].insideLoop);
    EXPECT_EQ(samples[0].scope, FrameKind::Function);
    EXPECT_EQ(samples[0].parent, NodeKind::ExprStmt);
}

TEST(TraversalTest, ElifDoesNotDeepenNesting) {
    auto samples = sampleContext("if a:\n"
                                 "    pass\n"
                                 "elif b:\n"
                                 "    pass\n"
                                 "elif c:\n"
                                 "    marker\n");
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_EQ(samples[0].blockDepth, 1u);
}

TEST(TraversalTest, LoopHeaderIsOutsideTheLoop) {
    auto samples = sampleContext("for marker in range(3):\n"
                                 "    marker\n");
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_FALSE(samples[0].insideLoop);
    EXPECT_TRUE(samples[1].insideLoop);
    ASSERT_EQ(samples[1].loopNames.size(), 1u);
    EXPECT_EQ(samples[1].loopNames[0], "marker");
}

TEST(TraversalTest, GuardedContextStopsAtFunctionBoundary) {
    auto samples = sampleContext("try:\n"
                                 "    marker\n"
                                 "    def inner():\n"
                                 "        marker\n"
                                 "finally:\n"
                                 "    marker\n");
    ASSERT_EQ(samples.size(), 3u);
    EXPECT_TRUE(samples[0].guarded);
    EXPECT_FALSE(samples[1].guarded);
    EXPECT_EQ(samples[1].scope, FrameKind::Function);
    EXPECT_FALSE(samples[2].guarded);
    EXPECT_TRUE(samples[2].inFinally);
}

TEST(TraversalTest, WithItemCoversOnlyTheContextExpression) {
    auto samples = sampleContext("with open(marker) as f:\n"
                                 "    marker\n");
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_TRUE(samples[0].inWithItem);
    EXPECT_EQ(samples[0].parent, NodeKind::Call);
    EXPECT_FALSE(samples[1].inWithItem);
}

TEST(TraversalTest, ComprehensionScopesItsTargets) {
    auto samples = sampleContext("result = [marker for x in marker if x]\n");
    ASSERT_EQ(samples.size(), 2u);
    // The first iterable is evaluated outside the comprehension.
    EXPECT_FALSE(samples[0].insideLoop);
    EXPECT_TRUE(samples[1].insideLoop);
    ASSERT_EQ(samples[1].loopNames.size(), 1u);
    EXPECT_EQ(samples[1].loopNames[0], "x");
}

TEST(TraversalTest, DefaultsEvaluateInEnclosingScope) {
    auto samples = sampleContext("def f(a=marker):\n"
                                 "    return lambda: marker\n");
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_EQ(samples[0].scope, FrameKind::Module);
    EXPECT_EQ(samples[0].functionDepth, 0u);
    EXPECT_EQ(samples[1].scope, FrameKind::Lambda);
    EXPECT_EQ(samples[1].functionDepth, 1u);
    EXPECT_TRUE(samples[1].insideFunction);
}

TEST(TraversalTest, FailingRuleDoesNotStopTheWalk) {
    auto findings = scan("def f(x=[]):\n"
                         "    return explode\n");
    EXPECT_TRUE(hasCode(findings, "R001"));
}

TEST(TraversalTest, LongSnippetIsCutOnACodePoint) {
    std::string line = "def f(x=[]): return x  # ";
    line += std::string(116 - line.size(), 'a');
    std::string accented;
    for (int i = 0; i < 10; ++i)
        accented += "\xC3\xA9";
    auto findings = scan(line + accented + "\n");
    const Finding *f = findCode(findings, "R001");
    ASSERT_NE(f, nullptr);
    EXPECT_EQ(f->snippet, line + "...");
}

TEST(TraversalTest, CollectBoundNames) {
    auto tree = python::parseModule("a, (b, *c), d.e = value\n");
    ASSERT_TRUE(static_cast<bool>(tree)) << llvm::toString(tree.takeError());
    const Node *assign = tree->root()->body.front();
    std::vector<std::string> names;
    collectBoundNames(assign->targets.front(), names);
    std::vector<std::string> expected = {"a", "b", "c"};
    EXPECT_EQ(names, expected);
}

TEST(TraversalTest, DispatchTableFollowsInterests) {
    HazardWalker walker(RuleRegistry::instance(), Config::defaults());
    EXPECT_GT(walker.ruleCount(NodeKind::Call), 10u);
    EXPECT_GE(walker.ruleCount(NodeKind::Name), 2u);
    EXPECT_EQ(walker.ruleCount(NodeKind::Slice), 0u);
}

TEST(TraversalTest, CatalogueIsComplete) {
    std::set<std::string> codes;
    std::set<std::string> ids;
    for (const auto &rule : RuleRegistry::instance().rules()) {
        if (rule->getCode().front() == 'X')
            continue;
        codes.insert(std::string(rule->getCode()));
        ids.insert(std::string(rule->getID()));
    }
    EXPECT_EQ(codes.size(), 63u);
    EXPECT_EQ(ids.size(), 63u);
    for (const char *prefix : {"R", "P", "C", "S", "O", "M", "G"})
        EXPECT_TRUE(codes.count(std::string(prefix) + "001")) << prefix;

    const Rule *byId = RuleRegistry::instance().findByID("mutable-default");
    ASSERT_NE(byId, nullptr);
    EXPECT_EQ(byId->getCode(), "R001");
    EXPECT_EQ(RuleRegistry::instance().findByID("R001"), byId);
    EXPECT_EQ(RuleRegistry::instance().findByID("no-such-rule"), nullptr);
}

TEST(TraversalTest, CatalogueIsOrderedByCode) {
    auto catalogue = RuleRegistry::instance().catalogue();
    ASSERT_EQ(catalogue.size(), RuleRegistry::instance().size());
    for (size_t i = 1; i < catalogue.size(); ++i)
        EXPECT_LT(catalogue[i - 1]->getCode(), catalogue[i]->getCode());
    EXPECT_EQ(catalogue.front()->getCode(), "C001");
}

TEST(TraversalTest, DuplicateRegistrationIsRejected) {
    size_t before = RuleRegistry::instance().size();
    EXPECT_FALSE(RuleRegistry::instance().registerRule(std::make_unique<X901_ContextRecorder>()));
    EXPECT_EQ(RuleRegistry::instance().size(), before);
}
