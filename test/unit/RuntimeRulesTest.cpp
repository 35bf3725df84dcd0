#include "TestSupport.h"

#include <gtest/gtest.h>

using namespace pyhazard;
using namespace pyhazard::test;

TEST(RuntimeRulesTest, MutableDefaultIsTheOnlyFinding) {
    auto findings = scan("def add_item(item, items=[]):\n"
                         "    items.append(item)\n"
                         "    return items\n");
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].ruleCode, "R001");
    EXPECT_EQ(findings[0].ruleID, "mutable-default");
    EXPECT_EQ(findings[0].severity, Severity::High);
    EXPECT_EQ(findings[0].location.line, 1u);
    EXPECT_NE(findings[0].message.find("items"), std::string::npos);
    EXPECT_EQ(findings[0].snippet, "def add_item(item, items=[]):");
}

TEST(RuntimeRulesTest, MutableDefaultVariants) {
    EXPECT_TRUE(hasCode(scan("def f(x={}):\n    return x\n"), "R001"));
    EXPECT_TRUE(hasCode(scan("def f(x=set()):\n    return x\n"), "R001"));
    EXPECT_TRUE(hasCode(scan("def f(*, x=dict()):\n    return x\n"), "R001"));
    EXPECT_TRUE(hasCode(scan("g = lambda acc=[]: acc\n"), "R001"));
    EXPECT_FALSE(hasCode(scan("def f(x=None, y=(), z='s'):\n    return x\n"), "R001"));
}

TEST(RuntimeRulesTest, AsyncMutableDefaultAlsoFlagsConcatenation) {
    auto findings = scan("async def fetch_all(urls, results=[]):\n"
                         "    try:\n"
                         "        out = ''\n"
                         "        for u in urls:\n"
                         "            out += u\n"
                         "        return out\n"
                         "    except ValueError as exc:\n"
                         "        logger.error(exc)\n");
    EXPECT_TRUE(hasCode(findings, "R001"));
    EXPECT_TRUE(hasCode(findings, "P001"));
}

TEST(RuntimeRulesTest, EvalAndExec) {
    auto findings = scan("value = eval(text)\nexec(code)\nast.literal_eval(text)\n");
    EXPECT_EQ(countCode(findings, "R002"), 2u);
}

TEST(RuntimeRulesTest, BareExcept) {
    auto findings = scan("try:\n    run()\nexcept:\n    logger.exception('x')\n");
    ASSERT_TRUE(hasCode(findings, "R003"));
    EXPECT_EQ(findCode(findings, "R003")->location.line, 3u);
    EXPECT_FALSE(hasCode(scan("try:\n    run()\nexcept OSError:\n    log.error('x')\n"),
                         "R003"));
}

TEST(RuntimeRulesTest, AssertSkippedInTestFiles) {
    const char *src = "def check(x):\n    assert x > 0\n    return x\n";
    EXPECT_TRUE(hasCode(scan(src), "R004"));
    EXPECT_FALSE(hasCode(scan(src, Config::defaults(), "/project/tests/test_x.py"),
                         "R004"));
}

TEST(RuntimeRulesTest, GlobalOnlyInsideFunctions) {
    auto findings = scan("counter = 0\n"
                         "global counter\n"
                         "def bump():\n"
                         "    global counter\n"
                         "    counter += 1\n");
    ASSERT_EQ(countCode(findings, "R005"), 1u);
    EXPECT_EQ(findCode(findings, "R005")->location.line, 4u);
}

TEST(RuntimeRulesTest, MutableClassAttribute) {
    auto findings = scan("class Registry:\n"
                         "    items = []\n"
                         "    names: dict = {}\n"
                         "    __slots__ = []\n"
                         "    limit = 10\n");
    EXPECT_EQ(countCode(findings, "R006"), 2u);
}

TEST(RuntimeRulesTest, ControlFlowInFinally) {
    auto findings = scan("def f():\n"
                         "    try:\n"
                         "        return work()\n"
                         "    finally:\n"
                         "        return None\n");
    EXPECT_EQ(countCode(findings, "R007"), 1u);

    auto loopInside = scan("def g(items):\n"
                           "    try:\n"
                           "        pass\n"
                           "    finally:\n"
                           "        for i in items:\n"
                           "            if i:\n"
                           "                break\n");
    EXPECT_FALSE(hasCode(loopInside, "R007"));

    auto loopOutside = scan("def h(items):\n"
                            "    for i in items:\n"
                            "        try:\n"
                            "            pass\n"
                            "        finally:\n"
                            "            continue\n");
    EXPECT_TRUE(hasCode(loopOutside, "R007"));
}

TEST(RuntimeRulesTest, ShadowedBuiltin) {
    auto findings = scan("list = [1, 2]\n"
                         "def process(id, data):\n"
                         "    return data\n"
                         "class Model:\n"
                         "    id = 0\n"
                         "    def filter(self):\n"
                         "        return self\n");
    ASSERT_EQ(countCode(findings, "R008"), 2u);
}

TEST(RuntimeRulesTest, EqWithoutHash) {
    const char *missing = "class Point:\n"
                          "    def __eq__(self, other):\n"
                          "        return self.x == other.x\n";
    EXPECT_TRUE(hasCode(scan(missing), "R009"));

    const char *explicitNone = "class Point:\n"
                               "    __hash__ = None\n"
                               "    def __eq__(self, other):\n"
                               "        return self.x == other.x\n";
    EXPECT_FALSE(hasCode(scan(explicitNone), "R009"));
}

TEST(RuntimeRulesTest, RaiseWithoutFrom) {
    auto findings = scan("try:\n"
                         "    load()\n"
                         "except KeyError as err:\n"
                         "    logger.error(err)\n"
                         "    raise ConfigError('missing')\n");
    EXPECT_TRUE(hasCode(findings, "R010"));

    auto chained = scan("try:\n"
                        "    load()\n"
                        "except KeyError as err:\n"
                        "    logger.error(err)\n"
                        "    raise ConfigError('missing') from err\n");
    EXPECT_FALSE(hasCode(chained, "R010"));

    auto reraise = scan("try:\n"
                        "    load()\n"
                        "except KeyError as err:\n"
                        "    logger.error(err)\n"
                        "    raise err\n");
    EXPECT_FALSE(hasCode(reraise, "R010"));
}

TEST(RuntimeRulesTest, HandlerWithoutLogging) {
    auto silent = scan("try:\n    run()\nexcept ValueError:\n    result = None\n");
    EXPECT_TRUE(hasCode(silent, "R011"));

    auto logged = scan("def handle():\n"
                       "    try:\n"
                       "        run()\n"
                       "    except ValueError as exc:\n"
                       "        logger.error('failed: %s', exc)\n");
    EXPECT_FALSE(hasCode(logged, "R011"));

    auto printed = scan("try:\n    run()\nexcept ValueError:\n    print('failed')\n");
    EXPECT_FALSE(hasCode(printed, "R011"));
}

TEST(RuntimeRulesTest, ReturnValueInInit) {
    auto findings = scan("class Conn:\n"
                         "    def __init__(self, url):\n"
                         "        self.url = url\n"
                         "        return self\n");
    EXPECT_TRUE(hasCode(findings, "R012"));

    auto bare = scan("class Conn:\n"
                     "    def __init__(self, url):\n"
                     "        if not url:\n"
                     "            return\n"
                     "        self.url = url\n");
    EXPECT_FALSE(hasCode(bare, "R012"));

    auto nested = scan("class Conn:\n"
                       "    def __init__(self):\n"
                       "        def helper():\n"
                       "            return 1\n"
                       "        self.value = helper()\n");
    EXPECT_FALSE(hasCode(nested, "R012"));
}

TEST(RuntimeRulesTest, CleanCodeProducesFewFindings) {
    EXPECT_TRUE(scan("").empty());
    auto findings = scan("def add(a, b):\n"
                         "    return a + b\n"
                         "result = add(1, 2)\n");
    EXPECT_LE(findings.size(), 1u);
}
