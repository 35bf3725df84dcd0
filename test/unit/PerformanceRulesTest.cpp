#include "TestSupport.h"

#include <gtest/gtest.h>

using namespace pyhazard;
using namespace pyhazard::test;

TEST(PerformanceRulesTest, StringConcatenationInLoop) {
    auto findings = scan("def render(rows):\n"
                         "    html = ''\n"
                         "    for row in rows:\n"
                         "        html += row\n"
                         "    return html\n");
    ASSERT_EQ(countCode(findings, "P001"), 1u);
    EXPECT_EQ(findCode(findings, "P001")->location.line, 4u);
    EXPECT_EQ(findCode(findings, "P001")->severity, Severity::Medium);
}

TEST(PerformanceRulesTest, StringConcatenationDetectedFromValue) {
    auto literal = scan("def f(n):\n"
                        "    out = make()\n"
                        "    while n:\n"
                        "        out += '-'\n"
                        "        n -= 1\n");
    EXPECT_TRUE(hasCode(literal, "P001"));

    auto converted = scan("def f(items):\n"
                          "    out = make()\n"
                          "    for i in items:\n"
                          "        out += str(i)\n");
    EXPECT_TRUE(hasCode(converted, "P001"));
}

TEST(PerformanceRulesTest, NumericAccumulationIsFine) {
    auto findings = scan("def total(values):\n"
                         "    acc = 0\n"
                         "    for v in values:\n"
                         "        acc += v\n"
                         "    return acc\n");
    EXPECT_FALSE(hasCode(findings, "P001"));

    auto outside = scan("s = ''\ns += 'x'\n");
    EXPECT_FALSE(hasCode(outside, "P001"));
}

TEST(PerformanceRulesTest, ListMembershipTest) {
    EXPECT_TRUE(hasCode(scan("ok = x in [1, 2, 3]\n"), "P002"));
    EXPECT_TRUE(hasCode(scan("ok = x not in ['a', 'b', 'c', 'd']\n"), "P002"));
    EXPECT_TRUE(hasCode(scan("ok = x in [y for y in ys]\n"), "P002"));
    EXPECT_FALSE(hasCode(scan("ok = x in [1, 2]\n"), "P002"));
    EXPECT_FALSE(hasCode(scan("ok = x in {1, 2, 3}\n"), "P002"));
}

TEST(PerformanceRulesTest, RangeLenLoop) {
    auto findings = scan("for i in range(len(items)):\n"
                         "    print(items[i])\n"
                         "squares = [items[i] ** 2 for i in range(len(items))]\n");
    EXPECT_EQ(countCode(findings, "P003"), 2u);
    EXPECT_FALSE(hasCode(scan("for i in range(0, len(items)):\n    pass\n"), "P003"));
}

TEST(PerformanceRulesTest, DictKeysIteration) {
    EXPECT_TRUE(hasCode(scan("for k in config.keys():\n    print(k)\n"), "P004"));
    EXPECT_TRUE(hasCode(scan("ks = {k for k in d.keys()}\n"), "P004"));
    EXPECT_FALSE(hasCode(scan("for k in config:\n    print(k)\n"), "P004"));
    EXPECT_FALSE(hasCode(scan("for k in store.keys('prefix'):\n    print(k)\n"),
                         "P004"));
}

TEST(PerformanceRulesTest, RegexCompileInLoop) {
    auto findings = scan("import re\n"
                         "def match_all(lines):\n"
                         "    for line in lines:\n"
                         "        pat = re.compile(r'\\d+')\n"
                         "        pat.match(line)\n");
    EXPECT_TRUE(hasCode(findings, "P005"));

    auto comprehension = scan("import re\n"
                              "pats = [re.compile(p) for p in raw]\n");
    EXPECT_TRUE(hasCode(comprehension, "P005"));

    auto hoisted = scan("import re\n"
                        "PAT = re.compile(r'\\d+')\n"
                        "def match_all(lines):\n"
                        "    return [PAT.match(l) for l in lines]\n");
    EXPECT_FALSE(hasCode(hoisted, "P005"));
}

TEST(PerformanceRulesTest, DeepcopyInLoop) {
    auto findings = scan("import copy\n"
                         "from copy import deepcopy\n"
                         "for item in items:\n"
                         "    a = copy.deepcopy(item)\n"
                         "    b = deepcopy(item)\n");
    EXPECT_EQ(countCode(findings, "P006"), 2u);
    EXPECT_FALSE(hasCode(scan("import copy\nsnapshot = copy.deepcopy(state)\n"), "P006"));
}

TEST(PerformanceRulesTest, ImportInLoop) {
    auto findings = scan("for name in plugins:\n"
                         "    import importlib\n"
                         "    from os import path\n"
                         "    importlib.import_module(name)\n"
                         "    path.join(name)\n");
    EXPECT_EQ(countCode(findings, "P007"), 2u);

    auto nestedFunction = scan("for name in plugins:\n"
                               "    def load():\n"
                               "        import json\n"
                               "        return json\n");
    EXPECT_FALSE(hasCode(nestedFunction, "P007"));
}

TEST(PerformanceRulesTest, UnnecessaryListComprehension) {
    auto findings = scan("total = sum([x * 2 for x in xs])\n");
    ASSERT_TRUE(hasCode(findings, "P008"));
    EXPECT_NE(findCode(findings, "P008")->message.find("sum()"), std::string::npos);

    EXPECT_TRUE(hasCode(scan("ok = any([x > 0 for x in xs])\n"), "P008"));
    EXPECT_FALSE(hasCode(scan("total = sum(x * 2 for x in xs)\n"), "P008"));
    EXPECT_FALSE(hasCode(scan("first = sorted([x for x in xs])\n"), "P008"));
}
