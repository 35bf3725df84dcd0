#include "TestSupport.h"

#include "pyhazard/core/Error.h"

#include <gtest/gtest.h>
#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/JSON.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/raw_ostream.h>

#include <string>

using namespace pyhazard;
using namespace pyhazard::test;

namespace {

constexpr const char *kSilent = R"({"suppressOutput":true})";

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_FALSE(llvm::sys::fs::createUniqueDirectory("pyhazard-project", root_));
    }

    void TearDown() override { llvm::sys::fs::remove_directories(root_); }

    std::string write(llvm::StringRef name, llvm::StringRef text) {
        llvm::SmallString<256> path(root_);
        llvm::sys::path::append(path, name);
        std::error_code ec;
        llvm::raw_fd_ostream os(path, ec);
        EXPECT_FALSE(ec) << ec.message();
        os << text;
        return path.str().str();
    }

    static std::string request(llvm::StringRef filePath, llvm::StringRef tool = "Write",
                               llvm::StringRef cwd = "") {
        llvm::json::Object req{
            {"session_id", "test-session"},
            {"hook_event_name", "PostToolUse"},
            {"tool_name", tool.str()},
            {"tool_input", llvm::json::Object{{"file_path", filePath.str()}}},
            {"tool_response", llvm::json::Object{{"success", true}}},
        };
        if (!cwd.empty())
            req["cwd"] = cwd.str();
        std::string out;
        llvm::raw_string_ostream os(out);
        os << llvm::json::Value(std::move(req));
        os.flush();
        return out;
    }

    std::string run(llvm::StringRef filePath, const Config &cfg = Config::defaults()) {
        return runHookPipeline(request(filePath), cfg, root_);
    }

    llvm::SmallString<128> root_;
};

llvm::json::Object parseResponse(const std::string &text) {
    auto doc = llvm::json::parse(text);
    if (!doc) {
        ADD_FAILURE() << llvm::toString(doc.takeError());
        return {};
    }
    if (auto *obj = doc->getAsObject())
        return std::move(*obj);
    ADD_FAILURE() << "response is not an object: " << text;
    return {};
}

std::string additionalContext(const llvm::json::Object &response) {
    if (const auto *specific = response.getObject("hookSpecificOutput"))
        return specific->getString("additionalContext").getValueOr("").str();
    return {};
}

} // anonymous namespace

TEST_F(PipelineTest, MutableDefaultWarns) {
    std::string path = write("scenario_a.py", "def f(x=[]): x.append(1); return x\n");
    llvm::json::Object response = parseResponse(run(path));

    EXPECT_EQ(response.get("decision"), nullptr);
    EXPECT_TRUE(response.getBoolean("suppressOutput").getValueOr(false));
    std::string report = additionalContext(response);
    EXPECT_NE(report.find("1 issue found: 1 HIGH"), std::string::npos) << report;
    EXPECT_NE(report.find("R001:HIGH [mutable-default]"), std::string::npos) << report;
    EXPECT_NE(report.find("scenario_a.py"), std::string::npos);
}

TEST_F(PipelineTest, InjectionBlocks) {
    std::string path =
        write("scenario_b.py", "cursor.execute(f\"SELECT * FROM t WHERE id={user_id}\")\n");
    llvm::json::Object response = parseResponse(run(path));

    EXPECT_EQ(response.getString("decision").getValueOr(""), "block");
    std::string reason = response.getString("reason").getValueOr("").str();
    EXPECT_NE(reason.find("S001 [injection-heuristic] line 1"), std::string::npos) << reason;
    EXPECT_NE(additionalContext(response).find("1 CRITICAL"), std::string::npos);
}

TEST_F(PipelineTest, IssueCapNeverDowngradesBlock) {
    std::string path = write("capped.py",
                             "def a(x=[]): return x\n"
                             "def b(x={}): return x\n"
                             "def c(x=[]): return x\n"
                             "cursor.execute(f\"SELECT * FROM t WHERE id={user_id}\")\n");
    Config cfg = Config::defaults();
    cfg.maxIssues = 1;
    llvm::json::Object response = parseResponse(run(path, cfg));

    EXPECT_EQ(response.getString("decision").getValueOr(""), "block");
    std::string reason = response.getString("reason").getValueOr("").str();
    EXPECT_NE(reason.find("S001 [injection-heuristic] line 4"), std::string::npos) << reason;
    std::string report = additionalContext(response);
    EXPECT_NE(report.find("S001:CRITICAL"), std::string::npos) << report;
    EXPECT_EQ(report.find("R001:HIGH"), std::string::npos) << report;
    EXPECT_NE(report.find("\n... and "), std::string::npos) << report;
    EXPECT_NE(report.find(" more\n"), std::string::npos) << report;
}

TEST_F(PipelineTest, InjectionWarnsWhenBlockingIsOff) {
    std::string path =
        write("scenario_b.py", "cursor.execute(f\"SELECT * FROM t WHERE id={user_id}\")\n");
    Config cfg = Config::defaults();
    cfg.blockOnCritical = false;
    llvm::json::Object response = parseResponse(run(path, cfg));
    EXPECT_EQ(response.get("decision"), nullptr);
    EXPECT_NE(additionalContext(response).find("S001:CRITICAL"), std::string::npos);
}

TEST_F(PipelineTest, LoggingHandlerIsNotReported) {
    std::string path = write("scenario_c.py", "import logging\n"
                                              "logger = logging.getLogger(__name__)\n"
                                              "def load():\n"
                                              "    try:\n"
                                              "        return read_config()\n"
                                              "    except OSError as exc:\n"
                                              "        logger.exception('load failed')\n"
                                              "        raise\n");
    std::string out = run(path);
    EXPECT_EQ(out.find("R011"), std::string::npos) << out;
    EXPECT_EQ(out.find("guarded-block-without-logging"), std::string::npos);
}

TEST_F(PipelineTest, UnguardedAsyncFunctionWarns) {
    std::string path =
        write("scenario_d.py", "async def fetch(url):\n    return await client.get(url)\n");
    llvm::json::Object response = parseResponse(run(path));

    EXPECT_EQ(response.get("decision"), nullptr);
    std::string report = additionalContext(response);
    EXPECT_NE(report.find("M004:MEDIUM"), std::string::npos) << report;
    EXPECT_NE(report.find("1 issue found"), std::string::npos) << report;
}

TEST_F(PipelineTest, CleanFileIsSilent) {
    std::string path = write("clean.py", "def add(a, b):\n    return a + b\n");
    EXPECT_EQ(run(path), kSilent);
}

TEST_F(PipelineTest, OversizedFileIsSilent) {
    std::string text;
    for (int i = 0; i < 20; ++i)
        text += "value = eval(data)\n";
    std::string path = write("huge.py", text);
    Config cfg = Config::defaults();
    cfg.maxLines = 10;
    EXPECT_EQ(run(path, cfg), kSilent);
}

TEST_F(PipelineTest, DisabledEngineIsSilent) {
    std::string path = write("scenario_a.py", "def f(x=[]): x.append(1); return x\n");
    Config cfg = Config::defaults();
    cfg.enabled = false;
    EXPECT_EQ(run(path, cfg), kSilent);
}

TEST_F(PipelineTest, SyntaxErrorIsSilent) {
    std::string path = write("broken.py", "def broken(\n    # never closed\n");
    EXPECT_EQ(run(path), kSilent);

    auto raw = analyzeFile(path, root_, Config::defaults());
    ASSERT_FALSE(static_cast<bool>(raw));
    ErrorKind kind = ErrorKind::Input;
    llvm::handleAllErrors(raw.takeError(), [&](const AnalysisError &e) { kind = e.kind(); });
    EXPECT_EQ(kind, ErrorKind::Syntax);
}

TEST_F(PipelineTest, DeeplyNestedExpressionIsSilent) {
    std::string src = "x = 1";
    for (int i = 0; i < 60000; ++i)
        src += "+1";
    std::string path = write("deep.py", src + "\n");
    EXPECT_EQ(run(path), kSilent);
}

TEST_F(PipelineTest, SeveralAliasedContextManagersStillReport) {
    std::string path = write("multi_with.py",
                             "def load(a, b, user_id):\n"
                             "    with open(a) as f, open(b) as g:\n"
                             "        pass\n"
                             "    cursor.execute(f\"SELECT * FROM t WHERE id={user_id}\")\n");
    llvm::json::Object response = parseResponse(run(path));
    EXPECT_EQ(response.getString("decision").getValueOr(""), "block");
}

TEST_F(PipelineTest, NonEditToolIsSilent) {
    std::string path = write("scenario_a.py", "def f(x=[]): x.append(1); return x\n");
    EXPECT_EQ(runHookPipeline(request(path, "Read"), Config::defaults(), root_), kSilent);
}

TEST_F(PipelineTest, MalformedRequestIsSilent) {
    EXPECT_EQ(runHookPipeline("{oops", Config::defaults(), root_), kSilent);
    EXPECT_EQ(runHookPipeline("", Config::defaults(), root_), kSilent);
}

TEST_F(PipelineTest, FileOutsideRootIsSilent) {
    llvm::SmallString<128> other;
    ASSERT_FALSE(llvm::sys::fs::createUniqueDirectory("pyhazard-elsewhere", other));
    llvm::SmallString<256> path(other);
    llvm::sys::path::append(path, "outside.py");
    {
        std::error_code ec;
        llvm::raw_fd_ostream os(path, ec);
        ASSERT_FALSE(ec) << ec.message();
        os << "def f(x=[]): x.append(1); return x\n";
    }
    EXPECT_EQ(run(path), kSilent);
    llvm::sys::fs::remove_directories(other);
}

TEST_F(PipelineTest, WrongExtensionIsSilent) {
    std::string path = write("script.sh", "eval \"$1\"\n");
    EXPECT_EQ(run(path), kSilent);
}

TEST_F(PipelineTest, RootFallsBackToRequestCwd) {
    write("scenario_a.py", "def f(x=[]): x.append(1); return x\n");
    std::string out = runHookPipeline(request("scenario_a.py", "Edit", root_),
                                      Config::defaults(), "");
    EXPECT_NE(out.find("R001"), std::string::npos) << out;
}

TEST_F(PipelineTest, DisabledRuleIsSilent) {
    std::string path = write("scenario_a.py", "def f(x=[]): x.append(1); return x\n");
    Config cfg = Config::defaults();
    cfg.disabledRules = {"mutable-default"};
    EXPECT_EQ(run(path, cfg), kSilent);
}

TEST_F(PipelineTest, RepeatedRunsAreIdentical) {
    std::string path = write("mixed.py", "import os, sys\n"
                                         "def f(x=[], y={}):\n"
                                         "    if x == None:\n"
                                         "        return eval(y)\n"
                                         "    return sys.argv\n");
    std::string first = run(path);
    EXPECT_NE(first, kSilent);
    EXPECT_EQ(run(path), first);
}

namespace {

std::string samplePath(llvm::StringRef name) {
    llvm::SmallString<256> path(PYHAZARD_SAMPLES_DIR);
    llvm::sys::path::append(path, name);
    return path.str().str();
}

} // anonymous namespace

TEST(SampleTest, OrderServiceHazards) {
    Config cfg = Config::defaults();
    auto raw = analyzeFile(samplePath("order_service.py"), "", cfg);
    ASSERT_TRUE(static_cast<bool>(raw)) << llvm::toString(raw.takeError());

    for (const char *code : {"R001", "R003", "S001", "S003", "S005", "M001", "M006", "G002",
                             "G004", "O002"})
        EXPECT_TRUE(hasCode(*raw, code)) << code;

    Verdict verdict = evaluate(std::move(*raw), cfg);
    EXPECT_EQ(verdict.decision, Decision::Block);
    ASSERT_FALSE(verdict.summary.findings.empty());
    EXPECT_EQ(verdict.summary.findings.front().severity, Severity::Critical);
}

TEST(SampleTest, CleanModuleHasNoFindings) {
    auto raw = analyzeFile(samplePath("clean_module.py"), "", Config::defaults());
    ASSERT_TRUE(static_cast<bool>(raw)) << llvm::toString(raw.takeError());
    for (const auto &f : *raw)
        ADD_FAILURE() << f.ruleCode << " at line " << f.location.line << ": " << f.message;
}
