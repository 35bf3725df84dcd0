#include "pyhazard/core/Error.h"
#include "pyhazard/hook/HookInput.h"
#include "pyhazard/hook/HookResponse.h"

#include <gtest/gtest.h>
#include <llvm/Support/JSON.h>

using namespace pyhazard;

namespace {

ErrorKind kindOf(llvm::Error err) {
    ErrorKind kind = ErrorKind::Access;
    llvm::handleAllErrors(std::move(err), [&](const AnalysisError &e) { kind = e.kind(); });
    return kind;
}

llvm::json::Object parseObject(const std::string &text) {
    auto doc = llvm::json::parse(text);
    if (!doc) {
        ADD_FAILURE() << llvm::toString(doc.takeError());
        return {};
    }
    if (auto *obj = doc->getAsObject())
        return std::move(*obj);
    ADD_FAILURE() << "not an object: " << text;
    return {};
}

} // anonymous namespace

TEST(HookInputTest, ParsesFullRequest) {
    auto in = parseHookInput(R"({
        "session_id": "abc",
        "transcript_path": "/tmp/t.jsonl",
        "cwd": "/project",
        "hook_event_name": "PostToolUse",
        "tool_name": "Write",
        "tool_input": {"file_path": "/project/app.py", "content": "x = 1\n"},
        "tool_response": {"success": true, "filePath": "/project/app.py"}
    })");
    ASSERT_TRUE(static_cast<bool>(in)) << llvm::toString(in.takeError());
    EXPECT_EQ(in->sessionId, "abc");
    EXPECT_EQ(in->cwd, "/project");
    EXPECT_EQ(in->toolName, "Write");
    EXPECT_EQ(in->filePath, "/project/app.py");
    EXPECT_TRUE(in->success);
    EXPECT_TRUE(shouldAnalyze(*in));
}

TEST(HookInputTest, DefaultsForOptionalFields) {
    auto in = parseHookInput(R"({"tool_name": "Edit", "tool_input": {"file_path": "a.py"}})");
    ASSERT_TRUE(static_cast<bool>(in)) << llvm::toString(in.takeError());
    EXPECT_EQ(in->hookEventName, "PostToolUse");
    EXPECT_TRUE(in->success);
    EXPECT_TRUE(in->cwd.empty());
}

TEST(HookInputTest, FilePathFallsBackToToolResponse) {
    auto in = parseHookInput(
        R"({"tool_name": "MultiEdit", "tool_response": {"filePath": "/p/b.py"}})");
    ASSERT_TRUE(static_cast<bool>(in)) << llvm::toString(in.takeError());
    EXPECT_EQ(in->filePath, "/p/b.py");
    EXPECT_TRUE(shouldAnalyze(*in));
}

TEST(HookInputTest, MalformedInputIsAnInputError) {
    for (const char *text : {"{not json", "[1, 2]", "\"Write\"", R"({"tool_input": {}})"}) {
        auto in = parseHookInput(text);
        ASSERT_FALSE(static_cast<bool>(in)) << text;
        EXPECT_EQ(kindOf(in.takeError()), ErrorKind::Input) << text;
    }
}

TEST(HookInputTest, FailedToolIsNotAnalyzed) {
    auto in = parseHookInput(R"({"tool_name": "Write",
        "tool_input": {"file_path": "/p/a.py"},
        "tool_response": {"success": false}})");
    ASSERT_TRUE(static_cast<bool>(in)) << llvm::toString(in.takeError());
    EXPECT_FALSE(in->success);
    EXPECT_FALSE(shouldAnalyze(*in));
}

TEST(HookInputTest, OnlyFileEditToolsAreAnalyzed) {
    EXPECT_TRUE(isFileEditTool("Write"));
    EXPECT_TRUE(isFileEditTool("Edit"));
    EXPECT_TRUE(isFileEditTool("MultiEdit"));
    EXPECT_FALSE(isFileEditTool("Read"));
    EXPECT_FALSE(isFileEditTool("Bash"));
    EXPECT_FALSE(isFileEditTool("write"));

    HookInput noPath;
    noPath.toolName = "Write";
    EXPECT_FALSE(shouldAnalyze(noPath));
}

TEST(HookResponseTest, Silent) {
    llvm::json::Object obj = parseObject(serialize(silentResponse()));
    EXPECT_TRUE(obj.getBoolean("suppressOutput").getValueOr(false));
    EXPECT_EQ(obj.size(), 1u);

    llvm::json::Object same = parseObject(
        serialize(makeHookResponse(Decision::Silent, "PostToolUse", "ignored", "ignored")));
    EXPECT_EQ(same.size(), 1u);
}

TEST(HookResponseTest, Warn) {
    llvm::json::Object obj = parseObject(
        serialize(makeHookResponse(Decision::Warn, "PostToolUse", "report text", "")));
    EXPECT_TRUE(obj.getBoolean("suppressOutput").getValueOr(false));
    EXPECT_EQ(obj.get("decision"), nullptr);
    const llvm::json::Object *specific = obj.getObject("hookSpecificOutput");
    ASSERT_NE(specific, nullptr);
    EXPECT_EQ(specific->getString("hookEventName").getValueOr(""), "PostToolUse");
    EXPECT_EQ(specific->getString("additionalContext").getValueOr(""), "report text");
}

TEST(HookResponseTest, Block) {
    llvm::json::Object obj = parseObject(serialize(
        makeHookResponse(Decision::Block, "PostToolUse", "report text", "fix S001")));
    EXPECT_EQ(obj.getString("decision").getValueOr(""), "block");
    EXPECT_EQ(obj.getString("reason").getValueOr(""), "fix S001");
    EXPECT_EQ(obj.get("suppressOutput"), nullptr);
    const llvm::json::Object *specific = obj.getObject("hookSpecificOutput");
    ASSERT_NE(specific, nullptr);
    EXPECT_EQ(specific->getString("additionalContext").getValueOr(""), "report text");
}

TEST(HookResponseTest, SerializedTextIsEscaped) {
    std::string text = serialize(
        makeHookResponse(Decision::Warn, "PostToolUse", "line \"one\"\n⚠️ two", ""));
    llvm::json::Object obj = parseObject(text);
    const llvm::json::Object *specific = obj.getObject("hookSpecificOutput");
    ASSERT_NE(specific, nullptr);
    EXPECT_EQ(specific->getString("additionalContext").getValueOr(""),
              "line \"one\"\n⚠️ two");
}
