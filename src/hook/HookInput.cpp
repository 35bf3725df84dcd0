#include "pyhazard/hook/HookInput.h"
#include "pyhazard/core/Error.h"

#include <llvm/ADT/StringSwitch.h>
#include <llvm/Support/JSON.h>

namespace pyhazard {

namespace {

std::string stringField(const llvm::json::Object &obj, llvm::StringRef key) {
    if (auto s = obj.getString(key))
        return s->str();
    return {};
}

} // anonymous namespace

llvm::Expected<HookInput> parseHookInput(llvm::StringRef json) {
    auto doc = llvm::json::parse(json);
    if (!doc) {
        std::string detail = llvm::toString(doc.takeError());
        return makeError(ErrorKind::Input, "malformed hook input: " + detail);
    }
    const llvm::json::Object *root = doc->getAsObject();
    if (!root)
        return makeError(ErrorKind::Input, "hook input is not a JSON object");

    HookInput in;
    auto tool = root->getString("tool_name");
    if (!tool)
        return makeError(ErrorKind::Input, "hook input has no tool_name");
    in.toolName = tool->str();
    in.sessionId = stringField(*root, "session_id");
    in.cwd = stringField(*root, "cwd");
    in.hookEventName = stringField(*root, "hook_event_name");
    if (in.hookEventName.empty())
        in.hookEventName = "PostToolUse";

    if (const auto *toolInput = root->getObject("tool_input")) {
        in.filePath = stringField(*toolInput, "file_path");
    }
    if (const auto *response = root->getObject("tool_response")) {
        if (in.filePath.empty())
            in.filePath = stringField(*response, "filePath");
        if (auto ok = response->getBoolean("success"))
            in.success = *ok;
    }
    return in;
}

bool isFileEditTool(llvm::StringRef toolName) {
    return llvm::StringSwitch<bool>(toolName)
        .Cases("Write", "Edit", "MultiEdit", true)
        .Default(false);
}

bool shouldAnalyze(const HookInput &input) {
    return input.success && isFileEditTool(input.toolName) &&
           !input.filePath.empty();
}

} // namespace pyhazard
