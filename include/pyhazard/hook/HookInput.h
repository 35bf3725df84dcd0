#pragma once

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <string>

namespace pyhazard {

// The post-tool-use invocation read from stdin.
struct HookInput {
    std::string sessionId;
    std::string cwd;
    std::string hookEventName;
    std::string toolName;
    std::string filePath;               // tool_input.file_path
    bool success = true;                // tool_response.success; absent means true
};

// Fails with an Input error on malformed JSON, a non-object document or a
// missing tool_name.
llvm::Expected<HookInput> parseHookInput(llvm::StringRef json);

// Write, Edit and MultiEdit produce source files worth scanning.
bool isFileEditTool(llvm::StringRef toolName);

// A successful file edit naming a path.
bool shouldAnalyze(const HookInput &input);

} // namespace pyhazard
