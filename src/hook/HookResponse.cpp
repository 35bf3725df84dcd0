#include "pyhazard/hook/HookResponse.h"

#include <llvm/Support/raw_ostream.h>

namespace pyhazard {

namespace {

llvm::json::Object specificOutput(llvm::StringRef eventName, llvm::StringRef report) {
    return llvm::json::Object{
        {"hookEventName", eventName.str()},
        {"additionalContext", report.str()},
    };
}

} // anonymous namespace

llvm::json::Value silentResponse() {
    return llvm::json::Object{{"suppressOutput", true}};
}

llvm::json::Value makeHookResponse(Decision decision, llvm::StringRef eventName,
                                   llvm::StringRef report, llvm::StringRef reason) {
    switch (decision) {
        case Decision::Silent:
            return silentResponse();
        case Decision::Warn:
            return llvm::json::Object{
                {"hookSpecificOutput", specificOutput(eventName, report)},
                {"suppressOutput", true},
            };
        case Decision::Block:
            return llvm::json::Object{
                {"decision", "block"},
                {"reason", reason.str()},
                {"hookSpecificOutput", specificOutput(eventName, report)},
            };
    }
    return silentResponse();
}

std::string serialize(const llvm::json::Value &response) {
    std::string out;
    llvm::raw_string_ostream os(out);
    os << response;
    os.flush();
    return out;
}

} // namespace pyhazard
