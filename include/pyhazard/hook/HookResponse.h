#pragma once

#include "pyhazard/policy/PolicyEngine.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/JSON.h>

#include <string>

namespace pyhazard {

// Decision JSON written to stdout:
//   Silent  {"suppressOutput": true}
//   Warn    {"hookSpecificOutput": {...}, "suppressOutput": true}
//   Block   {"decision": "block", "reason": ..., "hookSpecificOutput": {...}}
llvm::json::Value makeHookResponse(Decision decision, llvm::StringRef eventName,
                                   llvm::StringRef report, llvm::StringRef reason);

llvm::json::Value silentResponse();

std::string serialize(const llvm::json::Value &response);

} // namespace pyhazard
