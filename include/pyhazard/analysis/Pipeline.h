#pragma once

#include "pyhazard/analysis/SourceLoader.h"
#include "pyhazard/core/Config.h"
#include "pyhazard/core/Finding.h"
#include "pyhazard/policy/PolicyEngine.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <string>
#include <vector>

namespace pyhazard {

LoadOptions loadOptionsFor(const Config &cfg, llvm::StringRef projectRoot);

// Parses `file` and runs every registered rule over it. Fails with a
// Syntax error when the source does not parse.
llvm::Expected<std::vector<Finding>> analyzeSource(const SourceFile &file,
                                                   const Config &cfg);

// Loader + analyzeSource.
llvm::Expected<std::vector<Finding>> analyzeFile(llvm::StringRef path,
                                                 llvm::StringRef projectRoot,
                                                 const Config &cfg);

// Aggregation followed by the policy decision.
Verdict evaluate(std::vector<Finding> raw, const Config &cfg);

// Consumes `err`, logging it as a skip when debug output is on.
void reportSkip(llvm::Error err, const Config &cfg);

// Hook driver: request JSON in, response JSON out. Every failure along the
// way resolves to the Silent response. `projectRoot` falls back to the
// request's cwd, then to the working directory.
std::string runHookPipeline(llvm::StringRef request, const Config &cfg,
                            llvm::StringRef projectRoot);

} // namespace pyhazard
