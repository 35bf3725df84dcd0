#pragma once

#include "pyhazard/core/Config.h"
#include "pyhazard/core/Finding.h"

#include <llvm/ADT/StringRef.h>

#include <string>
#include <vector>

namespace pyhazard {

// Human-readable payloads handed back to the hook caller. Both expect
// findings already ordered by the aggregator.

// Grouped-by-severity feedback; empty when there is nothing to report.
// At most cfg.maxIssues findings are listed.
std::string formatWarnReport(const std::vector<Finding> &findings,
                             llvm::StringRef filePath, const Config &cfg);

// Reason text built from the CRITICAL findings only; empty when none.
std::string formatBlockReason(const std::vector<Finding> &findings,
                              llvm::StringRef filePath);

} // namespace pyhazard
