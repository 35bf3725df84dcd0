#pragma once

#include "pyhazard/core/Severity.h"

#include <llvm/ADT/STLFunctionalExtras.h>
#include <llvm/ADT/StringRef.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pyhazard {

// Returns the value of an environment variable, or nullopt when unset.
using EnvLookup = llvm::function_ref<std::optional<std::string>(llvm::StringRef)>;

struct Config {
    // Engine switch
    bool enabled                = true;

    // Policy
    std::set<Severity> enabledSeverities = {
        Severity::Critical, Severity::High, Severity::Medium, Severity::Low,
    };
    std::vector<std::string> disabledRules; // ids or codes
    bool blockOnCritical        = true;

    // Reporting
    unsigned maxIssues          = 10;
    bool includeTips            = true;
    bool debug                  = false;

    // Loader
    size_t maxLines             = 10000;
    uint64_t maxBytes           = 2 * 1024 * 1024;
    std::vector<std::string> extensions = {".py", ".pyi"};

    // Thresholds
    unsigned complexityThreshold = 10;  // C003
    unsigned maxParameters       = 5;   // C004
    unsigned maxFunctionLines    = 50;  // C010
    unsigned maxNestingDepth     = 4;   // C001
    unsigned maxReturns          = 6;   // C002
    unsigned maxMethods          = 20;  // C009
    unsigned maxBoolOperands     = 4;   // C008
    unsigned maxFunctionNesting  = 2;   // C006

    bool isSeverityEnabled(Severity s) const {
        return enabledSeverities.count(s) != 0;
    }

    bool isRuleDisabled(llvm::StringRef id, llvm::StringRef code) const;

    static Config defaults();
    static Config loadFromFile(const std::string &path);

    // Applies PYHAZARD_* variables on top of `base`. PYHAZARD_CONFIG, if
    // set, names a YAML file that is layered between `base` and the
    // environment.
    static Config loadFromEnvironment(EnvLookup env, Config base = defaults());
};

// Helpers shared with the command line.
std::optional<bool> parseBool(llvm::StringRef s);
std::vector<std::string> splitList(llvm::StringRef s);

} // namespace pyhazard
