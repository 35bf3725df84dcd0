#pragma once

#include "pyhazard/core/Severity.h"

#include <string>

namespace pyhazard {

struct SourceLocation {
    unsigned line   = 0; // 1-based
    unsigned column = 0; // 0-based, counted in bytes
};

struct Finding {
    std::string    ruleID;     // stable slug, e.g. "mutable-default"
    std::string    ruleCode;   // catalogue code, e.g. "R001"
    Category       category    = Category::Runtime;
    Severity       severity    = Severity::Low;
    SourceLocation location;
    std::string    message;
    std::string    suggestion;
    std::string    snippet;    // trimmed source line, may be empty
};

} // namespace pyhazard
