#include "pyhazard/core/Severity.h"

#include <llvm/ADT/StringRef.h>

namespace pyhazard {

std::optional<Severity> parseSeverity(std::string_view s) {
    std::string up = llvm::StringRef(s.data(), s.size()).trim().upper();
    if (up == "CRITICAL") return Severity::Critical;
    if (up == "HIGH")     return Severity::High;
    if (up == "MEDIUM")   return Severity::Medium;
    if (up == "LOW" || up == "INFORMATIONAL")
        return Severity::Low;
    return std::nullopt;
}

} // namespace pyhazard
