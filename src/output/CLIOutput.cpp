#include "pyhazard/output/OutputFormatter.h"

#include <sstream>

namespace pyhazard {

std::string CLIOutputFormatter::format(const std::vector<FileReport> &reports) {
    std::ostringstream os;
    size_t total = 0;
    size_t skipped = 0;

    for (const auto &r : reports) {
        if (!r.skipReason.empty()) {
            os << r.path << ": skipped: " << r.skipReason << "\n\n";
            ++skipped;
            continue;
        }
        for (const auto &f : r.findings) {
            os << r.path << ":" << f.location.line << ":" << f.location.column
               << ": ";
            os << "[" << severityToString(f.severity) << "] " << f.ruleCode
               << " " << f.ruleID << ": " << f.message << "\n";
            if (!f.snippet.empty())
                os << "  > " << f.snippet << "\n";
            if (!f.suggestion.empty())
                os << "  Fix: " << f.suggestion << "\n";
            os << "  Category: " << categoryToString(f.category) << "\n";
            os << "\n";
        }
        total += r.findings.size();
    }

    if (total == 0)
        os << "pyhazard: no antipatterns detected";
    else
        os << "pyhazard: " << total << " finding(s) detected";
    os << " in " << reports.size() - skipped << " file(s)";
    if (skipped)
        os << ", " << skipped << " skipped";
    os << ".\n";

    return os.str();
}

} // namespace pyhazard
