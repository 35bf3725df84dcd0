#include "pyhazard/output/Reporter.h"
#include "pyhazard/policy/RiskAggregator.h"

#include <llvm/Support/Path.h>

#include <set>
#include <sstream>

namespace pyhazard {

namespace {

std::string_view categoryTip(Category c) {
    switch (c) {
        case Category::Runtime:
            return "Default mutable arguments to None and raise explicit "
                   "exceptions instead of relying on assert.";
        case Category::Performance:
            return "Hoist invariant work (imports, regex compilation, copies) "
                   "out of loops and prefer sets for membership tests.";
        case Category::Complexity:
            return "Keep functions short and flat: guard clauses, small "
                   "helpers and few parameters.";
        case Category::Security:
            return "Never build queries or shell commands from strings; keep "
                   "secrets out of source and use the secrets module.";
        case Category::Organization:
            return "One import per line, no wildcard imports, and no dead or "
                   "duplicate definitions.";
        case Category::Resource:
            return "Manage files, locks and connections with 'with', and set "
                   "timeouts on network calls.";
        case Category::Gotcha:
            return "Compare values with ==, singletons with 'is', and never "
                   "silence exceptions with a bare pass.";
    }
    return {};
}

void writeFinding(std::ostringstream &os, const Finding &f) {
    os << "  " << f.ruleCode << ":" << severityToString(f.severity) << " ["
       << f.ruleID << "] line " << f.location.line << ": " << f.message << "\n";
    if (!f.suggestion.empty())
        os << "    Fix: " << f.suggestion << "\n";
    if (!f.snippet.empty())
        os << "    > " << f.snippet << "\n";
}

std::string summaryLine(const std::vector<Finding> &findings) {
    SeverityCounts counts = countBySeverity(findings);
    std::ostringstream os;
    os << findings.size() << (findings.size() == 1 ? " issue" : " issues")
       << " found:";
    bool first = true;
    for (Severity s : kAllSeverities) {
        if (counts[s] == 0)
            continue;
        os << (first ? " " : ", ") << counts[s] << " " << severityToString(s);
        first = false;
    }
    return os.str();
}

} // anonymous namespace

std::string formatWarnReport(const std::vector<Finding> &findings,
                             llvm::StringRef filePath, const Config &cfg) {
    if (findings.empty())
        return {};

    std::ostringstream os;
    os << "⚠️ Python antipatterns detected in "
       << llvm::sys::path::filename(filePath).str() << " (" << filePath.str()
       << ")\n";
    os << summaryLine(findings) << "\n";

    size_t shown = 0;
    size_t limit = cfg.maxIssues;
    for (Severity s : kAllSeverities) {
        bool header = false;
        for (const auto &f : findings) {
            if (f.severity != s || shown >= limit)
                continue;
            if (!header) {
                os << "\n" << severityToString(s) << ":\n";
                header = true;
            }
            writeFinding(os, f);
            ++shown;
        }
    }
    if (shown < findings.size())
        os << "\n... and " << findings.size() - shown << " more\n";

    if (cfg.includeTips) {
        std::set<Category> present;
        for (const auto &f : findings)
            present.insert(f.category);
        os << "\nBest Practices:\n";
        for (Category c : present)
            os << "  - " << categoryToString(c) << ": " << categoryTip(c) << "\n";
    }
    return os.str();
}

std::string formatBlockReason(const std::vector<Finding> &findings,
                              llvm::StringRef filePath) {
    std::vector<const Finding *> critical;
    for (const auto &f : findings) {
        if (f.severity == Severity::Critical)
            critical.push_back(&f);
    }
    if (critical.empty())
        return {};

    std::ostringstream os;
    os << "🚫 Critical issue" << (critical.size() == 1 ? "" : "s") << " in "
       << llvm::sys::path::filename(filePath).str()
       << " must be fixed before continuing:\n";
    for (const Finding *f : critical) {
        os << "- " << f->ruleCode << " [" << f->ruleID << "] line "
           << f->location.line << ": " << f->message << "\n";
        if (!f->suggestion.empty())
            os << "  Fix: " << f->suggestion << "\n";
    }
    return os.str();
}

} // namespace pyhazard
