#include "pyhazard/core/Version.h"
#include "pyhazard/output/OutputFormatter.h"

#include <llvm/Support/FormatVariadic.h>
#include <llvm/Support/JSON.h>
#include <llvm/Support/raw_ostream.h>

namespace pyhazard {

namespace {

llvm::json::Value toJSON(const Finding &f) {
    return llvm::json::Object{
        {"ruleID", f.ruleID},
        {"code", f.ruleCode},
        {"category", std::string(categoryToString(f.category))},
        {"severity", std::string(severityToString(f.severity))},
        {"location", llvm::json::Object{
                         {"line", static_cast<int64_t>(f.location.line)},
                         {"column", static_cast<int64_t>(f.location.column)},
                     }},
        {"message", f.message},
        {"suggestion", f.suggestion},
        {"snippet", f.snippet},
    };
}

} // anonymous namespace

std::string JSONOutputFormatter::format(const std::vector<FileReport> &reports) {
    llvm::json::Array files;
    for (const auto &r : reports) {
        llvm::json::Object file{{"path", r.path}};
        if (!r.skipReason.empty()) {
            file["skipped"] = r.skipReason;
        } else {
            llvm::json::Array findings;
            for (const auto &f : r.findings)
                findings.push_back(toJSON(f));
            file["findings"] = std::move(findings);
        }
        files.push_back(std::move(file));
    }

    llvm::json::Value root = llvm::json::Object{
        {"version", kToolVersion},
        {"files", std::move(files)},
    };

    std::string out;
    llvm::raw_string_ostream os(out);
    os << llvm::formatv("{0:2}", root) << "\n";
    os.flush();
    return out;
}

} // namespace pyhazard
