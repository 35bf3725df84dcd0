#pragma once

#include "pyhazard/analysis/Pipeline.h"
#include "pyhazard/analysis/SourceLoader.h"
#include "pyhazard/core/Config.h"
#include "pyhazard/core/Finding.h"

#include <gtest/gtest.h>
#include <llvm/Support/Error.h>

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace pyhazard::test {

// Runs every registered rule over `source` as if it were `path`.
inline std::vector<Finding> scan(std::string_view source,
                                 const Config &cfg = Config::defaults(),
                                 std::string path = "/project/app/module.py") {
    SourceFile file;
    file.path = std::move(path);
    file.content = std::string(source);
    file.lineCount = countLines(file.content);

    auto findings = analyzeSource(file, cfg);
    if (!findings) {
        ADD_FAILURE() << "analysis failed: " << llvm::toString(findings.takeError());
        return {};
    }
    return std::move(*findings);
}

inline size_t countCode(const std::vector<Finding> &findings, std::string_view code) {
    return std::count_if(findings.begin(), findings.end(),
                         [code](const Finding &f) { return f.ruleCode == code; });
}

inline bool hasCode(const std::vector<Finding> &findings, std::string_view code) {
    return countCode(findings, code) != 0;
}

inline const Finding *findCode(const std::vector<Finding> &findings,
                               std::string_view code) {
    auto it = std::find_if(findings.begin(), findings.end(),
                           [code](const Finding &f) { return f.ruleCode == code; });
    return it == findings.end() ? nullptr : &*it;
}

inline Finding makeFinding(std::string code, std::string id, Severity sev,
                           unsigned line, std::string message,
                           Category category = Category::Runtime) {
    Finding f;
    f.ruleCode = std::move(code);
    f.ruleID = std::move(id);
    f.severity = sev;
    f.category = category;
    f.location.line = line;
    f.message = std::move(message);
    f.suggestion = "Fix it";
    return f;
}

} // namespace pyhazard::test
