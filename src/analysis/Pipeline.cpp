#include "pyhazard/analysis/Pipeline.h"
#include "pyhazard/analysis/HazardWalker.h"
#include "pyhazard/core/Error.h"
#include "pyhazard/core/RuleRegistry.h"
#include "pyhazard/hook/HookInput.h"
#include "pyhazard/hook/HookResponse.h"
#include "pyhazard/output/Reporter.h"
#include "pyhazard/python/Parser.h"

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/raw_ostream.h>

namespace pyhazard {

LoadOptions loadOptionsFor(const Config &cfg, llvm::StringRef projectRoot) {
    LoadOptions opts;
    opts.projectRoot = projectRoot.str();
    opts.maxLines = cfg.maxLines;
    opts.maxBytes = cfg.maxBytes;
    opts.extensions = cfg.extensions;
    return opts;
}

llvm::Expected<std::vector<Finding>> analyzeSource(const SourceFile &file,
                                                   const Config &cfg) {
    auto tree = python::parseModule(file.content);
    if (!tree)
        return tree.takeError();

    HazardWalker walker(RuleRegistry::instance(), cfg);
    return walker.run(*tree, file);
}

llvm::Expected<std::vector<Finding>> analyzeFile(llvm::StringRef path,
                                                 llvm::StringRef projectRoot,
                                                 const Config &cfg) {
    auto file = loadSource(path, loadOptionsFor(cfg, projectRoot));
    if (!file)
        return file.takeError();
    return analyzeSource(*file, cfg);
}

Verdict evaluate(std::vector<Finding> raw, const Config &cfg) {
    RiskAggregator aggregator(cfg);
    PolicyEngine policy(cfg);
    return policy.decide(aggregator.aggregate(std::move(raw)));
}

void reportSkip(llvm::Error err, const Config &cfg) {
    if (cfg.debug)
        llvm::errs() << "pyhazard: skip: " << llvm::toString(std::move(err)) << "\n";
    else
        llvm::consumeError(std::move(err));
}

std::string runHookPipeline(llvm::StringRef request, const Config &cfg,
                            llvm::StringRef projectRoot) {
    if (!cfg.enabled)
        return serialize(silentResponse());

    auto input = parseHookInput(request);
    if (!input) {
        reportSkip(input.takeError(), cfg);
        return serialize(silentResponse());
    }
    if (!shouldAnalyze(*input)) {
        if (cfg.debug)
            llvm::errs() << "pyhazard: skip: tool '" << input->toolName
                         << "' did not produce a file to analyze\n";
        return serialize(silentResponse());
    }

    llvm::SmallString<256> root(projectRoot.empty() ? llvm::StringRef(input->cwd)
                                                    : projectRoot);
    if (root.empty()) {
        if (std::error_code ec = llvm::sys::fs::current_path(root)) {
            reportSkip(makeError(ErrorKind::Access,
                                 "cannot determine project root: " + ec.message()),
                       cfg);
            return serialize(silentResponse());
        }
    }
    auto raw = analyzeFile(input->filePath, root, cfg);
    if (!raw) {
        reportSkip(raw.takeError(), cfg);
        return serialize(silentResponse());
    }

    Verdict verdict = evaluate(std::move(*raw), cfg);
    if (cfg.debug) {
        llvm::errs() << "pyhazard: debug: ";
        if (!input->sessionId.empty())
            llvm::errs() << "session " << input->sessionId << ": ";
        llvm::errs() << input->filePath << ": " << decisionName(verdict.decision) << " with "
                     << verdict.summary.findings.size() << " finding(s)\n";
    }

    const auto &findings = verdict.summary.findings;
    std::string report = formatWarnReport(findings, input->filePath, cfg);
    std::string reason = verdict.decision == Decision::Block
                             ? formatBlockReason(findings, input->filePath)
                             : std::string();
    return serialize(makeHookResponse(verdict.decision, input->hookEventName,
                                      report, reason));
}

} // namespace pyhazard
