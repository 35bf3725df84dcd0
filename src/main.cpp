#include "pyhazard/analysis/Pipeline.h"
#include "pyhazard/core/Config.h"
#include "pyhazard/core/Finding.h"
#include "pyhazard/core/RuleRegistry.h"
#include "pyhazard/core/Severity.h"
#include "pyhazard/core/Version.h"
#include "pyhazard/output/OutputFormatter.h"

#include <llvm/Support/CommandLine.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Format.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Process.h>
#include <llvm/Support/raw_ostream.h>

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

static llvm::cl::OptionCategory PyhazardCat("pyhazard options");

static llvm::cl::list<std::string> InputFiles(
    llvm::cl::Positional,
    llvm::cl::desc("[file.py ...]  (no files: read a hook request from stdin)"),
    llvm::cl::ZeroOrMore,
    llvm::cl::cat(PyhazardCat));

static llvm::cl::opt<std::string> ConfigPath(
    "config",
    llvm::cl::desc("Path to a pyhazard YAML configuration file"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(PyhazardCat));

static llvm::cl::opt<std::string> OutputFormat(
    "format",
    llvm::cl::desc("Scan report format (cli|json)"),
    llvm::cl::init("cli"),
    llvm::cl::cat(PyhazardCat));

static llvm::cl::opt<std::string> OutputFile(
    "output",
    llvm::cl::desc("Write the scan report to file instead of stdout"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(PyhazardCat));

static llvm::cl::opt<std::string> MinSev(
    "min-severity",
    llvm::cl::desc("Minimum severity to report (LOW|MEDIUM|HIGH|CRITICAL)"),
    llvm::cl::cat(PyhazardCat));

static llvm::cl::list<std::string> DisabledRules(
    "disable",
    llvm::cl::desc("Rule ids or codes to disable"),
    llvm::cl::value_desc("id,..."),
    llvm::cl::CommaSeparated,
    llvm::cl::cat(PyhazardCat));

static llvm::cl::opt<bool> ListRules(
    "list-rules",
    llvm::cl::desc("Print the rule catalogue and exit"),
    llvm::cl::cat(PyhazardCat));

static std::optional<std::string> processEnv(llvm::StringRef name) {
    if (auto value = llvm::sys::Process::GetEnv(name))
        return *value;
    return std::nullopt;
}

static void printRules(llvm::raw_ostream &os) {
    for (const auto *r : pyhazard::RuleRegistry::instance().catalogue()) {
        os << r->getCode() << "  " << llvm::left_justify(r->getID(), 34)
           << llvm::left_justify(pyhazard::severityToString(r->getBaseSeverity()), 10)
           << llvm::left_justify(pyhazard::categoryToString(r->getCategory()), 14)
           << r->getTitle() << "\n";
    }
}

// Hook mode: the decision travels in the response body, so the exit status
// is always 0.
static int runHook(const pyhazard::Config &cfg) {
    auto input = llvm::MemoryBuffer::getSTDIN();
    if (!input) {
        if (cfg.debug)
            llvm::errs() << "pyhazard: skip: cannot read stdin: "
                         << input.getError().message() << "\n";
        llvm::outs() << "{\"suppressOutput\":true}\n";
        return 0;
    }

    std::string root = processEnv("CLAUDE_PROJECT_DIR").value_or("");
    llvm::outs() << pyhazard::runHookPipeline((*input)->getBuffer(), cfg, root)
                 << "\n";
    return 0;
}

static int runScan(pyhazard::Config cfg) {
    if (!MinSev.empty()) {
        auto min = pyhazard::parseSeverity(MinSev.getValue());
        if (!min) {
            llvm::errs() << "pyhazard: error: unknown severity '" << MinSev.getValue()
                         << "'\n";
            return 2;
        }
        std::set<pyhazard::Severity> levels;
        for (auto s : pyhazard::kAllSeverities) {
            if (s >= *min && cfg.isSeverityEnabled(s))
                levels.insert(s);
        }
        cfg.enabledSeverities = std::move(levels);
    }
    for (const auto &id : DisabledRules)
        cfg.disabledRules.push_back(id);

    // Files named on the command line are trusted: no root containment.
    std::vector<pyhazard::FileReport> reports;
    bool skipped = false;
    bool found = false;
    for (const auto &path : InputFiles) {
        pyhazard::FileReport report;
        report.path = path;
        auto raw = pyhazard::analyzeFile(path, "", cfg);
        if (!raw) {
            report.skipReason = llvm::toString(raw.takeError());
            skipped = true;
        } else {
            pyhazard::Verdict verdict = pyhazard::evaluate(std::move(*raw), cfg);
            report.findings = std::move(verdict.summary.findings);
            found |= !report.findings.empty();
        }
        reports.push_back(std::move(report));
    }

    std::unique_ptr<pyhazard::OutputFormatter> formatter;
    if (OutputFormat == "json")
        formatter = std::make_unique<pyhazard::JSONOutputFormatter>();
    else
        formatter = std::make_unique<pyhazard::CLIOutputFormatter>();

    std::string output = formatter->format(reports);

    if (OutputFile.empty()) {
        llvm::outs() << output;
    } else {
        std::error_code EC;
        llvm::raw_fd_ostream file(OutputFile.getValue(), EC, llvm::sys::fs::OF_Text);
        if (EC) {
            llvm::errs() << "pyhazard: error: cannot open output file '"
                         << OutputFile.getValue() << "': " << EC.message() << "\n";
            return 2;
        }
        file << output;
    }

    return skipped ? 2 : (found ? 1 : 0);
}

int main(int argc, const char **argv) {
    llvm::cl::HideUnrelatedOptions(PyhazardCat);
    llvm::cl::SetVersionPrinter([](llvm::raw_ostream &os) {
        os << "pyhazard " << pyhazard::kToolVersion << "\n";
    });
    llvm::cl::ParseCommandLineOptions(
        argc, argv, "pyhazard - structural antipattern analyzer for Python\n");

    if (ListRules) {
        printRules(llvm::outs());
        return 0;
    }

    // Precedence: defaults < --config < PYHAZARD_CONFIG < PYHAZARD_* variables.
    pyhazard::Config base = ConfigPath.empty()
        ? pyhazard::Config::defaults()
        : pyhazard::Config::loadFromFile(ConfigPath);
    auto env = [](llvm::StringRef name) { return processEnv(name); };
    pyhazard::Config cfg = pyhazard::Config::loadFromEnvironment(env, std::move(base));

    if (InputFiles.empty())
        return runHook(cfg);
    return runScan(std::move(cfg));
}
