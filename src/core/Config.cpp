#include "pyhazard/core/Config.h"

#include <llvm/ADT/StringExtras.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/YAMLParser.h>
#include <llvm/Support/YAMLTraits.h>
#include <llvm/Support/raw_ostream.h>

#include <algorithm>

namespace {

// On-disk shape of the YAML file. Severities are spelled as strings so
// that the file reads the same as PYHAZARD_LEVELS.
struct FileConfig {
    pyhazard::Config cfg;
    std::vector<std::string> levels;
    std::vector<std::string> extensions;
};

} // anonymous namespace

namespace llvm {
namespace yaml {

template <>
struct MappingTraits<FileConfig> {
    static void mapping(IO &io, FileConfig &fc) {
        auto &cfg = fc.cfg;
        io.mapOptional("enabled",              cfg.enabled);
        io.mapOptional("levels",               fc.levels);
        io.mapOptional("disabled_rules",       cfg.disabledRules);
        io.mapOptional("block_on_critical",    cfg.blockOnCritical);
        io.mapOptional("max_issues",           cfg.maxIssues);
        io.mapOptional("include_tips",         cfg.includeTips);
        io.mapOptional("debug",                cfg.debug);
        io.mapOptional("max_lines",            cfg.maxLines);
        io.mapOptional("max_bytes",            cfg.maxBytes);
        io.mapOptional("extensions",           fc.extensions);
        io.mapOptional("complexity_threshold", cfg.complexityThreshold);
        io.mapOptional("max_parameters",       cfg.maxParameters);
        io.mapOptional("max_function_lines",   cfg.maxFunctionLines);
        io.mapOptional("max_nesting_depth",    cfg.maxNestingDepth);
        io.mapOptional("max_returns",          cfg.maxReturns);
        io.mapOptional("max_methods",          cfg.maxMethods);
        io.mapOptional("max_bool_operands",    cfg.maxBoolOperands);
        io.mapOptional("max_function_nesting", cfg.maxFunctionNesting);
    }
};

} // namespace yaml
} // namespace llvm

namespace pyhazard {

namespace {

bool applyLevels(const std::vector<std::string> &names, Config &cfg) {
    std::set<Severity> levels;
    for (const auto &name : names) {
        auto sev = parseSeverity(name);
        if (!sev) {
            llvm::errs() << "pyhazard: warning: unknown severity '" << name
                         << "' ignored\n";
            continue;
        }
        levels.insert(*sev);
    }
    if (levels.empty() && !names.empty())
        return false;
    cfg.enabledSeverities = std::move(levels);
    return true;
}

void applyBool(EnvLookup env, llvm::StringRef var, bool &field) {
    auto raw = env(var);
    if (!raw)
        return;
    if (auto v = parseBool(*raw)) {
        field = *v;
        return;
    }
    llvm::errs() << "pyhazard: warning: " << var << "='" << *raw
                 << "' is not a boolean, keeping "
                 << (field ? "true" : "false") << "\n";
}

template <typename T>
void applyUnsigned(EnvLookup env, llvm::StringRef var, T &field) {
    auto raw = env(var);
    if (!raw)
        return;
    unsigned long long v = 0;
    if (llvm::StringRef(*raw).trim().getAsInteger(10, v)) {
        llvm::errs() << "pyhazard: warning: " << var << "='" << *raw
                     << "' is not a non-negative integer, keeping "
                     << field << "\n";
        return;
    }
    field = static_cast<T>(v);
}

} // anonymous namespace

std::optional<bool> parseBool(llvm::StringRef s) {
    std::string v = s.trim().lower();
    if (v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

std::vector<std::string> splitList(llvm::StringRef s) {
    llvm::SmallVector<llvm::StringRef, 8> parts;
    s.split(parts, ',', /*MaxSplit=*/-1, /*KeepEmpty=*/false);

    std::vector<std::string> out;
    for (auto p : parts) {
        p = p.trim();
        if (!p.empty())
            out.push_back(p.str());
    }
    return out;
}

bool Config::isRuleDisabled(llvm::StringRef id, llvm::StringRef code) const {
    return std::any_of(disabledRules.begin(), disabledRules.end(),
                       [&](const std::string &r) {
                           return r == id || r == code;
                       });
}

Config Config::defaults() {
    return Config{};
}

Config Config::loadFromFile(const std::string &path) {
    auto bufOrErr = llvm::MemoryBuffer::getFile(path);
    if (!bufOrErr) {
        llvm::errs() << "pyhazard: warning: cannot open config '"
                     << path << "', using defaults\n";
        return defaults();
    }

    FileConfig fc{defaults(), {}, {}};
    llvm::yaml::Input yin(bufOrErr.get()->getBuffer());
    yin >> fc;

    if (yin.error()) {
        llvm::errs() << "pyhazard: warning: config parse error in '"
                     << path << "', using defaults\n";
        return defaults();
    }

    if (!fc.levels.empty() && !applyLevels(fc.levels, fc.cfg)) {
        llvm::errs() << "pyhazard: warning: no valid severity in '"
                     << path << "' levels, keeping all levels\n";
    }

    if (!fc.extensions.empty())
        fc.cfg.extensions = std::move(fc.extensions);

    return fc.cfg;
}

Config Config::loadFromEnvironment(EnvLookup env, Config base) {
    Config cfg = std::move(base);

    if (auto file = env("PYHAZARD_CONFIG")) {
        if (!file->empty())
            cfg = loadFromFile(*file);
    }

    applyBool(env, "PYHAZARD_ENABLED", cfg.enabled);
    applyBool(env, "PYHAZARD_BLOCK_ON_CRITICAL", cfg.blockOnCritical);
    applyBool(env, "PYHAZARD_INCLUDE_TIPS", cfg.includeTips);
    applyBool(env, "PYHAZARD_DEBUG", cfg.debug);
    applyUnsigned(env, "PYHAZARD_MAX_ISSUES", cfg.maxIssues);
    applyUnsigned(env, "PYHAZARD_MAX_LINES", cfg.maxLines);
    applyUnsigned(env, "PYHAZARD_MAX_BYTES", cfg.maxBytes);

    auto levels = env("PYHAZARD_LEVELS");
    if (levels && !llvm::StringRef(*levels).trim().empty()) {
        if (!applyLevels(splitList(*levels), cfg)) {
            llvm::errs() << "pyhazard: warning: PYHAZARD_LEVELS='" << *levels
                         << "' names no valid severity, keeping previous levels\n";
        }
    }

    if (auto disabled = env("PYHAZARD_DISABLED"))
        cfg.disabledRules = splitList(*disabled);

    return cfg;
}

} // namespace pyhazard
