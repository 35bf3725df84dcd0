#include "pyhazard/core/RuleRegistry.h"

#include <llvm/Support/raw_ostream.h>

#include <algorithm>

namespace pyhazard {

RuleRegistry &RuleRegistry::instance() {
    static RuleRegistry registry;
    return registry;
}

bool RuleRegistry::registerRule(std::unique_ptr<Rule> rule) {
    std::string_view id = rule->getID();
    std::string_view code = rule->getCode();
    if (byKey_.count(id) || byKey_.count(code)) {
        llvm::errs() << "pyhazard: warning: rule " << code << " (" << id
                     << ") is already registered, ignoring duplicate\n";
        return false;
    }

    // Ids and codes are literals owned by the rule, so the views stay valid.
    byKey_.emplace(id, rule.get());
    byKey_.emplace(code, rule.get());
    rules_.push_back(std::move(rule));
    return true;
}

std::vector<const Rule *> RuleRegistry::catalogue() const {
    std::vector<const Rule *> out;
    out.reserve(rules_.size());
    for (const auto &r : rules_)
        out.push_back(r.get());
    std::sort(out.begin(), out.end(), [](const Rule *a, const Rule *b) {
        return a->getCode() < b->getCode();
    });
    return out;
}

const Rule *RuleRegistry::findByID(std::string_view id) const {
    auto it = byKey_.find(id);
    return it != byKey_.end() ? it->second : nullptr;
}

} // namespace pyhazard
