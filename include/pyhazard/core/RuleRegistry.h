#pragma once

#include "pyhazard/core/Rule.h"

#include <map>
#include <memory>
#include <string_view>
#include <vector>

namespace pyhazard {

// Process-wide rule catalogue filled by static registrars before main().
class RuleRegistry {
public:
    static RuleRegistry &instance();

    // Takes ownership of `rule`. A rule whose id or code is already taken
    // is dropped with a warning and false is returned.
    bool registerRule(std::unique_ptr<Rule> rule);

    // Registration order.
    const std::vector<std::unique_ptr<Rule>> &rules() const { return rules_; }

    // Every rule ordered by code (C001 ... S010).
    std::vector<const Rule *> catalogue() const;

    // Looks a rule up by slug ("mutable-default") or code ("R001").
    const Rule *findByID(std::string_view id) const;

    size_t size() const { return rules_.size(); }

private:
    RuleRegistry() = default;

    std::vector<std::unique_ptr<Rule>> rules_;
    std::map<std::string_view, const Rule *, std::less<>> byKey_;
};

// Static self-registration; place after the rule class in its .cpp file.
#define PYHAZARD_REGISTER_RULE(RuleClass)                                      \
    namespace {                                                                \
    struct RuleClass##Registrar {                                              \
        RuleClass##Registrar() {                                               \
            ::pyhazard::RuleRegistry::instance().registerRule(                 \
                std::make_unique<RuleClass>());                                \
        }                                                                      \
    };                                                                         \
    static RuleClass##Registrar g_##RuleClass##Registrar;                      \
    } // anonymous namespace

} // namespace pyhazard
