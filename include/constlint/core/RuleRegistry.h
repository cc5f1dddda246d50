#pragma once

#include "constlint/core/Rule.h"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace constlint {

struct Config;

// Two enabled rule IDs that enforce opposite conventions.
struct RuleConflict {
    std::string ruleID;
    std::string incompatibleID;
};

class RuleRegistry {
public:
    static RuleRegistry &instance();

    void registerRule(std::unique_ptr<Rule> rule);

    const std::vector<std::unique_ptr<Rule>> &rules() const { return rules_; }

    const Rule *findByID(std::string_view id) const;

    // Rule IDs the configuration asks for: the explicit enable list, or
    // every registered rule when that list is empty, minus disabled ones.
    std::vector<std::string> enabledRuleIDs(const Config &cfg) const;

    // Registered rules among enabledRuleIDs(cfg), in registration order.
    std::vector<const Rule *> enabledRules(const Config &cfg) const;

    // Each incompatible pair among `ids` is reported once. IDs that are not
    // registered still take part through the registered rule naming them.
    std::vector<RuleConflict>
    findIncompatibilities(const std::vector<std::string> &ids) const;

private:
    RuleRegistry() = default;
    std::vector<std::unique_ptr<Rule>> rules_;
};

// Macro for static self-registration in rule .cpp files.
#define CONSTLINT_REGISTER_RULE(RuleClass)                                     \
    namespace {                                                                \
    struct RuleClass##Registrar {                                              \
        RuleClass##Registrar() {                                               \
            ::constlint::RuleRegistry::instance().registerRule(                \
                std::make_unique<RuleClass>());                                \
        }                                                                      \
    };                                                                         \
    static RuleClass##Registrar g_##RuleClass##Registrar;                      \
    } // anonymous namespace

} // namespace constlint
