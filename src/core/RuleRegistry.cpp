#include "constlint/core/RuleRegistry.h"
#include "constlint/core/Config.h"

#include <algorithm>

namespace constlint {

namespace {

bool contains(const std::vector<std::string> &ids, std::string_view id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

} // anonymous namespace

RuleRegistry &RuleRegistry::instance() {
    static RuleRegistry registry;
    return registry;
}

void RuleRegistry::registerRule(std::unique_ptr<Rule> rule) {
    rules_.push_back(std::move(rule));
}

const Rule *RuleRegistry::findByID(std::string_view id) const {
    auto it = std::find_if(rules_.begin(), rules_.end(),
                           [id](const auto &r) { return r->getID() == id; });
    return (it != rules_.end()) ? it->get() : nullptr;
}

std::vector<std::string> RuleRegistry::enabledRuleIDs(const Config &cfg) const {
    std::vector<std::string> ids;
    if (cfg.enabledRules.empty()) {
        for (const auto &r : rules_)
            ids.emplace_back(r->getID());
    } else {
        for (const auto &id : cfg.enabledRules)
            if (!contains(ids, id))
                ids.push_back(id);
    }

    ids.erase(std::remove_if(ids.begin(), ids.end(),
                             [&cfg](const std::string &id) {
                                 return contains(cfg.disabledRules, id);
                             }),
              ids.end());
    return ids;
}

std::vector<const Rule *> RuleRegistry::enabledRules(const Config &cfg) const {
    const auto ids = enabledRuleIDs(cfg);
    std::vector<const Rule *> out;
    for (const auto &r : rules_)
        if (contains(ids, r->getID()))
            out.push_back(r.get());
    return out;
}

std::vector<RuleConflict>
RuleRegistry::findIncompatibilities(const std::vector<std::string> &ids) const {
    std::vector<RuleConflict> conflicts;

    auto alreadyReported = [&conflicts](std::string_view a, std::string_view b) {
        return std::any_of(conflicts.begin(), conflicts.end(),
                           [a, b](const RuleConflict &c) {
                               return (c.ruleID == a && c.incompatibleID == b) ||
                                      (c.ruleID == b && c.incompatibleID == a);
                           });
    };

    for (const auto &id : ids) {
        const Rule *rule = findByID(id);
        if (!rule)
            continue;
        for (std::string_view other : rule->getIncompatibleRules()) {
            if (other == id || !contains(ids, other))
                continue;
            if (alreadyReported(id, other))
                continue;
            conflicts.push_back({id, std::string(other)});
        }
    }
    return conflicts;
}

} // namespace constlint
