#pragma once

#include "constlint/core/LintCode.h"
#include "constlint/core/Severity.h"

#include <cstdint>
#include <string_view>
#include <vector>

namespace constlint {

class LinterContext;
class NodeLintRegistry;

enum class RuleGroup : uint8_t {
    Errors,
    Style,
    Pedantic,
};

constexpr std::string_view ruleGroupName(RuleGroup g) {
    switch (g) {
        case RuleGroup::Errors:   return "errors";
        case RuleGroup::Style:    return "style";
        case RuleGroup::Pedantic: return "pedantic";
    }
    return "style";
}

class Rule {
public:
    virtual ~Rule() = default;

    virtual std::string_view getID() const = 0;
    virtual std::string_view getDescription() const = 0;

    // Long-form markdown documentation, shown by --explain.
    virtual std::string_view getDetails() const = 0;

    virtual RuleGroup getGroup() const = 0;
    virtual Severity getBaseSeverity() const = 0;

    // IDs of rules enforcing the opposite convention. Consumed by the
    // rule-set consistency check, never by the rule itself.
    virtual std::vector<std::string_view> getIncompatibleRules() const {
        return {};
    }

    virtual std::vector<LintCode> getLintCodes() const = 0;

    // Subscribe visitors to the node shapes this rule inspects. Called once
    // per translation unit; the registry owns the visitors.
    virtual void registerNodeProcessors(NodeLintRegistry &registry,
                                        LinterContext &context) const = 0;
};

} // namespace constlint
