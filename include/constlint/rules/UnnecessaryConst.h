#pragma once

#include "constlint/core/Rule.h"

namespace constlint {

// Flags `const` on local variables and parameters. Enforces the
// mutable-by-default convention; the opposite convention is enforced by
// prefer-const-locals and prefer-const-parameters.
class UnnecessaryConst : public Rule {
public:
    static constexpr LintCode withType{
        "unnecessary-const",
        "Local variables should not be marked as 'const'.",
        "Remove the 'const'."};

    static constexpr LintCode withoutType{
        "unnecessary-const",
        "Local variables should not be marked as 'const'.",
        "Replace 'const auto' with 'auto'."};

    // With a written type, dropping the qualifier leaves a complete
    // declaration; with a deduced type the deduced form must stay.
    static const LintCode &classify(bool hasExplicitType) {
        return hasExplicitType ? withType : withoutType;
    }

    std::string_view getID() const override { return "unnecessary-const"; }
    std::string_view getDescription() const override {
        return "Don't use 'const' for local variables.";
    }
    std::string_view getDetails() const override;
    RuleGroup getGroup() const override { return RuleGroup::Style; }
    Severity getBaseSeverity() const override { return Severity::Info; }

    std::vector<std::string_view> getIncompatibleRules() const override {
        return {"prefer-const-locals", "prefer-const-parameters"};
    }

    std::vector<LintCode> getLintCodes() const override {
        return {withType, withoutType};
    }

    void registerNodeProcessors(NodeLintRegistry &registry,
                                LinterContext &context) const override;
};

} // namespace constlint
