#include "LintTestUtil.h"

#include "constlint/analysis/LintReporter.h"
#include "constlint/analysis/LinterContext.h"
#include "constlint/analysis/NodeLintRegistry.h"
#include "constlint/core/Config.h"
#include "constlint/core/RuleRegistry.h"
#include "constlint/rules/UnnecessaryConst.h"

#include <gtest/gtest.h>

#include <algorithm>

namespace constlint::test {
namespace {

TEST(RuleRegistryTest, UnnecessaryConstSelfRegisters) {
    const Rule *rule = RuleRegistry::instance().findByID("unnecessary-const");
    ASSERT_NE(rule, nullptr);
    EXPECT_EQ(rule->getID(), "unnecessary-const");
    EXPECT_EQ(RuleRegistry::instance().findByID("no-such-rule"), nullptr);
}

TEST(RuleRegistryTest, MetadataIsStable) {
    UnnecessaryConst rule;
    EXPECT_EQ(rule.getID(), "unnecessary-const");
    EXPECT_EQ(rule.getDescription(), "Don't use 'const' for local variables.");
    EXPECT_EQ(rule.getGroup(), RuleGroup::Style);
    EXPECT_EQ(rule.getBaseSeverity(), Severity::Info);

    auto incompatible = rule.getIncompatibleRules();
    ASSERT_EQ(incompatible.size(), 2u);
    EXPECT_EQ(incompatible[0], "prefer-const-locals");
    EXPECT_EQ(incompatible[1], "prefer-const-parameters");

    auto codes = rule.getLintCodes();
    ASSERT_EQ(codes.size(), 2u);
    EXPECT_EQ(codes[0], UnnecessaryConst::withType);
    EXPECT_EQ(codes[1], UnnecessaryConst::withoutType);

    auto details = rule.getDetails();
    ASSERT_FALSE(details.empty());
    EXPECT_NE(details.front(), '\n');
    EXPECT_NE(details.find("**BAD:**"), std::string_view::npos);
    EXPECT_NE(details.find("**GOOD:**"), std::string_view::npos);
    EXPECT_NE(details.find("```cpp"), std::string_view::npos);
}

TEST(RuleRegistryTest, RegistersAllThreeNodeShapes) {
    UnnecessaryConst rule;
    NodeLintRegistry registry;
    EXPECT_TRUE(registry.empty());

    auto ast = buildAST("int main() { return 0; }");
    ASSERT_NE(ast, nullptr);
    std::vector<Diagnostic> diagnostics;
    Config cfg = Config::defaults();
    LintReporter reporter(ast->getSourceManager(), diagnostics);
    LinterContext context(ast->getASTContext(), cfg, reporter);
    rule.registerNodeProcessors(registry, context);

    ASSERT_EQ(registry.forFormalParameterList().size(), 1u);
    ASSERT_EQ(registry.forForStatement().size(), 1u);
    ASSERT_EQ(registry.forVariableDeclarationStatement().size(), 1u);
    EXPECT_EQ(registry.forFormalParameterList()[0].rule, &rule);
    EXPECT_EQ(registry.forForStatement()[0].visitor,
              registry.forVariableDeclarationStatement()[0].visitor);
}

TEST(RuleRegistryTest, EnabledRulesFollowConfig) {
    auto &registry = RuleRegistry::instance();

    Config all = Config::defaults();
    auto ids = registry.enabledRuleIDs(all);
    EXPECT_NE(std::find(ids.begin(), ids.end(), "unnecessary-const"), ids.end());
    EXPECT_EQ(registry.enabledRules(all).size(), registry.rules().size());

    Config disabled = Config::defaults();
    disabled.disabledRules = {"unnecessary-const"};
    ids = registry.enabledRuleIDs(disabled);
    EXPECT_EQ(std::find(ids.begin(), ids.end(), "unnecessary-const"), ids.end());
    for (const auto *rule : registry.enabledRules(disabled))
        EXPECT_NE(rule->getID(), "unnecessary-const");

    Config explicitList = Config::defaults();
    explicitList.enabledRules = {"unnecessary-const", "unnecessary-const",
                                 "prefer-const-locals"};
    ids = registry.enabledRuleIDs(explicitList);
    EXPECT_EQ(ids.size(), 2u);
    ASSERT_EQ(registry.enabledRules(explicitList).size(), 1u);
    EXPECT_EQ(registry.enabledRules(explicitList)[0]->getID(),
              "unnecessary-const");
}

TEST(RuleRegistryTest, FindsIncompatibleRulesByID) {
    auto &registry = RuleRegistry::instance();

    auto conflicts = registry.findIncompatibilities(
        {"unnecessary-const", "prefer-const-locals", "prefer-const-parameters"});
    ASSERT_EQ(conflicts.size(), 2u);
    EXPECT_EQ(conflicts[0].ruleID, "unnecessary-const");
    EXPECT_EQ(conflicts[0].incompatibleID, "prefer-const-locals");
    EXPECT_EQ(conflicts[1].incompatibleID, "prefer-const-parameters");

    EXPECT_TRUE(registry.findIncompatibilities({"unnecessary-const"}).empty());
    EXPECT_TRUE(registry.findIncompatibilities({"prefer-const-locals"}).empty());
}

} // namespace
} // namespace constlint::test
