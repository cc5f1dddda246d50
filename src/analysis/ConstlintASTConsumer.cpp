#include "constlint/analysis/ConstlintASTConsumer.h"
#include "constlint/analysis/LintASTVisitor.h"
#include "constlint/analysis/LintReporter.h"
#include "constlint/analysis/LinterContext.h"
#include "constlint/analysis/NodeLintRegistry.h"
#include "constlint/core/Rule.h"

namespace constlint {

ConstlintASTConsumer::ConstlintASTConsumer(const Config &cfg,
                                           const std::vector<const Rule *> &rules,
                                           std::vector<Diagnostic> &diagnostics)
    : config_(cfg), rules_(rules), diagnostics_(diagnostics) {}

void ConstlintASTConsumer::HandleTranslationUnit(clang::ASTContext &Ctx) {
    LintReporter reporter(Ctx.getSourceManager(), diagnostics_);
    LinterContext context(Ctx, config_, reporter);

    // Visitors live for this translation unit only.
    NodeLintRegistry registry;
    for (const auto *rule : rules_)
        rule->registerNodeProcessors(registry, context);

    LintASTVisitor visitor(Ctx, config_, registry);
    visitor.run();
}

} // namespace constlint
