#include "constlint/analysis/ConstlintAction.h"
#include "constlint/analysis/ConstlintASTConsumer.h"

#include <clang/Frontend/CompilerInstance.h>

namespace constlint {

ConstlintAction::ConstlintAction(const Config &cfg,
                                 const std::vector<const Rule *> &rules,
                                 std::vector<Diagnostic> &diagnostics)
    : config_(cfg), rules_(rules), diagnostics_(diagnostics) {}

std::unique_ptr<clang::ASTConsumer>
ConstlintAction::CreateASTConsumer(clang::CompilerInstance & /*CI*/,
                                   llvm::StringRef /*file*/) {
    return std::make_unique<ConstlintASTConsumer>(config_, rules_, diagnostics_);
}

// --- Factory ---

ConstlintActionFactory::ConstlintActionFactory(
    const Config &cfg, const std::vector<const Rule *> &rules,
    std::vector<Diagnostic> &diagnostics)
    : config_(cfg), rules_(rules), diagnostics_(diagnostics) {}

std::unique_ptr<clang::FrontendAction> ConstlintActionFactory::create() {
    return std::make_unique<ConstlintAction>(config_, rules_, diagnostics_);
}

} // namespace constlint
