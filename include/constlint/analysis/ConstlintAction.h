#pragma once

#include "constlint/core/Config.h"
#include "constlint/core/Diagnostic.h"

#include <clang/Frontend/FrontendAction.h>
#include <clang/Tooling/Tooling.h>

#include <memory>
#include <vector>

namespace constlint {

class Rule;

class ConstlintAction : public clang::ASTFrontendAction {
public:
    ConstlintAction(const Config &cfg,
                    const std::vector<const Rule *> &rules,
                    std::vector<Diagnostic> &diagnostics);

    std::unique_ptr<clang::ASTConsumer>
    CreateASTConsumer(clang::CompilerInstance &CI,
                      llvm::StringRef file) override;

private:
    const Config &config_;
    const std::vector<const Rule *> &rules_;
    std::vector<Diagnostic> &diagnostics_;
};

class ConstlintActionFactory : public clang::tooling::FrontendActionFactory {
public:
    ConstlintActionFactory(const Config &cfg,
                           const std::vector<const Rule *> &rules,
                           std::vector<Diagnostic> &diagnostics);

    std::unique_ptr<clang::FrontendAction> create() override;

private:
    const Config &config_;
    const std::vector<const Rule *> &rules_;
    std::vector<Diagnostic> &diagnostics_;
};

} // namespace constlint
