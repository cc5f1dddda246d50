#pragma once

#include "constlint/core/Config.h"
#include "constlint/core/Diagnostic.h"

#include <clang/AST/ASTConsumer.h>
#include <clang/AST/ASTContext.h>

#include <vector>

namespace constlint {

class Rule;

class ConstlintASTConsumer : public clang::ASTConsumer {
public:
    ConstlintASTConsumer(const Config &cfg,
                         const std::vector<const Rule *> &rules,
                         std::vector<Diagnostic> &diagnostics);

    void HandleTranslationUnit(clang::ASTContext &Ctx) override;

private:
    const Config &config_;
    const std::vector<const Rule *> &rules_;
    std::vector<Diagnostic> &diagnostics_;
};

} // namespace constlint
