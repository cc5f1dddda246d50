#include "constlint/analysis/LintASTVisitor.h"
#include "constlint/analysis/NodeLintRegistry.h"
#include "constlint/core/Config.h"

#include <clang/AST/ASTContext.h>
#include <clang/AST/Decl.h>
#include <clang/AST/DeclCXX.h>
#include <clang/AST/ExprCXX.h>
#include <clang/AST/Stmt.h>
#include <clang/AST/StmtCXX.h>
#include <clang/AST/StmtObjC.h>
#include <clang/Basic/SourceManager.h>

namespace constlint {

LintASTVisitor::LintASTVisitor(clang::ASTContext &Ctx, const Config &cfg,
                               const NodeLintRegistry &registry)
    : ctx_(Ctx), config_(cfg), registry_(registry) {}

void LintASTVisitor::run() {
    if (registry_.empty())
        return;
    TraverseAST(ctx_);
}

bool LintASTVisitor::isFiltered(clang::SourceLocation loc) const {
    if (loc.isInvalid())
        return true;

    const auto &SM = ctx_.getSourceManager();
    auto fileLoc = SM.getExpansionLoc(loc);
    if (SM.isInSystemHeader(fileLoc))
        return true;
    if (!config_.analyzeHeaders && !SM.isInMainFile(fileLoc))
        return true;
    if (!config_.excludeFilePatterns.empty() &&
        config_.isFileExcluded(SM.getFilename(fileLoc)))
        return true;
    return false;
}

bool LintASTVisitor::TraverseDecl(clang::Decl *D) {
    if (!D)
        return true;
    // The translation unit has no location of its own.
    if (!llvm::isa<clang::TranslationUnitDecl>(D) && isFiltered(D->getLocation()))
        return true;
    return Base::TraverseDecl(D);
}

bool LintASTVisitor::VisitFunctionDecl(clang::FunctionDecl *FD) {
    if (FD->isImplicit())
        return true;
    // Lambda call operators are reached through VisitLambdaExpr.
    if (const auto *MD = llvm::dyn_cast<clang::CXXMethodDecl>(FD)) {
        if (MD->getParent() && MD->getParent()->isLambda())
            return true;
    }

    FormalParameterList list{FD, FD->parameters()};
    for (const auto &sub : registry_.forFormalParameterList())
        sub.visitor->visitFormalParameterList(list);
    return true;
}

bool LintASTVisitor::VisitLambdaExpr(clang::LambdaExpr *E) {
    if (!E->hasExplicitParameters())
        return true;

    const clang::CXXMethodDecl *op = E->getCallOperator();
    if (!op)
        return true;

    FormalParameterList list{op, op->parameters()};
    for (const auto &sub : registry_.forFormalParameterList())
        sub.visitor->visitFormalParameterList(list);
    return true;
}

void LintASTVisitor::dispatchForStatement(const clang::Stmt *S) {
    for (const auto &sub : registry_.forForStatement())
        sub.visitor->visitForStatement(S);
}

bool LintASTVisitor::VisitForStmt(clang::ForStmt *S) {
    if (const auto *init = llvm::dyn_cast_or_null<clang::DeclStmt>(S->getInit()))
        loopHeaderDecls_.insert(init);
    dispatchForStatement(S);
    return true;
}

bool LintASTVisitor::VisitCXXForRangeStmt(clang::CXXForRangeStmt *S) {
    if (const auto *loopVar = S->getLoopVarStmt())
        loopHeaderDecls_.insert(loopVar);
    dispatchForStatement(S);
    return true;
}

bool LintASTVisitor::VisitObjCForCollectionStmt(clang::ObjCForCollectionStmt *S) {
    if (const auto *elem = llvm::dyn_cast_or_null<clang::DeclStmt>(S->getElement()))
        loopHeaderDecls_.insert(elem);
    dispatchForStatement(S);
    return true;
}

bool LintASTVisitor::VisitDeclStmt(clang::DeclStmt *S) {
    if (loopHeaderDecls_.count(S))
        return true;
    if (S->getBeginLoc().isValid() && isFiltered(S->getBeginLoc()))
        return true;

    for (const auto &sub : registry_.forVariableDeclarationStatement())
        sub.visitor->visitVariableDeclarationStatement(S);
    return true;
}

} // namespace constlint
