#include "constlint/analysis/SyntaxShapes.h"

#include <clang/AST/Decl.h>
#include <clang/AST/DeclCXX.h>
#include <clang/AST/Expr.h>
#include <clang/AST/Stmt.h>
#include <clang/AST/StmtCXX.h>
#include <clang/AST/StmtObjC.h>

namespace constlint {

namespace {

bool referencesParameter(const clang::Stmt *S, const clang::ParmVarDecl *P) {
    if (!S)
        return false;
    if (const auto *DRE = llvm::dyn_cast<clang::DeclRefExpr>(S)) {
        if (DRE->getDecl() == P)
            return true;
    }
    for (const auto *child : S->children()) {
        if (referencesParameter(child, P))
            return true;
    }
    return false;
}

} // anonymous namespace

ParameterKind classifyParameter(const clang::ParmVarDecl *P) {
    if (!P || P->isImplicit() || !P->getTypeSourceInfo())
        return ParameterKind::Unknown;
    if (P->getLocation().isInvalid())
        return ParameterKind::Unknown;

    const auto *Ctor =
        llvm::dyn_cast_or_null<clang::CXXConstructorDecl>(P->getDeclContext());
    if (!Ctor)
        return ParameterKind::Plain;

    bool forwardedToBase = false;
    for (const auto *init : Ctor->inits()) {
        if (!init->isWritten() || !referencesParameter(init->getInit(), P))
            continue;
        if (init->isAnyMemberInitializer())
            return ParameterKind::MemberInitializing;
        if (init->isBaseInitializer() || init->isDelegatingInitializer())
            forwardedToBase = true;
    }
    return forwardedToBase ? ParameterKind::BaseInitializing
                           : ParameterKind::Plain;
}

ForLoopParts getForLoopParts(const clang::Stmt *S) {
    ForLoopParts parts;
    if (!S)
        return parts;

    if (const auto *range = llvm::dyn_cast<clang::CXXForRangeStmt>(S)) {
        parts.kind = ForLoopPartsKind::ForEachWithDeclaration;
        parts.loopVariable = range->getLoopVariable();
    } else if (const auto *coll =
                   llvm::dyn_cast<clang::ObjCForCollectionStmt>(S)) {
        const auto *DS = llvm::dyn_cast_or_null<clang::DeclStmt>(coll->getElement());
        if (DS && DS->isSingleDecl()) {
            parts.kind = ForLoopPartsKind::ForEachWithDeclaration;
            parts.loopVariable =
                llvm::dyn_cast<clang::VarDecl>(DS->getSingleDecl());
        } else {
            parts.kind = ForLoopPartsKind::ForEachWithIdentifier;
        }
    } else if (llvm::isa<clang::ForStmt>(S)) {
        parts.kind = ForLoopPartsKind::ForCounted;
    }

    return parts;
}

} // namespace constlint
