#include "constlint/analysis/QualifierExtractor.h"

#include <clang/AST/ASTContext.h>
#include <clang/AST/Decl.h>
#include <clang/AST/DeclCXX.h>
#include <clang/AST/DeclTemplate.h>
#include <clang/AST/Stmt.h>
#include <clang/AST/Type.h>
#include <clang/Basic/SourceManager.h>
#include <clang/Lex/Lexer.h>

namespace constlint {

namespace {

const clang::VarDecl *firstVariable(const clang::DeclStmt *S) {
    for (const auto *D : S->decls()) {
        if (const auto *VD = llvm::dyn_cast<clang::VarDecl>(D))
            return VD;
    }
    return nullptr;
}

bool isInventedTemplateParameter(clang::QualType T) {
    if (T.isNull())
        return false;
    if (const auto *PT = T->getAs<clang::PointerType>())
        T = PT->getPointeeType();
    const auto *TTP = T->getAs<clang::TemplateTypeParmType>();
    return TTP && TTP->getDecl() && TTP->getDecl()->isImplicit();
}

// One level of parentheses, brackets or braces around the tokens scanned
// so far. The bottom group holds the decl-specifiers.
struct DeclaratorGroup {
    // The const after the last pointer or reference operator, or the first
    // const when the group has no operator.
    std::optional<clang::SourceLocation> qualifier;
    bool hasOperator = false;
    bool lastIsReference = false;
};

struct DeclaratorScan {
    std::optional<clang::SourceLocation> qualifier;
    // First const among the decl-specifiers, before any operator.
    std::optional<clang::SourceLocation> declSpecifier;
    // A *, ^, & or && applies to the declared name.
    bool throughOperator = false;
};

std::optional<DeclaratorScan> scanDeclarator(clang::SourceLocation begin,
                                             clang::SourceLocation end,
                                             const clang::ASTContext &Ctx) {
    const auto &SM = Ctx.getSourceManager();
    const auto &LO = Ctx.getLangOpts();

    if (begin.isInvalid() || end.isInvalid())
        return std::nullopt;
    if (begin.isMacroID() || end.isMacroID())
        return std::nullopt;
    if (SM.getFileID(begin) != SM.getFileID(end))
        return std::nullopt;

    DeclaratorScan scan;
    std::vector<DeclaratorGroup> groups(1);
    unsigned angles = 0;     // template argument lists

    clang::SourceLocation loc = begin;
    while (SM.isBeforeInTranslationUnit(loc, end)) {
        clang::Token tok;
        if (clang::Lexer::getRawToken(loc, tok, SM, LO,
                                      /*IgnoreWhiteSpace=*/true))
            return std::nullopt;
        if (tok.is(clang::tok::eof) ||
            !SM.isBeforeInTranslationUnit(tok.getLocation(), end))
            break;

        auto &group = groups.back();
        switch (tok.getKind()) {
            case clang::tok::less:
                ++angles;
                break;
            case clang::tok::greater:
                if (angles > 0)
                    --angles;
                break;
            case clang::tok::greatergreater:
                angles = angles >= 2 ? angles - 2 : 0;
                break;
            case clang::tok::l_paren:
            case clang::tok::l_square:
            case clang::tok::l_brace:
                if (angles == 0)
                    groups.emplace_back();
                break;
            case clang::tok::r_paren:
            case clang::tok::r_square:
            case clang::tok::r_brace:
                if (angles == 0 && groups.size() > 1)
                    groups.pop_back();
                break;
            case clang::tok::star:
            case clang::tok::caret:
            case clang::tok::amp:
            case clang::tok::ampamp:
                if (angles == 0) {
                    group.qualifier.reset();
                    group.hasOperator = true;
                    group.lastIsReference = tok.isOneOf(clang::tok::amp,
                                                        clang::tok::ampamp);
                }
                break;
            case clang::tok::raw_identifier:
                if (angles > 0 || tok.getRawIdentifier() != "const")
                    break;
                if (!group.qualifier)
                    group.qualifier = tok.getLocation();
                if (groups.size() == 1 && !group.hasOperator &&
                    !scan.declSpecifier)
                    scan.declSpecifier = tok.getLocation();
                break;
            default:
                break;
        }

        if (!SM.isBeforeInTranslationUnit(loc, tok.getEndLoc()))
            break;
        loc = tok.getEndLoc();
    }

    // The groups still open enclose the name; the innermost one with an
    // operator is the outermost type constructor of the variable.
    for (auto it = groups.rbegin(); it != groups.rend(); ++it) {
        if (it->hasOperator) {
            scan.throughOperator = true;
            if (!it->lastIsReference)
                scan.qualifier = it->qualifier;
            break;
        }
        if (it->qualifier) {
            scan.qualifier = it->qualifier;
            break;
        }
    }
    return scan;
}

CandidateDeclaration extractVariable(const clang::VarDecl *VD,
                                     clang::SourceLocation begin,
                                     const clang::ASTContext &Ctx) {
    CandidateDeclaration cand;
    if (!VD)
        return cand;

    cand.hasQualifier = isConstVariable(VD);
    cand.hasExplicitType = hasExplicitType(VD);
    if (cand.hasQualifier)
        cand.qualifierToken = findQualifierToken(begin, VD->getLocation(), Ctx);
    return cand;
}

} // anonymous namespace

bool isConstVariable(const clang::VarDecl *VD) {
    if (!VD)
        return false;
    clang::QualType T = VD->getType();
    if (T.isNull() || T->isReferenceType())
        return false;
    // The const of an array is carried by its element type.
    if (T->isArrayType())
        T = VD->getASTContext().getBaseElementType(T);
    return T.isConstQualified();
}

bool hasExplicitType(const clang::VarDecl *VD) {
    if (!VD || llvm::isa<clang::DecompositionDecl>(VD))
        return false;

    clang::QualType T = VD->getType();
    if (const auto *TSI = VD->getTypeSourceInfo())
        T = TSI->getType();
    if (T.isNull())
        return false;

    if (T->getContainedAutoType())
        return false;
    return !isInventedTemplateParameter(T);
}

std::optional<clang::SourceLocation>
findQualifierToken(clang::SourceLocation begin, clang::SourceLocation end,
                   const clang::ASTContext &Ctx) {
    const auto scan = scanDeclarator(begin, end, Ctx);
    if (!scan)
        return std::nullopt;
    return scan->qualifier;
}

CandidateDeclaration extractParameter(const clang::ParmVarDecl *P,
                                      const clang::ASTContext &Ctx) {
    // A default argument hangs off the parameter itself, so the declaration
    // inspected is the same with or without one.
    switch (classifyParameter(P)) {
        case ParameterKind::Plain:
        case ParameterKind::MemberInitializing:
        case ParameterKind::BaseInitializing:
            return extractVariable(P, P->getBeginLoc(), Ctx);
        case ParameterKind::Unknown:
            return {};
    }
    return {};
}

CandidateDeclaration extractLoopVariable(const ForLoopParts &parts,
                                         const clang::ASTContext &Ctx) {
    if (parts.kind != ForLoopPartsKind::ForEachWithDeclaration ||
        !parts.loopVariable)
        return {};
    return extractVariable(parts.loopVariable,
                           parts.loopVariable->getBeginLoc(), Ctx);
}

std::vector<QualifiedDeclarators>
extractDeclarationStatement(const clang::DeclStmt *S,
                            const clang::ASTContext &Ctx) {
    std::vector<QualifiedDeclarators> found;
    if (!S)
        return found;
    const auto *first = firstVariable(S);
    if (!first || !first->hasLocalStorage() ||
        llvm::isa<clang::ParmVarDecl>(first))
        return found;

    QualifiedDeclarators shared;
    std::optional<clang::SourceLocation> declSpecifier;
    clang::SourceLocation begin = S->getBeginLoc();

    for (const auto *D : S->decls()) {
        const auto *VD = llvm::dyn_cast<clang::VarDecl>(D);
        if (!VD)
            continue;

        const auto scan = scanDeclarator(begin, VD->getLocation(), Ctx);
        if (VD == first && scan)
            declSpecifier = scan->declSpecifier;
        // The next declarator starts after this one's initializer.
        begin = clang::Lexer::getLocForEndOfToken(
            VD->getEndLoc(), 0, Ctx.getSourceManager(), Ctx.getLangOpts());

        if (!scan || !isConstVariable(VD))
            continue;
        if (scan->throughOperator) {
            if (scan->qualifier)
                found.push_back(
                    {{true, scan->qualifier, hasExplicitType(VD)}, {VD}});
        } else if (declSpecifier) {
            if (shared.variables.empty())
                shared.candidate = {true, declSpecifier, hasExplicitType(VD)};
            shared.variables.push_back(VD);
        }
    }

    if (!shared.variables.empty())
        found.insert(found.begin(), std::move(shared));
    return found;
}

} // namespace constlint
