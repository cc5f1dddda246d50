#pragma once

#include "constlint/analysis/SyntaxShapes.h"

#include <clang/Basic/SourceLocation.h>

#include <optional>
#include <vector>

namespace clang {
class ASTContext;
class DeclStmt;
class ParmVarDecl;
class VarDecl;
} // namespace clang

namespace constlint {

// What a single declaration says about its own `const`.
//
// hasQualifier is semantic (the declared variable is top-level const, even
// through a typedef). qualifierToken is syntactic and may be missing when
// hasQualifier is true: const spelled by an alias, const inside a macro
// expansion, or a declarator the lexer scan cannot attribute.
struct CandidateDeclaration {
    bool hasQualifier = false;
    std::optional<clang::SourceLocation> qualifierToken;
    bool hasExplicitType = false;
};

// One `const` token of a declaration statement and the variables it makes
// const. A const among the decl-specifiers is shared by every declarator
// that adds no pointer of its own; a const after a declarator's `*` belongs
// to that declarator alone.
struct QualifiedDeclarators {
    CandidateDeclaration candidate;
    std::vector<const clang::VarDecl *> variables;
};

// Top-level const on the variable itself, or on the elements of an array
// variable. References never qualify.
bool isConstVariable(const clang::VarDecl *VD);

// False when the written type is a placeholder: auto, decltype(auto), a
// structured binding, or an abbreviated-template / generic-lambda parameter.
bool hasExplicitType(const clang::VarDecl *VD);

// Raw-lexes [begin, end) for the `const` keyword that applies to the
// declared entity. Parentheses that enclose the name are followed, so the
// innermost pointer declarator around the name decides; closed groups and
// template argument lists are skipped. A reference declarator or a macro
// location yields nullopt.
std::optional<clang::SourceLocation>
findQualifierToken(clang::SourceLocation begin, clang::SourceLocation end,
                   const clang::ASTContext &Ctx);

CandidateDeclaration extractParameter(const clang::ParmVarDecl *P,
                                      const clang::ASTContext &Ctx);

CandidateDeclaration extractLoopVariable(const ForLoopParts &parts,
                                         const clang::ASTContext &Ctx);

// The shared decl-specifier const comes first, followed by one entry per
// declarator that carries its own. Statements whose variables are static,
// thread-local or extern yield nothing.
std::vector<QualifiedDeclarators>
extractDeclarationStatement(const clang::DeclStmt *S,
                            const clang::ASTContext &Ctx);

} // namespace constlint
