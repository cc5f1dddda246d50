#pragma once

#include <clang/AST/RecursiveASTVisitor.h>
#include <llvm/ADT/DenseSet.h>

namespace constlint {

struct Config;
class NodeLintRegistry;

// Walks one translation unit and hands every node of a subscribed shape to
// the registered rule visitors. Template instantiations and implicit code
// are not walked, so each written node is delivered once.
class LintASTVisitor : public clang::RecursiveASTVisitor<LintASTVisitor> {
    using Base = clang::RecursiveASTVisitor<LintASTVisitor>;

public:
    LintASTVisitor(clang::ASTContext &Ctx, const Config &cfg,
                   const NodeLintRegistry &registry);

    void run();

    bool TraverseDecl(clang::Decl *D);

    bool VisitFunctionDecl(clang::FunctionDecl *FD);
    bool VisitLambdaExpr(clang::LambdaExpr *E);
    bool VisitForStmt(clang::ForStmt *S);
    bool VisitCXXForRangeStmt(clang::CXXForRangeStmt *S);
    bool VisitObjCForCollectionStmt(clang::ObjCForCollectionStmt *S);
    bool VisitDeclStmt(clang::DeclStmt *S);

private:
    bool isFiltered(clang::SourceLocation loc) const;
    void dispatchForStatement(const clang::Stmt *S);

    clang::ASTContext &ctx_;
    const Config &config_;
    const NodeLintRegistry &registry_;

    // Declaration statements owned by a loop header; they are reported
    // through the for-statement shape, or not at all.
    llvm::DenseSet<const clang::DeclStmt *> loopHeaderDecls_;
};

} // namespace constlint
