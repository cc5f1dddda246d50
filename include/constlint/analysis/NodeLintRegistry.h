#pragma once

#include "constlint/analysis/SyntaxShapes.h"

#include <memory>
#include <vector>

namespace clang {
class DeclStmt;
class Stmt;
} // namespace clang

namespace constlint {

class Rule;

// Callbacks for the node shapes a rule can subscribe to. Overrides that a
// rule does not subscribe to are never called.
class SimpleLintVisitor {
public:
    virtual ~SimpleLintVisitor() = default;

    virtual void visitFormalParameterList(const FormalParameterList &) {}

    // Delivered for ForStmt, CXXForRangeStmt and ObjCForCollectionStmt.
    virtual void visitForStatement(const clang::Stmt *) {}

    virtual void visitVariableDeclarationStatement(const clang::DeclStmt *) {}
};

class NodeLintRegistry {
public:
    struct Subscription {
        const Rule *rule;
        SimpleLintVisitor *visitor;
    };

    // Takes ownership; the returned reference lives as long as the registry.
    SimpleLintVisitor &adopt(std::unique_ptr<SimpleLintVisitor> visitor);

    NodeLintRegistry &addFormalParameterList(const Rule &rule,
                                             SimpleLintVisitor &visitor);
    NodeLintRegistry &addForStatement(const Rule &rule,
                                      SimpleLintVisitor &visitor);
    NodeLintRegistry &addVariableDeclarationStatement(const Rule &rule,
                                                      SimpleLintVisitor &visitor);

    const std::vector<Subscription> &forFormalParameterList() const {
        return formalParameterList_;
    }
    const std::vector<Subscription> &forForStatement() const {
        return forStatement_;
    }
    const std::vector<Subscription> &forVariableDeclarationStatement() const {
        return variableDeclarationStatement_;
    }

    bool empty() const {
        return formalParameterList_.empty() && forStatement_.empty() &&
               variableDeclarationStatement_.empty();
    }

private:
    std::vector<std::unique_ptr<SimpleLintVisitor>> owned_;
    std::vector<Subscription> formalParameterList_;
    std::vector<Subscription> forStatement_;
    std::vector<Subscription> variableDeclarationStatement_;
};

} // namespace constlint
