#include "constlint/analysis/NodeLintRegistry.h"

namespace constlint {

SimpleLintVisitor &
NodeLintRegistry::adopt(std::unique_ptr<SimpleLintVisitor> visitor) {
    owned_.push_back(std::move(visitor));
    return *owned_.back();
}

NodeLintRegistry &
NodeLintRegistry::addFormalParameterList(const Rule &rule,
                                         SimpleLintVisitor &visitor) {
    formalParameterList_.push_back({&rule, &visitor});
    return *this;
}

NodeLintRegistry &
NodeLintRegistry::addForStatement(const Rule &rule, SimpleLintVisitor &visitor) {
    forStatement_.push_back({&rule, &visitor});
    return *this;
}

NodeLintRegistry &
NodeLintRegistry::addVariableDeclarationStatement(const Rule &rule,
                                                  SimpleLintVisitor &visitor) {
    variableDeclarationStatement_.push_back({&rule, &visitor});
    return *this;
}

} // namespace constlint
