#include "constlint/rules/UnnecessaryConst.h"
#include "constlint/analysis/LintReporter.h"
#include "constlint/analysis/LinterContext.h"
#include "constlint/analysis/NodeLintRegistry.h"
#include "constlint/analysis/QualifierExtractor.h"
#include "constlint/core/RuleRegistry.h"

#include <clang/AST/ASTContext.h>
#include <clang/AST/Decl.h>
#include <clang/AST/DeclCXX.h>
#include <clang/AST/Stmt.h>

#include <sstream>
#include <vector>

namespace constlint {

namespace {

constexpr std::string_view kDetails = R"md(Use a plain declaration, not `const`,
for local variables and by-value parameters.

There are two styles in wide use for locals. This rule enforces the
mutable-by-default style, where `const` is reserved for data members and for
values shared beyond one function. For the alternative style that prefers
`const`, enable `prefer-const-locals` and `prefer-const-parameters` instead.

Top-level `const` on a by-value parameter is not part of the function type,
so in a declaration it has no effect at all.

When the type is written, remove the `const`. When the type is deduced,
replace `const auto` with `auto`.

**BAD:**
```cpp
void badFunction(const int count) {
  const auto label = std::string("const or mutable?");
  for (const auto c : label) {
    std::putchar(c);
  }
}
```

**GOOD:**
```cpp
void goodFunction(int count) {
  auto label = std::string("const or mutable?");
  for (auto c : label) {
    std::putchar(c);
  }
}
```
)md";

std::string variableName(const clang::VarDecl *VD) {
    if (const auto *DD = llvm::dyn_cast<clang::DecompositionDecl>(VD)) {
        std::string names = "[";
        for (const auto *B : DD->bindings()) {
            if (names.size() > 1)
                names += ", ";
            names += B->getNameAsString();
        }
        return names + "]";
    }
    std::string name = VD->getNameAsString();
    return name.empty() ? "<unnamed>" : name;
}

std::string joinedNames(const std::vector<const clang::VarDecl *> &vars) {
    std::string names;
    for (const auto *VD : vars) {
        if (!names.empty())
            names += ", ";
        names += variableName(VD);
    }
    return names;
}

const char *yesNo(bool b) { return b ? "yes" : "no"; }

class Visitor : public SimpleLintVisitor {
public:
    Visitor(const UnnecessaryConst &rule, LinterContext &context)
        : rule_(rule), context_(context) {}

    void visitFormalParameterList(const FormalParameterList &list) override {
        const auto &Ctx = context_.astContext();
        for (const auto *param : list.parameters) {
            const auto cand = extractParameter(param, Ctx);
            if (!cand.hasQualifier || !cand.qualifierToken)
                continue;

            std::ostringstream ev;
            ev << "shape=parameter"
               << "; kind=" << parameterKindName(classifyParameter(param))
               << "; default_value=" << yesNo(param->hasDefaultArg())
               << "; explicit_type=" << yesNo(cand.hasExplicitType);
            report(*cand.qualifierToken, cand.hasExplicitType,
                   variableName(param), ev.str());
        }
    }

    void visitForStatement(const clang::Stmt *S) override {
        const auto parts = getForLoopParts(S);
        // In `for (x in xs)` the loop binds a variable declared elsewhere,
        // and a counted loop has no loop variable in this sense.
        if (parts.kind != ForLoopPartsKind::ForEachWithDeclaration)
            return;

        const auto cand = extractLoopVariable(parts, context_.astContext());
        if (!cand.hasQualifier || !cand.qualifierToken)
            return;

        std::ostringstream ev;
        ev << "shape=for_each; explicit_type=" << yesNo(cand.hasExplicitType);
        report(*cand.qualifierToken, cand.hasExplicitType,
               variableName(parts.loopVariable), ev.str());
    }

    void visitVariableDeclarationStatement(const clang::DeclStmt *S) override {
        for (const auto &q : extractDeclarationStatement(S, context_.astContext())) {
            const auto &cand = q.candidate;
            if (!cand.hasQualifier || !cand.qualifierToken)
                continue;

            std::ostringstream ev;
            ev << "shape=declaration_statement; variables=" << q.variables.size()
               << "; explicit_type=" << yesNo(cand.hasExplicitType);
            report(*cand.qualifierToken, cand.hasExplicitType,
                   joinedNames(q.variables), ev.str());
        }
    }

private:
    void report(clang::SourceLocation token, bool hasExplicitType,
                std::string name, std::string evidence) {
        context_.reporter().reportLintForToken(
            rule_, token, UnnecessaryConst::classify(hasExplicitType),
            std::move(name), std::move(evidence));
    }

    const UnnecessaryConst &rule_;
    LinterContext &context_;
};

} // anonymous namespace

std::string_view UnnecessaryConst::getDetails() const {
    return kDetails;
}

void UnnecessaryConst::registerNodeProcessors(NodeLintRegistry &registry,
                                              LinterContext &context) const {
    auto &visitor = registry.adopt(std::make_unique<Visitor>(*this, context));
    registry.addFormalParameterList(*this, visitor)
            .addForStatement(*this, visitor)
            .addVariableDeclarationStatement(*this, visitor);
}

CONSTLINT_REGISTER_RULE(UnnecessaryConst)

} // namespace constlint
