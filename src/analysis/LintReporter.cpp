#include "constlint/analysis/LintReporter.h"
#include "constlint/core/Rule.h"

#include <clang/Basic/SourceManager.h>

namespace constlint {

LintReporter::LintReporter(const clang::SourceManager &SM,
                           std::vector<Diagnostic> &diagnostics)
    : sm_(SM), diagnostics_(diagnostics) {}

void LintReporter::reportLintForToken(const Rule &rule,
                                      clang::SourceLocation token,
                                      const LintCode &code,
                                      std::string declarationName,
                                      std::string structuralEvidence) {
    Diagnostic diag;
    diag.ruleID     = std::string(rule.getID());
    diag.code       = std::string(code.name);
    diag.message    = std::string(code.problemMessage);
    diag.correction = std::string(code.correctionMessage);
    diag.severity   = rule.getBaseSeverity();

    if (token.isValid()) {
        auto loc = sm_.getSpellingLoc(token);
        diag.location.file   = sm_.getFilename(loc).str();
        diag.location.line   = sm_.getSpellingLineNumber(loc);
        diag.location.column = sm_.getSpellingColumnNumber(loc);
    }

    diag.declarationName    = std::move(declarationName);
    diag.structuralEvidence = std::move(structuralEvidence);

    diagnostics_.push_back(std::move(diag));
    ++reported_;
}

} // namespace constlint
