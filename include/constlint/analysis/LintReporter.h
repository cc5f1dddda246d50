#pragma once

#include "constlint/core/Diagnostic.h"
#include "constlint/core/LintCode.h"

#include <clang/Basic/SourceLocation.h>

#include <string>
#include <vector>

namespace clang {
class SourceManager;
} // namespace clang

namespace constlint {

class Rule;

// Diagnostic sink for one translation unit. Records are appended to a
// vector owned by the caller.
class LintReporter {
public:
    LintReporter(const clang::SourceManager &SM,
                 std::vector<Diagnostic> &diagnostics);

    void reportLintForToken(const Rule &rule,
                            clang::SourceLocation token,
                            const LintCode &code,
                            std::string declarationName = {},
                            std::string structuralEvidence = {});

    size_t reportedCount() const { return reported_; }

private:
    const clang::SourceManager &sm_;
    std::vector<Diagnostic> &diagnostics_;
    size_t reported_ = 0;
};

} // namespace constlint
