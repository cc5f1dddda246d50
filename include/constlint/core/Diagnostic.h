#pragma once

#include "constlint/core/Severity.h"

#include <string>
#include <tuple>

namespace constlint {

struct SourceLocation {
    std::string file;
    unsigned line   = 0;
    unsigned column = 0;
};

inline bool operator<(const SourceLocation &a, const SourceLocation &b) {
    return std::tie(a.file, a.line, a.column) <
           std::tie(b.file, b.line, b.column);
}

inline bool operator==(const SourceLocation &a, const SourceLocation &b) {
    return a.file == b.file && a.line == b.line && a.column == b.column;
}

struct Diagnostic {
    std::string    ruleID;
    std::string    code;
    std::string    message;
    std::string    correction;
    Severity       severity = Severity::Info;
    SourceLocation location;            // Anchored at the offending token
    std::string    declarationName;     // e.g. "x" or "a, b" for grouped decls
    std::string    structuralEvidence;
};

} // namespace constlint
