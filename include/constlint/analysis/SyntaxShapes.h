#pragma once

#include <llvm/ADT/ArrayRef.h>

#include <cstdint>
#include <string_view>

namespace clang {
class FunctionDecl;
class ParmVarDecl;
class Stmt;
class VarDecl;
} // namespace clang

namespace constlint {

// Parameters of a function, method, constructor, or explicit lambda
// parameter list, in declaration order.
struct FormalParameterList {
    const clang::FunctionDecl *function = nullptr;
    llvm::ArrayRef<clang::ParmVarDecl *> parameters;
};

// Closed set of parameter shapes. The concrete kinds differ in how the
// parameter is consumed, not in how it is declared.
enum class ParameterKind : uint8_t {
    Plain,
    MemberInitializing,   // Constructor parameter read by a member initializer
    BaseInitializing,     // Constructor parameter forwarded to a base or
                          // delegating initializer
    Unknown,              // Implicit or without written type information
};

constexpr std::string_view parameterKindName(ParameterKind k) {
    switch (k) {
        case ParameterKind::Plain:              return "plain";
        case ParameterKind::MemberInitializing: return "member-initializing";
        case ParameterKind::BaseInitializing:   return "base-initializing";
        case ParameterKind::Unknown:            return "unknown";
    }
    return "unknown";
}

ParameterKind classifyParameter(const clang::ParmVarDecl *P);

enum class ForLoopPartsKind : uint8_t {
    ForEachWithDeclaration,   // for (const auto x : xs), for (id x in xs)
    ForEachWithIdentifier,    // for (x in xs): x is declared outside the loop
    ForCounted,               // for (init; cond; inc)
    Unknown,
};

struct ForLoopParts {
    ForLoopPartsKind kind = ForLoopPartsKind::Unknown;
    // Set only for ForEachWithDeclaration.
    const clang::VarDecl *loopVariable = nullptr;
};

ForLoopParts getForLoopParts(const clang::Stmt *S);

} // namespace constlint
