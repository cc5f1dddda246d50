#pragma once

#include "constlint/analysis/ConstlintASTConsumer.h"
#include "constlint/core/Config.h"
#include "constlint/core/Diagnostic.h"
#include "constlint/rules/UnnecessaryConst.h"

#include <clang/Frontend/ASTUnit.h>
#include <clang/Tooling/Tooling.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace constlint::test {

inline std::unique_ptr<clang::ASTUnit>
buildAST(const std::string &code, const std::string &fileName = "input.cc",
         std::vector<std::string> args = {"-std=c++20"}) {
    return clang::tooling::buildASTFromCodeWithArgs(code, args, fileName);
}

// Runs `rules` over `code` through the production consumer.
inline std::vector<Diagnostic>
lint(const std::string &code, const std::vector<const Rule *> &rules,
     const Config &cfg = Config::defaults(),
     const std::string &fileName = "input.cc",
     std::vector<std::string> args = {"-std=c++20"}) {
    std::vector<Diagnostic> diagnostics;
    auto ast = buildAST(code, fileName, std::move(args));
    EXPECT_TRUE(ast != nullptr);
    if (!ast)
        return diagnostics;
    EXPECT_FALSE(ast->getDiagnostics().hasErrorOccurred())
        << "test snippet does not compile";

    ConstlintASTConsumer consumer(cfg, rules, diagnostics);
    consumer.HandleTranslationUnit(ast->getASTContext());
    return diagnostics;
}

inline std::vector<Diagnostic>
lintUnnecessaryConst(const std::string &code,
                     const std::string &fileName = "input.cc",
                     std::vector<std::string> args = {"-std=c++20"}) {
    static const UnnecessaryConst rule{};
    return lint(code, {&rule}, Config::defaults(), fileName, std::move(args));
}

inline bool isWithType(const Diagnostic &d) {
    return d.correction == UnnecessaryConst::withType.correctionMessage;
}

inline bool isWithoutType(const Diagnostic &d) {
    return d.correction == UnnecessaryConst::withoutType.correctionMessage;
}

inline size_t countWithType(const std::vector<Diagnostic> &diags) {
    return std::count_if(diags.begin(), diags.end(), isWithType);
}

} // namespace constlint::test
