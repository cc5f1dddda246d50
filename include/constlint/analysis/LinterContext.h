#pragma once

namespace clang {
class ASTContext;
} // namespace clang

namespace constlint {

struct Config;
class LintReporter;

// What a rule may see while its processors run over one translation unit.
class LinterContext {
public:
    LinterContext(clang::ASTContext &ctx, const Config &cfg,
                  LintReporter &reporter)
        : ctx_(ctx), config_(cfg), reporter_(reporter) {}

    clang::ASTContext &astContext() const { return ctx_; }
    const Config &config() const { return config_; }
    LintReporter &reporter() const { return reporter_; }

private:
    clang::ASTContext &ctx_;
    const Config &config_;
    LintReporter &reporter_;
};

} // namespace constlint
