#pragma once

#include "constlint/core/Diagnostic.h"
#include "constlint/core/ExecutionMetadata.h"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace constlint {

class OutputFormatter {
public:
    virtual ~OutputFormatter() = default;
    virtual std::string format(const std::vector<Diagnostic> &diagnostics) = 0;
    virtual std::string format(const std::vector<Diagnostic> &diagnostics,
                               const ExecutionMetadata &meta) {
        return format(diagnostics);
    }
};

class CLIOutputFormatter : public OutputFormatter {
public:
    std::string format(const std::vector<Diagnostic> &diagnostics) override;
};

class JSONOutputFormatter : public OutputFormatter {
public:
    std::string format(const std::vector<Diagnostic> &diagnostics) override;
    std::string format(const std::vector<Diagnostic> &diagnostics,
                       const ExecutionMetadata &meta) override;
};

class SARIFOutputFormatter : public OutputFormatter {
public:
    std::string format(const std::vector<Diagnostic> &diagnostics) override;
    std::string format(const std::vector<Diagnostic> &diagnostics,
                       const ExecutionMetadata &meta) override;
};

// nullptr for an unknown format name.
std::unique_ptr<OutputFormatter> makeOutputFormatter(std::string_view name);

} // namespace constlint
