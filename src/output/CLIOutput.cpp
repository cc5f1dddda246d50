#include "constlint/output/OutputFormatter.h"

#include <sstream>

namespace constlint {

std::string CLIOutputFormatter::format(const std::vector<Diagnostic> &diagnostics) {
    std::ostringstream os;

    for (const auto &d : diagnostics) {
        os << d.location.file << ":" << d.location.line << ":"
           << d.location.column << ": ";

        os << severityToString(d.severity) << ": " << d.message
           << " [" << d.ruleID << "]\n";

        if (!d.declarationName.empty())
            os << "  Declaration: " << d.declarationName << "\n";
        if (!d.correction.empty())
            os << "  Correction: " << d.correction << "\n";
        if (!d.structuralEvidence.empty())
            os << "  Evidence: " << d.structuralEvidence << "\n";

        os << "\n";
    }

    if (diagnostics.empty())
        os << "constlint: no findings.\n";
    else
        os << "constlint: " << diagnostics.size() << " finding(s).\n";

    return os.str();
}

std::unique_ptr<OutputFormatter> makeOutputFormatter(std::string_view name) {
    if (name == "cli")
        return std::make_unique<CLIOutputFormatter>();
    if (name == "json")
        return std::make_unique<JSONOutputFormatter>();
    if (name == "sarif")
        return std::make_unique<SARIFOutputFormatter>();
    return nullptr;
}

} // namespace constlint
