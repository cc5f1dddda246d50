#include "constlint/output/OutputFormatter.h"
#include "constlint/core/Version.h"

#include <sstream>

namespace constlint {

namespace {

std::string escape(const std::string &s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\t': out += "\\t";  break;
            default:   out += c;      break;
        }
    }
    return out;
}

void writeDiagnostics(std::ostringstream &os,
                      const std::vector<Diagnostic> &diagnostics) {
    os << "  \"diagnostics\": [\n";

    for (size_t i = 0; i < diagnostics.size(); ++i) {
        const auto &d = diagnostics[i];
        os << "    {\n";
        os << "      \"ruleID\": \"" << escape(d.ruleID) << "\",\n";
        os << "      \"code\": \"" << escape(d.code) << "\",\n";
        os << "      \"severity\": \"" << severityToString(d.severity) << "\",\n";
        os << "      \"message\": \"" << escape(d.message) << "\",\n";
        os << "      \"correction\": \"" << escape(d.correction) << "\",\n";
        os << "      \"location\": {\n";
        os << "        \"file\": \"" << escape(d.location.file) << "\",\n";
        os << "        \"line\": " << d.location.line << ",\n";
        os << "        \"column\": " << d.location.column << "\n";
        os << "      },\n";
        os << "      \"declaration\": \"" << escape(d.declarationName) << "\",\n";
        os << "      \"structuralEvidence\": \"" << escape(d.structuralEvidence) << "\"\n";
        os << "    }";
        if (i + 1 < diagnostics.size()) os << ",";
        os << "\n";
    }

    os << "  ]\n";
}

} // anonymous namespace

std::string JSONOutputFormatter::format(const std::vector<Diagnostic> &diagnostics) {
    std::ostringstream os;
    os << "{\n  \"version\": \"" << kToolVersion << "\",\n";
    writeDiagnostics(os, diagnostics);
    os << "}\n";
    return os.str();
}

std::string JSONOutputFormatter::format(const std::vector<Diagnostic> &diagnostics,
                                        const ExecutionMetadata &meta) {
    std::ostringstream os;
    os << "{\n  \"version\": \"" << escape(meta.toolVersion) << "\",\n";

    os << "  \"metadata\": {\n";
    os << "    \"configPath\": \"" << escape(meta.configPath) << "\",\n";
    os << "    \"timestampEpochSec\": " << meta.timestampEpochSec << ",\n";
    os << "    \"sourceFiles\": [";
    for (size_t i = 0; i < meta.sourceFiles.size(); ++i) {
        os << "\"" << escape(meta.sourceFiles[i]) << "\"";
        if (i + 1 < meta.sourceFiles.size()) os << ", ";
    }
    os << "],\n";
    os << "    \"enabledRules\": [";
    for (size_t i = 0; i < meta.enabledRules.size(); ++i) {
        os << "\"" << escape(meta.enabledRules[i]) << "\"";
        if (i + 1 < meta.enabledRules.size()) os << ", ";
    }
    os << "]\n";
    os << "  },\n";

    writeDiagnostics(os, diagnostics);
    os << "}\n";
    return os.str();
}

} // namespace constlint
