#include "constlint/output/OutputFormatter.h"
#include "constlint/core/Rule.h"
#include "constlint/core/RuleRegistry.h"
#include "constlint/core/Version.h"

#include <algorithm>
#include <cstdio>
#include <sstream>

namespace constlint {

namespace {

std::string sarifEscape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 16);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x",
                             static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string sarifLevel(Severity sev) {
    switch (sev) {
        case Severity::Error:   return "error";
        case Severity::Warning: return "warning";
        case Severity::Info:    return "note";
    }
    return "note";
}

// Correction text of every lint code the rule reports, each once.
std::string corrections(const Rule &rule) {
    std::string text;
    std::vector<std::string_view> seen;
    for (const auto &code : rule.getLintCodes()) {
        if (code.correctionMessage.empty() ||
            std::find(seen.begin(), seen.end(), code.correctionMessage) != seen.end())
            continue;
        seen.push_back(code.correctionMessage);
        if (!text.empty())
            text += " ";
        text += code.correctionMessage;
    }
    return text;
}

void writeRuleDescriptors(std::ostringstream &os,
                          const std::vector<Diagnostic> &diagnostics) {
    std::vector<std::string> seenRules;
    for (const auto &d : diagnostics) {
        bool found = false;
        for (const auto &r : seenRules)
            if (r == d.ruleID) { found = true; break; }
        if (!found)
            seenRules.push_back(d.ruleID);
    }

    os << "        \"rules\": [";
    for (size_t i = 0; i < seenRules.size(); ++i) {
        const std::string &rid = seenRules[i];
        const Rule *rule = RuleRegistry::instance().findByID(rid);

        os << "\n          {\n";
        os << "            \"id\": \"" << sarifEscape(rid) << "\"";
        if (rule) {
            os << ",\n            \"shortDescription\": { \"text\": \""
               << sarifEscape(rule->getDescription()) << "\" },\n";
            os << "            \"fullDescription\": { \"text\": \""
               << sarifEscape(corrections(*rule)) << "\", \"markdown\": \""
               << sarifEscape(rule->getDetails()) << "\" },\n";
            os << "            \"defaultConfiguration\": { \"level\": \""
               << sarifLevel(rule->getBaseSeverity()) << "\" },\n";
            os << "            \"properties\": { \"tags\": [\""
               << ruleGroupName(rule->getGroup()) << "\"] }";
        }
        os << "\n          }";
        if (i + 1 < seenRules.size()) os << ",";
    }
    os << "\n        ]\n";
}

void writeResults(std::ostringstream &os,
                  const std::vector<Diagnostic> &diagnostics) {
    os << "    \"results\": [";

    for (size_t i = 0; i < diagnostics.size(); ++i) {
        const auto &d = diagnostics[i];

        os << "\n      {\n";
        os << "        \"ruleId\": \"" << sarifEscape(d.ruleID) << "\",\n";
        os << "        \"level\": \"" << sarifLevel(d.severity) << "\",\n";
        os << "        \"message\": { \"text\": \"" << sarifEscape(d.message)
           << " " << sarifEscape(d.correction) << "\" },\n";

        os << "        \"locations\": [{\n";
        os << "          \"physicalLocation\": {\n";
        os << "            \"artifactLocation\": { \"uri\": \"" << sarifEscape(d.location.file) << "\" },\n";
        os << "            \"region\": {\n";
        os << "              \"startLine\": " << (d.location.line > 0 ? d.location.line : 1) << ",\n";
        os << "              \"startColumn\": " << (d.location.column > 0 ? d.location.column : 1) << "\n";
        os << "            }\n";
        os << "          }";

        if (!d.declarationName.empty()) {
            os << ",\n          \"logicalLocations\": [{\n";
            os << "            \"name\": \"" << sarifEscape(d.declarationName) << "\",\n";
            os << "            \"kind\": \"variable\"\n";
            os << "          }]";
        }

        os << "\n        }],\n";

        os << "        \"properties\": {\n";
        os << "          \"code\": \"" << sarifEscape(d.code) << "\",\n";
        os << "          \"structuralEvidence\": \"" << sarifEscape(d.structuralEvidence) << "\"\n";
        os << "        }\n";
        os << "      }";
        if (i + 1 < diagnostics.size()) os << ",";
    }

    os << "\n    ]\n";
}

std::string formatRun(const std::vector<Diagnostic> &diagnostics,
                      const ExecutionMetadata *meta) {
    std::ostringstream os;

    os << "{\n";
    os << "  \"$schema\": \"https://raw.githubusercontent.com/oasis-tcs/sarif-spec/main/sarif-2.1/schema/sarif-schema-2.1.0.json\",\n";
    os << "  \"version\": \"2.1.0\",\n";
    os << "  \"runs\": [{\n";

    os << "    \"tool\": {\n";
    os << "      \"driver\": {\n";
    os << "        \"name\": \"" << kToolName << "\",\n";
    os << "        \"version\": \""
       << sarifEscape(meta ? meta->toolVersion : kToolVersion) << "\",\n";
    writeRuleDescriptors(os, diagnostics);
    os << "      }\n";
    os << "    },\n";

    if (meta) {
        // Invocations: execution provenance.
        os << "    \"invocations\": [{\n";
        os << "      \"executionSuccessful\": true,\n";
        os << "      \"properties\": {\n";
        os << "        \"timestampEpochSec\": " << meta->timestampEpochSec << ",\n";
        os << "        \"configPath\": \"" << sarifEscape(meta->configPath) << "\",\n";
        os << "        \"enabledRules\": [";
        for (size_t i = 0; i < meta->enabledRules.size(); ++i) {
            os << "\"" << sarifEscape(meta->enabledRules[i]) << "\"";
            if (i + 1 < meta->enabledRules.size()) os << ", ";
        }
        os << "]\n";
        os << "      }\n";
        os << "    }],\n";

        if (!meta->sourceFiles.empty()) {
            os << "    \"artifacts\": [";
            for (size_t i = 0; i < meta->sourceFiles.size(); ++i) {
                os << "\n      { \"location\": { \"uri\": \"" << sarifEscape(meta->sourceFiles[i]) << "\" } }";
                if (i + 1 < meta->sourceFiles.size()) os << ",";
            }
            os << "\n    ],\n";
        }
    }

    writeResults(os, diagnostics);

    os << "  }]\n";
    os << "}\n";

    return os.str();
}

} // anonymous namespace

std::string SARIFOutputFormatter::format(
    const std::vector<Diagnostic> &diagnostics) {
    return formatRun(diagnostics, nullptr);
}

std::string SARIFOutputFormatter::format(
    const std::vector<Diagnostic> &diagnostics,
    const ExecutionMetadata &meta) {
    return formatRun(diagnostics, &meta);
}

} // namespace constlint
