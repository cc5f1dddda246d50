#pragma once

#include "constlint/core/Severity.h"

#include <string>
#include <string_view>
#include <vector>

namespace constlint {

struct Config {
    // Rule selection. An empty enable list means every registered rule.
    std::vector<std::string> enabledRules;
    std::vector<std::string> disabledRules;

    // Minimum severity to emit
    Severity minSeverity        = Severity::Info;

    // Output
    std::string outputFormat    = "cli";   // cli | json | sarif
    std::string outputFile;                // empty = stdout

    // Scope. Without analyzeHeaders only the main file of each translation
    // unit is linted; system headers are never linted.
    bool analyzeHeaders         = false;
    std::vector<std::string> excludeFilePatterns;   // fnmatch-style

    bool isFileExcluded(std::string_view path) const;

    static Config loadFromFile(const std::string &path);
    static Config loadFromString(const std::string &yaml,
                                 const std::string &origin);
    static Config defaults();
};

} // namespace constlint
