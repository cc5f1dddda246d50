#include "constlint/core/Config.h"

#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/SourceMgr.h>
#include <llvm/Support/YAMLParser.h>
#include <llvm/Support/YAMLTraits.h>
#include <llvm/Support/raw_ostream.h>

#include <fnmatch.h>

// YAML mapping for Config via llvm::yaml.

namespace llvm {
namespace yaml {

template <>
struct ScalarEnumerationTraits<constlint::Severity> {
    static void enumeration(IO &io, constlint::Severity &sev) {
        io.enumCase(sev, "info",    constlint::Severity::Info);
        io.enumCase(sev, "warning", constlint::Severity::Warning);
        io.enumCase(sev, "error",   constlint::Severity::Error);
    }
};

template <>
struct MappingTraits<constlint::Config> {
    static void mapping(IO &io, constlint::Config &cfg) {
        io.mapOptional("enabled_rules",         cfg.enabledRules);
        io.mapOptional("disabled_rules",        cfg.disabledRules);
        io.mapOptional("min_severity",          cfg.minSeverity);
        io.mapOptional("output_format",         cfg.outputFormat);
        io.mapOptional("output_file",           cfg.outputFile);
        io.mapOptional("analyze_headers",       cfg.analyzeHeaders);
        io.mapOptional("exclude_file_patterns", cfg.excludeFilePatterns);
    }
};

} // namespace yaml
} // namespace llvm

namespace constlint {

bool Config::isFileExcluded(std::string_view path) const {
    std::string p(path);
    for (const auto &pat : excludeFilePatterns) {
        if (fnmatch(pat.c_str(), p.c_str(), 0) == 0)
            return true;
    }
    return false;
}

Config Config::defaults() {
    return Config{};
}

Config Config::loadFromString(const std::string &yaml,
                              const std::string &origin) {
    Config cfg = defaults();
    if (yaml.empty())
        return cfg;

    // Parse errors are reported through our own warning, not the default
    // SourceMgr printer.
    llvm::yaml::Input yin(yaml, nullptr,
                          [](const llvm::SMDiagnostic &, void *) {});
    yin >> cfg;

    if (yin.error()) {
        llvm::errs() << "constlint: warning: config parse error in '"
                     << origin << "', using defaults\n";
        return defaults();
    }

    return cfg;
}

Config Config::loadFromFile(const std::string &path) {
    auto bufOrErr = llvm::MemoryBuffer::getFile(path);
    if (!bufOrErr) {
        llvm::errs() << "constlint: warning: cannot open config '"
                     << path << "': " << bufOrErr.getError().message()
                     << ", using defaults\n";
        return defaults();
    }

    return loadFromString(bufOrErr.get()->getBuffer().str(), path);
}

} // namespace constlint
