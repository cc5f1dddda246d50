#include "constlint/analysis/ConstlintAction.h"
#include "constlint/core/Config.h"
#include "constlint/core/Diagnostic.h"
#include "constlint/core/ExecutionMetadata.h"
#include "constlint/core/Rule.h"
#include "constlint/core/RuleRegistry.h"
#include "constlint/core/Severity.h"
#include "constlint/core/Version.h"
#include "constlint/output/OutputFormatter.h"

#include <clang/Tooling/CommonOptionsParser.h>
#include <clang/Tooling/Tooling.h>
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/raw_ostream.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace clang::tooling;

static llvm::cl::OptionCategory ConstlintCat("constlint options");

static llvm::cl::extrahelp CommonHelp(CommonOptionsParser::HelpMessage);

static llvm::cl::opt<std::string> ConfigPath(
    "config",
    llvm::cl::desc("Path to constlint.config.yaml"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(ConstlintCat));

static llvm::cl::opt<std::string> OutputFormat(
    "format",
    llvm::cl::desc("Output format (cli|json|sarif); overrides the config file"),
    llvm::cl::cat(ConstlintCat));

static llvm::cl::opt<std::string> OutputFile(
    "output",
    llvm::cl::desc("Write output to file instead of stdout"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(ConstlintCat));

static llvm::cl::opt<std::string> MinSev(
    "min-severity",
    llvm::cl::desc("Minimum severity to report (info|warning|error)"),
    llvm::cl::cat(ConstlintCat));

static llvm::cl::opt<bool> ListRules(
    "list-rules",
    llvm::cl::desc("Print the registered rules and exit"),
    llvm::cl::cat(ConstlintCat));

static llvm::cl::opt<std::string> Explain(
    "explain",
    llvm::cl::desc("Print the documentation of a rule and exit"),
    llvm::cl::value_desc("rule-id"),
    llvm::cl::cat(ConstlintCat));

namespace {

void printRules(llvm::raw_ostream &os) {
    for (const auto &rule : constlint::RuleRegistry::instance().rules()) {
        os << rule->getID() << " [" << constlint::ruleGroupName(rule->getGroup())
           << ", " << constlint::severityToString(rule->getBaseSeverity())
           << "]: " << rule->getDescription() << "\n";
        auto incompatible = rule->getIncompatibleRules();
        if (!incompatible.empty()) {
            os << "  incompatible with:";
            for (auto id : incompatible)
                os << " " << id;
            os << "\n";
        }
    }
}

bool emit(const std::string &output, const std::string &path) {
    if (path.empty()) {
        llvm::outs() << output;
        return true;
    }

    std::error_code EC;
    llvm::raw_fd_ostream file(path, EC, llvm::sys::fs::OF_Text);
    if (EC) {
        llvm::errs() << "constlint: error: cannot open output file '"
                     << path << "': " << EC.message() << "\n";
        return false;
    }
    file << output;
    return true;
}

} // anonymous namespace

int main(int argc, const char **argv) {
    // --list-rules and --explain need no sources.
    auto parser = CommonOptionsParser::create(argc, argv, ConstlintCat,
                                              llvm::cl::ZeroOrMore);
    if (!parser) {
        llvm::errs() << parser.takeError();
        return 2;
    }

    auto &registry = constlint::RuleRegistry::instance();

    if (ListRules) {
        printRules(llvm::outs());
        return 0;
    }

    if (!Explain.empty()) {
        const auto *rule = registry.findByID(Explain);
        if (!rule) {
            llvm::errs() << "constlint: error: unknown rule '" << Explain
                         << "'\n";
            return 2;
        }
        llvm::outs() << "# " << rule->getID() << "\n\n"
                     << rule->getDescription() << "\n\n" << rule->getDetails();
        return 0;
    }

    if (parser->getSourcePathList().empty()) {
        llvm::errs() << "constlint: error: no input files\n";
        return 2;
    }

    // Load config.
    constlint::Config cfg = ConfigPath.empty()
        ? constlint::Config::defaults()
        : constlint::Config::loadFromFile(ConfigPath);

    // CLI overrides.
    if (!OutputFile.empty())
        cfg.outputFile = OutputFile;
    if (!OutputFormat.empty())
        cfg.outputFormat = OutputFormat;
    if (!MinSev.empty()) {
        if (auto sev = constlint::parseSeverity(MinSev)) {
            cfg.minSeverity = *sev;
        } else {
            llvm::errs() << "constlint: warning: unknown severity '" << MinSev
                         << "', keeping '"
                         << constlint::severityToString(cfg.minSeverity)
                         << "'\n";
        }
    }

    auto formatter = constlint::makeOutputFormatter(cfg.outputFormat);
    if (!formatter) {
        llvm::errs() << "constlint: warning: unknown output format '"
                     << cfg.outputFormat << "', using cli\n";
        formatter = std::make_unique<constlint::CLIOutputFormatter>();
    }

    // Rule-set consistency.
    const auto enabledIDs = registry.enabledRuleIDs(cfg);
    for (const auto &id : enabledIDs) {
        if (!registry.findByID(id))
            llvm::errs() << "constlint: warning: unknown rule '" << id
                         << "' in configuration\n";
    }
    const auto conflicts = registry.findIncompatibilities(enabledIDs);
    for (const auto &c : conflicts) {
        llvm::errs() << "constlint: error: rule '" << c.ruleID
                     << "' is incompatible with enabled rule '"
                     << c.incompatibleID << "'\n";
    }
    if (!conflicts.empty())
        return 2;

    const auto rules = registry.enabledRules(cfg);
    if (rules.empty())
        llvm::errs() << "constlint: warning: no rules enabled\n";

    // Build execution metadata for output provenance.
    constlint::ExecutionMetadata execMeta;
    execMeta.toolVersion = constlint::kToolVersion;
    execMeta.configPath = ConfigPath.getValue();
    execMeta.timestampEpochSec = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    execMeta.sourceFiles.assign(parser->getSourcePathList().begin(),
                                parser->getSourcePathList().end());
    for (const auto *rule : rules)
        execMeta.enabledRules.emplace_back(rule->getID());

    // Run analysis.
    ClangTool tool(parser->getCompilations(), parser->getSourcePathList());

    std::vector<constlint::Diagnostic> diagnostics;
    constlint::ConstlintActionFactory factory(cfg, rules, diagnostics);

    int ret = tool.run(&factory);

    // Filter minimum severity.
    diagnostics.erase(
        std::remove_if(diagnostics.begin(), diagnostics.end(),
                       [&](const constlint::Diagnostic &d) {
                           return !(d.severity >= cfg.minSeverity);
                       }),
        diagnostics.end());

    // Sort by file/line/column. A header shared by several translation units
    // reports the same token more than once.
    std::sort(diagnostics.begin(), diagnostics.end(),
              [](const constlint::Diagnostic &a, const constlint::Diagnostic &b) {
                  if (!(a.location == b.location))
                      return a.location < b.location;
                  return a.ruleID < b.ruleID;
              });
    diagnostics.erase(
        std::unique(diagnostics.begin(), diagnostics.end(),
                    [](const constlint::Diagnostic &a,
                       const constlint::Diagnostic &b) {
                        return a.location == b.location &&
                               a.ruleID == b.ruleID && a.code == b.code;
                    }),
        diagnostics.end());

    std::string output = formatter->format(diagnostics, execMeta);

    if (!emit(output, cfg.outputFile))
        return 2;

    return ret == 0 ? (diagnostics.empty() ? 0 : 1) : 2;
}
