#include "constlint/core/Config.h"

#include <llvm/Support/FileSystem.h>
#include <llvm/Support/raw_ostream.h>

#include <gtest/gtest.h>

namespace constlint::test {
namespace {

TEST(ConfigTest, DefaultsLintEverythingInMainFiles) {
    Config cfg = Config::defaults();
    EXPECT_TRUE(cfg.enabledRules.empty());
    EXPECT_TRUE(cfg.disabledRules.empty());
    EXPECT_EQ(cfg.minSeverity, Severity::Info);
    EXPECT_EQ(cfg.outputFormat, "cli");
    EXPECT_TRUE(cfg.outputFile.empty());
    EXPECT_FALSE(cfg.analyzeHeaders);
}

TEST(ConfigTest, ParsesAllKeys) {
    Config cfg = Config::loadFromString(
        "enabled_rules: [unnecessary-const]\n"
        "disabled_rules: [prefer-const-locals]\n"
        "min_severity: warning\n"
        "output_format: sarif\n"
        "output_file: out.sarif\n"
        "analyze_headers: true\n"
        "exclude_file_patterns: ['*/third_party/*', '*.pb.cc']\n",
        "inline");

    ASSERT_EQ(cfg.enabledRules.size(), 1u);
    EXPECT_EQ(cfg.enabledRules[0], "unnecessary-const");
    ASSERT_EQ(cfg.disabledRules.size(), 1u);
    EXPECT_EQ(cfg.minSeverity, Severity::Warning);
    EXPECT_EQ(cfg.outputFormat, "sarif");
    EXPECT_EQ(cfg.outputFile, "out.sarif");
    EXPECT_TRUE(cfg.analyzeHeaders);
    EXPECT_EQ(cfg.excludeFilePatterns.size(), 2u);
}

TEST(ConfigTest, MalformedInputFallsBackToDefaults) {
    Config cfg = Config::loadFromString("min_severity: loud\n", "inline");
    EXPECT_EQ(cfg.minSeverity, Severity::Info);

    cfg = Config::loadFromString("enabled_rules: {not: a-list}\n", "inline");
    EXPECT_TRUE(cfg.enabledRules.empty());
}

TEST(ConfigTest, MissingFileFallsBackToDefaults) {
    Config cfg = Config::loadFromFile("/nonexistent/constlint.config.yaml");
    EXPECT_EQ(cfg.outputFormat, "cli");
    EXPECT_TRUE(cfg.enabledRules.empty());
}

TEST(ConfigTest, LoadsFromFile) {
    llvm::SmallString<128> path;
    int fd = -1;
    ASSERT_FALSE(llvm::sys::fs::createTemporaryFile("constlint", "yaml", fd, path));
    {
        llvm::raw_fd_ostream os(fd, /*shouldClose=*/true);
        os << "min_severity: error\nanalyze_headers: true\n";
    }

    Config cfg = Config::loadFromFile(std::string(path));
    EXPECT_EQ(cfg.minSeverity, Severity::Error);
    EXPECT_TRUE(cfg.analyzeHeaders);

    llvm::sys::fs::remove(path);
}

TEST(ConfigTest, ExcludePatternsUseFnmatch) {
    Config cfg = Config::defaults();
    cfg.excludeFilePatterns = {"*/third_party/*", "*.pb.cc"};

    EXPECT_TRUE(cfg.isFileExcluded("/src/third_party/zlib/inflate.c"));
    EXPECT_TRUE(cfg.isFileExcluded("gen/message.pb.cc"));
    EXPECT_FALSE(cfg.isFileExcluded("/src/app/main.cc"));
}

} // namespace
} // namespace constlint::test
