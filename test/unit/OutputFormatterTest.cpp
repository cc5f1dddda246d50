#include "constlint/output/OutputFormatter.h"

#include <gtest/gtest.h>

namespace constlint::test {
namespace {

Diagnostic sampleDiagnostic() {
    Diagnostic d;
    d.ruleID = "unnecessary-const";
    d.code = "unnecessary-const";
    d.message = "Local variables should not be marked as 'const'.";
    d.correction = "Remove the 'const'.";
    d.severity = Severity::Info;
    d.location = {"src/widget.cc", 12, 5};
    d.declarationName = "count";
    d.structuralEvidence = "shape=declaration_statement; variables=1; explicit_type=yes";
    return d;
}

bool contains(const std::string &haystack, const std::string &needle) {
    return haystack.find(needle) != std::string::npos;
}

TEST(OutputFormatterTest, CLIListsFindingsAndSummary) {
    CLIOutputFormatter fmt;
    std::string out = fmt.format({sampleDiagnostic()});

    EXPECT_TRUE(contains(out, "src/widget.cc:12:5: info: Local variables should "
                              "not be marked as 'const'. [unnecessary-const]"));
    EXPECT_TRUE(contains(out, "Correction: Remove the 'const'."));
    EXPECT_TRUE(contains(out, "Declaration: count"));
    EXPECT_TRUE(contains(out, "constlint: 1 finding(s)."));

    EXPECT_TRUE(contains(fmt.format({}), "constlint: no findings."));
}

TEST(OutputFormatterTest, JSONEscapesAndCarriesMetadata) {
    JSONOutputFormatter fmt;
    ExecutionMetadata meta;
    meta.toolVersion = "9.9.9";
    meta.sourceFiles = {"a.cc"};
    meta.enabledRules = {"unnecessary-const"};

    std::string out = fmt.format({sampleDiagnostic()}, meta);
    EXPECT_TRUE(contains(out, "\"version\": \"9.9.9\""));
    EXPECT_TRUE(contains(out, "\"sourceFiles\": [\"a.cc\"]"));
    EXPECT_TRUE(contains(out, "\"ruleID\": \"unnecessary-const\""));
    EXPECT_TRUE(contains(out, "\"line\": 12"));
    EXPECT_TRUE(contains(out, "\"declaration\": \"count\""));

    Diagnostic quoted = sampleDiagnostic();
    quoted.declarationName = "say \"hi\"";
    EXPECT_TRUE(contains(fmt.format({quoted}), "say \\\"hi\\\""));
}

TEST(OutputFormatterTest, SARIFDescribesRegisteredRules) {
    SARIFOutputFormatter fmt;
    std::string out = fmt.format({sampleDiagnostic()});

    EXPECT_TRUE(contains(out, "\"version\": \"2.1.0\""));
    EXPECT_TRUE(contains(out, "\"id\": \"unnecessary-const\""));
    EXPECT_TRUE(contains(out, "Don't use 'const' for local variables."));
    EXPECT_TRUE(contains(out, "\"level\": \"note\""));
    EXPECT_TRUE(contains(out, "\"startLine\": 12"));
    EXPECT_TRUE(contains(out, "\"tags\": [\"style\"]"));
    EXPECT_TRUE(contains(out, "\"fullDescription\": { \"text\": \"Remove the "
                              "'const'. Replace 'const auto' with 'auto'.\""));
}

TEST(OutputFormatterTest, FactoryKnowsThreeFormats) {
    EXPECT_NE(makeOutputFormatter("cli"), nullptr);
    EXPECT_NE(makeOutputFormatter("json"), nullptr);
    EXPECT_NE(makeOutputFormatter("sarif"), nullptr);
    EXPECT_EQ(makeOutputFormatter("xml"), nullptr);
}

} // namespace
} // namespace constlint::test
