//! # Diagnostic Output Tests
//!
//! Tests for the text and JSON diagnostic emitter, the conversion from lint
//! issues and the run summary.

#include "cli/commands/cmd_lint.hpp"
#include "cli/diagnostic.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <string>

using namespace domainfix;
using namespace domainfix::cli;

namespace {

const std::string CONTENT = "<?php\necho __( 'a', 'old' );\n";

auto make_issue(bool with_fix) -> linter::LintIssue {
    linter::LintIssue issue;
    issue.file = "a.php";
    issue.line = 2;
    issue.column = 15;
    issue.length = 5;
    issue.end_line = 2;
    issue.end_column = 19;
    issue.code = "TextDomain.ReplaceDomain";
    issue.message = "Text domain \"old\" in function __() should be replaced with \"new\".";
    issue.fixable = true;
    if (with_fix) {
        issue.replacement = "'new'";
    }
    return issue;
}

} // anonymous namespace

// ============================================================================
// Issue Conversion
// ============================================================================

TEST(IssueToDiagnosticTest, CopiesLocationAndFix) {
    auto issue = make_issue(true);
    auto diag = issue_to_diagnostic(issue);

    EXPECT_EQ(diag.code, "TextDomain.ReplaceDomain");
    EXPECT_EQ(diag.primary_span.start.file, "a.php");
    EXPECT_EQ(diag.primary_span.start.line, 2u);
    EXPECT_EQ(diag.primary_span.start.column, 15u);
    EXPECT_EQ(diag.primary_span.end.column, 19u);

    ASSERT_EQ(diag.fixes.size(), 1u);
    EXPECT_EQ(diag.fixes[0].replacement, "'new'");
    EXPECT_EQ(diag.fixes[0].description, "replace with 'new'");
}

TEST(IssueToDiagnosticTest, NoFixWithoutReplacement) {
    auto issue = make_issue(false);
    EXPECT_TRUE(issue_to_diagnostic(issue).fixes.empty());
}

// ============================================================================
// Text Output
// ============================================================================

class DiagnosticEmitterTest : public ::testing::Test {
protected:
    std::ostringstream out;
    DiagnosticEmitter emitter{out};

    void SetUp() override {
        emitter.set_color_enabled(false);
        emitter.set_source_content("a.php", CONTENT);
    }
};

TEST_F(DiagnosticEmitterTest, TextHeaderAndLocation) {
    auto issue = make_issue(true);
    emitter.emit(issue_to_diagnostic(issue));

    std::string text = out.str();
    EXPECT_EQ(text.rfind("error[TextDomain.ReplaceDomain]: Text domain \"old\" in function __() "
                         "should be replaced with \"new\".\n",
                         0),
              0u);
    EXPECT_NE(text.find("  --> a.php:2:15\n"), std::string::npos);
    EXPECT_EQ(emitter.error_count(), 1u);
}

TEST_F(DiagnosticEmitterTest, TextSnippetUnderlinesDomain) {
    auto issue = make_issue(true);
    emitter.emit(issue_to_diagnostic(issue));

    std::string text = out.str();
    EXPECT_NE(text.find("   2 | echo __( 'a', 'old' );\n"), std::string::npos);
    EXPECT_NE(text.find("     | " + std::string(14, ' ') + "^^^^^\n"), std::string::npos);
}

TEST_F(DiagnosticEmitterTest, TextShowsFixedLine) {
    auto issue = make_issue(true);
    emitter.emit(issue_to_diagnostic(issue));

    std::string text = out.str();
    EXPECT_NE(text.find("  = fix: replace with 'new'\n"), std::string::npos);
    EXPECT_NE(text.find("   2 | echo __( 'a', 'new' );\n"), std::string::npos);
}

TEST_F(DiagnosticEmitterTest, NoColorCodesWhenDisabled) {
    auto issue = make_issue(true);
    emitter.emit(issue_to_diagnostic(issue));
    EXPECT_EQ(out.str().find('\033'), std::string::npos);
}

TEST_F(DiagnosticEmitterTest, UnknownSourceShowsLocationOnly) {
    auto issue = make_issue(false);
    issue.file = "other.php";
    emitter.emit(issue_to_diagnostic(issue));

    std::string text = out.str();
    EXPECT_NE(text.find("  --> other.php:2:15\n"), std::string::npos);
    EXPECT_EQ(text.find(" | "), std::string::npos);
}

TEST_F(DiagnosticEmitterTest, MultiLineLiteralStopsAtEndOfLine) {
    emitter.set_source_content("b.php", "<?php\n__( 'a', 'old\ndomain' );\n");
    auto issue = make_issue(true);
    issue.file = "b.php";
    issue.column = 10;
    issue.length = 12;
    issue.end_line = 3;
    issue.end_column = 7;
    emitter.emit(issue_to_diagnostic(issue));

    std::string text = out.str();
    EXPECT_NE(text.find("   2 | __( 'a', 'old\n"), std::string::npos);
    EXPECT_NE(text.find("     | " + std::string(9, ' ') + "^^^^\n"), std::string::npos);
    EXPECT_EQ(text.find("^^^^^"), std::string::npos);
    // The hint is still given, without a one-line preview
    EXPECT_NE(text.find("  = fix: replace with 'new'\n"), std::string::npos);
    EXPECT_EQ(text.find("'new' );"), std::string::npos);
}

// ============================================================================
// JSON Output
// ============================================================================

TEST_F(DiagnosticEmitterTest, JsonLine) {
    emitter.set_format(DiagnosticFormat::JSON);
    auto issue = make_issue(true);
    emitter.emit(issue_to_diagnostic(issue));

    std::string json = out.str();
    EXPECT_EQ(json.rfind("{\"severity\":\"error\",\"code\":\"TextDomain.ReplaceDomain\",", 0), 0u);
    EXPECT_NE(json.find("\"message\":\"Text domain \\\"old\\\" in function __()"),
              std::string::npos);
    EXPECT_NE(json.find("\"span\":{\"file\":\"a.php\",\"start\":{\"line\":2,\"column\":15},"
                        "\"end\":{\"line\":2,\"column\":19}}"),
              std::string::npos);
    EXPECT_NE(json.find("\"replacement\":\"'new'\""), std::string::npos);
    EXPECT_EQ(json.back(), '\n');
    EXPECT_EQ(json.find('\n'), json.size() - 1);
}

TEST_F(DiagnosticEmitterTest, JsonMultiLineEnd) {
    emitter.set_format(DiagnosticFormat::JSON);
    auto issue = make_issue(true);
    issue.column = 10;
    issue.length = 12;
    issue.end_line = 3;
    issue.end_column = 7;
    emitter.emit(issue_to_diagnostic(issue));

    EXPECT_NE(out.str().find("\"start\":{\"line\":2,\"column\":10},"
                             "\"end\":{\"line\":3,\"column\":7}"),
              std::string::npos);
}

TEST(EscapeJsonTest, EscapesSpecialCharacters) {
    EXPECT_EQ(DiagnosticEmitter::escape_json_string("a\"b\\c\nd\te"), "a\\\"b\\\\c\\nd\\te");
    EXPECT_EQ(DiagnosticEmitter::escape_json_string(std::string(1, '\x01')), "\\u0001");
    EXPECT_EQ(DiagnosticEmitter::escape_json_string("plain"), "plain");
}

// ============================================================================
// Summary
// ============================================================================

TEST(FormatSummaryTest, LintMode) {
    linter::LintResult clean;
    clean.files_checked = 3;
    EXPECT_EQ(format_summary(clean, false), "Checked 3 file(s), no issues found");

    linter::LintResult dirty;
    dirty.files_checked = 2;
    dirty.errors = 4;
    dirty.fixable = 4;
    EXPECT_EQ(format_summary(dirty, false), "Checked 2 file(s): 4 error(s), 4 fixable");
}

TEST(FormatSummaryTest, FixMode) {
    linter::LintResult result;
    result.files_checked = 5;
    result.files_fixed = 2;
    EXPECT_EQ(format_summary(result, true), "Checked 5 file(s), fixed 2 file(s)");

    result.fix_failures = 1;
    EXPECT_EQ(format_summary(result, true),
              "Checked 5 file(s), fixed 2 file(s), 1 could not be fixed");
}
