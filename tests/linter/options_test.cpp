//! # Lint Option Tests
//!
//! Tests for parse_lint_options: domain options, PHPCS-style runtime
//! settings, report format and argument errors.

#include "linter/linter.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace domainfix;
using namespace domainfix::linter;

namespace {

auto parse_ok(const std::vector<std::string>& args) -> LintOptions {
    auto result = parse_lint_options(args);
    EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result) : "");
    return is_ok(result) ? unwrap(result) : LintOptions{};
}

auto parse_error(const std::vector<std::string>& args) -> std::string {
    auto result = parse_lint_options(args);
    EXPECT_TRUE(is_err(result));
    return is_err(result) ? unwrap_err(result) : "";
}

} // anonymous namespace

// ============================================================================
// Domains
// ============================================================================

TEST(LintOptionsTest, DomainOptions) {
    auto options =
        parse_ok({"--original-text-domain=old-domain", "--target-text-domain=new-domain", "src"});

    EXPECT_EQ(options.original_domain, "old-domain");
    EXPECT_EQ(options.target_domain, "new-domain");
    ASSERT_EQ(options.paths.size(), 1u);
    EXPECT_EQ(options.paths[0], "src");

    auto config = options.rule_config();
    EXPECT_EQ(config.original_domain, "old-domain");
    EXPECT_EQ(config.target_domain, "new-domain");
    EXPECT_TRUE(config.is_active());
}

TEST(LintOptionsTest, RuntimeSettings) {
    auto options = parse_ok({"--runtime-set", "originalTextDomain", "old", "--runtime-set",
                             "targetTextDomain", "new", "plugin.php"});

    EXPECT_EQ(options.original_domain, "old");
    EXPECT_EQ(options.target_domain, "new");
    ASSERT_EQ(options.paths.size(), 1u);
    EXPECT_EQ(options.paths[0], "plugin.php");
}

TEST(LintOptionsTest, LaterOptionWins) {
    auto options = parse_ok({"--target-text-domain=first", "--runtime-set", "targetTextDomain",
                             "second"});
    EXPECT_EQ(options.target_domain, "second");
}

TEST(LintOptionsTest, EmptyTargetIsInactive) {
    auto options = parse_ok({"--original-text-domain=old"});
    EXPECT_TRUE(options.target_domain.empty());
    EXPECT_FALSE(options.rule_config().is_active());
}

// ============================================================================
// Modes and Output
// ============================================================================

TEST(LintOptionsTest, Defaults) {
    auto options = parse_ok({});
    EXPECT_FALSE(options.fix_mode);
    EXPECT_FALSE(options.show_help);
    EXPECT_TRUE(options.colors);
    EXPECT_EQ(options.format, OutputFormat::Text);
    ASSERT_EQ(options.paths.size(), 1u);
    EXPECT_EQ(options.paths[0], ".");
}

TEST(LintOptionsTest, Flags) {
    auto options = parse_ok({"--fix", "--no-color", "--format=json", "-h"});
    EXPECT_TRUE(options.fix_mode);
    EXPECT_FALSE(options.colors);
    EXPECT_EQ(options.format, OutputFormat::Json);
    EXPECT_TRUE(options.show_help);
}

TEST(LintOptionsTest, LogOptionsAreNotPaths) {
    auto options = parse_ok({"-vv", "--log-level=debug", "--log-filter=rules=trace", "-q", "a.php"});
    ASSERT_EQ(options.paths.size(), 1u);
    EXPECT_EQ(options.paths[0], "a.php");
}

TEST(LintOptionsTest, DoubleDashEndsOptions) {
    auto options = parse_ok({"--fix", "--", "--weird-name.php", "b.php"});
    EXPECT_TRUE(options.fix_mode);
    EXPECT_EQ(options.paths, (std::vector<std::string>{"--weird-name.php", "b.php"}));
}

// ============================================================================
// Errors
// ============================================================================

TEST(LintOptionsTest, UnknownOption) {
    auto message = parse_error({"--severity=5"});
    EXPECT_NE(message.find("Unknown option '--severity=5'"), std::string::npos);
}

TEST(LintOptionsTest, UnknownFormat) {
    auto message = parse_error({"--format=xml"});
    EXPECT_NE(message.find("xml"), std::string::npos);
}

TEST(LintOptionsTest, RuntimeSetNeedsTwoArguments) {
    auto message = parse_error({"--runtime-set", "targetTextDomain"});
    EXPECT_NE(message.find("--runtime-set"), std::string::npos);
}

TEST(LintOptionsTest, UnknownRuntimeSetting) {
    auto message = parse_error({"--runtime-set", "testVersion", "8.0"});
    EXPECT_NE(message.find("testVersion"), std::string::npos);
}
