//! # Linter Host
//!
//! Drives the text domain rule over PHP files: tokenizes, collects issues,
//! applies fixes and writes fixed files back.
//!
//! ## Components
//!
//! | Type / Function        | Description                                  |
//! |------------------------|----------------------------------------------|
//! | `LintIssue`            | Single reported issue with location          |
//! | `LintFile`             | `rules::FileContext` over one `Source`       |
//! | `FileReport`           | Outcome of linting (and fixing) one file     |
//! | `lint_content()`       | Lint in-memory content, fix loop included    |
//! | `lint_file()`          | Read, lint and optionally rewrite a file     |
//! | `find_php_files()`     | Recursive discovery of `.php` / `.inc` files |
//! | `parse_lint_options()` | Command-line options for `lint` / `fix`      |
//!
//! ## Fix Loop
//!
//! ```text
//! content ─▶ tokenize ─▶ rule.process() ─▶ fixed_content()
//!    ▲                                           │
//!    └──────────── changed? (max 50 passes) ─────┘
//! ```

#pragma once

#include "common.hpp"
#include "lexer/lexer.hpp"
#include "lexer/source.hpp"
#include "rules/file_context.hpp"
#include "rules/text_domain.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace domainfix::linter {

// ============================================================================
// Lint Issue
// ============================================================================

struct LintIssue {
    std::string file;
    uint32_t line;
    uint32_t column;
    uint32_t length; ///< Byte length of the reported token.
    uint32_t end_line;
    uint32_t end_column; ///< Column of the token's last byte.
    std::string code;
    std::string message;
    bool fixable;
    std::string replacement; ///< Text the fix puts in place of the token.
};

/// Totals across all linted files.
struct LintResult {
    int files_checked = 0;
    int errors = 0;
    int fixable = 0;
    int files_fixed = 0;
    int fix_failures = 0;
};

// ============================================================================
// Lint File
// ============================================================================

/// One tokenized file as seen by a rule.
///
/// With `accept_fixes` set, reported issues are answered with "fix it" and
/// the rule's replacements are recorded. Report mode sets it too so that
/// the proposed replacement can be shown; only the fixer writes it back.
/// The tokens view into `source`, which must outlive the LintFile.
class LintFile : public rules::FileContext {
public:
    LintFile(const lexer::Source& source, bool accept_fixes,
             std::string_view rule_name = rules::TEXT_DOMAIN_RULE);

    [[nodiscard]] auto tokens() const -> std::span<const lexer::Token> override {
        return tokens_;
    }

    auto add_fixable_error(rules::TokenIndex pos, const std::string& message,
                           std::string_view code) -> bool override;

    void replace_token(rules::TokenIndex pos, std::string text) override;

    [[nodiscard]] auto issues() const -> const std::vector<LintIssue>& {
        return issues_;
    }

    [[nodiscard]] auto lexer_errors() const -> const std::vector<lexer::LexerError>& {
        return lexer_errors_;
    }

    [[nodiscard]] auto replacement_count() const -> size_t {
        return replacements_.size();
    }

    /// The source text with every recorded replacement spliced in.
    [[nodiscard]] auto fixed_content() const -> std::string;

private:
    const lexer::Source& source_;
    std::vector<lexer::Token> tokens_;
    std::vector<lexer::LexerError> lexer_errors_;
    bool accept_fixes_;
    std::string rule_name_;
    std::vector<LintIssue> issues_;
    std::vector<rules::TokenIndex> issue_positions_;
    std::map<rules::TokenIndex, std::string> replacements_;
};

// ============================================================================
// File Operations
// ============================================================================

/// Upper bound on fixer passes over one file.
constexpr int MAX_FIX_PASSES = 50;

/// Outcome of linting one file.
struct FileReport {
    std::string path;
    std::string content;           ///< Content as read.
    std::vector<LintIssue> issues; ///< Issues found in the content as read.
    std::string fixed_content;     ///< Content after the fix loop (fix mode only).
    int fixes_applied = 0;
    int passes = 0;
    bool fix_failed = false; ///< The fix loop did not settle within MAX_FIX_PASSES.

    [[nodiscard]] auto changed() const -> bool {
        return !fix_failed && fixed_content != content;
    }
};

/// Lints `content` as the file `path`. In fix mode the rule is re-run on the
/// fixed text until a pass changes nothing.
[[nodiscard]] auto lint_content(const std::string& path, const std::string& content,
                                const rules::TextDomainRule& rule, bool fix_mode) -> FileReport;

/// Reads `path`, lints it and, in fix mode, writes the fixed content back.
[[nodiscard]] auto lint_file(const fs::path& path, const rules::TextDomainRule& rule,
                             bool fix_mode) -> Result<FileReport, std::string>;

/// True for the file extensions that are linted.
[[nodiscard]] auto is_php_file(const fs::path& path) -> bool;

/// Appends all PHP files under `dir`, sorted, skipping vendored and hidden
/// directories.
void find_php_files(const fs::path& dir, std::vector<fs::path>& files);

// ============================================================================
// Options
// ============================================================================

enum class OutputFormat { Text, Json };

struct LintOptions {
    bool fix_mode = false;
    bool show_help = false;
    bool colors = true;
    OutputFormat format = OutputFormat::Text;
    std::string original_domain;
    std::string target_domain;
    std::vector<std::string> paths;

    [[nodiscard]] auto rule_config() const -> rules::TextDomainConfig {
        return rules::TextDomainConfig{.original_domain = original_domain,
                                       .target_domain = target_domain};
    }
};

/// Parses the arguments that follow the command name. Logging options are
/// accepted and left to the logger.
[[nodiscard]] auto parse_lint_options(const std::vector<std::string>& args)
    -> Result<LintOptions, std::string>;

} // namespace domainfix::linter
