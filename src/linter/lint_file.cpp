//! # Lint File and Fixer
//!
//! Implements `LintFile`, the rule host for one file, and the fix loop.
//!
//! ## Linting Pipeline
//!
//! ```text
//! lint_file()
//!   ├─ Source::from_file()
//!   ├─ lint_content()
//!   │     ├─ Lexer::tokenize()      - lexer errors are logged, not fatal
//!   │     ├─ rule.process(file)     - issues + replacements
//!   │     └─ fixed_content()        - repeat until nothing changes
//!   └─ Write fixed content (fix mode, if changed)
//! ```
//!
//! A replacement can create or hide matches the first pass could not see, so
//! the fixer re-tokenizes its own output. A file that is still changing after
//! MAX_FIX_PASSES passes is reported as a failed fix and left untouched.

#include "linter/linter.hpp"

#include "log/log.hpp"

#include <fstream>

namespace domainfix::linter {

// ============================================================================
// LintFile
// ============================================================================

LintFile::LintFile(const lexer::Source& source, bool accept_fixes, std::string_view rule_name)
    : source_(source), accept_fixes_(accept_fixes), rule_name_(rule_name) {
    lexer::Lexer lex(source_);
    tokens_ = lex.tokenize();
    lexer_errors_ = lex.errors();
}

auto LintFile::add_fixable_error(rules::TokenIndex pos, const std::string& message,
                                 std::string_view code) -> bool {
    if (pos >= tokens_.size()) {
        DOMAINFIX_LOG_WARN("lint", "Issue reported past the end of " << source_.filename());
        return false;
    }

    const auto& token = tokens_[pos];
    auto loc = source_.location(token.offset());

    LintIssue issue;
    issue.file = std::string(source_.filename());
    issue.line = loc.line;
    issue.column = loc.column;
    issue.length = static_cast<uint32_t>(token.lexeme.size());
    issue.end_line = token.span.end.line;
    issue.end_column = token.span.end.column;
    issue.code = rule_name_ + "." + std::string(code);
    issue.message = message;
    issue.fixable = true;

    issues_.push_back(std::move(issue));
    issue_positions_.push_back(pos);
    return accept_fixes_;
}

void LintFile::replace_token(rules::TokenIndex pos, std::string text) {
    if (pos >= tokens_.size()) {
        return;
    }

    for (size_t i = issues_.size(); i-- > 0;) {
        if (issue_positions_[i] == pos) {
            issues_[i].replacement = text;
            break;
        }
    }
    replacements_[pos] = std::move(text);
}

auto LintFile::fixed_content() const -> std::string {
    std::string_view content = source_.content();
    std::string result;
    result.reserve(content.size());

    size_t cursor = 0;
    for (const auto& [pos, text] : replacements_) {
        const auto& token = tokens_[pos];
        result.append(content.substr(cursor, token.offset() - cursor));
        result.append(text);
        cursor = token.offset() + token.lexeme.size();
    }
    result.append(content.substr(cursor));

    return result;
}

// ============================================================================
// Fix Loop
// ============================================================================

auto lint_content(const std::string& path, const std::string& content,
                  const rules::TextDomainRule& rule, bool fix_mode) -> FileReport {
    FileReport report;
    report.path = path;
    report.content = content;
    report.fixed_content = content;

    std::string current = content;
    for (int pass = 1; pass <= MAX_FIX_PASSES; ++pass) {
        auto source = lexer::Source::from_string(current, path);
        LintFile file(source, /*accept_fixes=*/true);

        if (pass == 1) {
            for (const auto& error : file.lexer_errors()) {
                DOMAINFIX_LOG_WARN("lint", path << ":" << error.span.start.line << ":"
                                                << error.span.start.column << ": " << error.code
                                                << " " << error.message);
            }
        }

        rule.process(file);
        report.passes = pass;

        if (pass == 1) {
            report.issues = file.issues();
        }
        if (!fix_mode) {
            return report;
        }

        std::string next = file.fixed_content();
        if (next == current) {
            report.fixed_content = std::move(current);
            return report;
        }

        DOMAINFIX_LOG_DEBUG("fix", path << ": pass " << pass << " applied "
                                        << file.replacement_count() << " replacement(s)");
        report.fixes_applied += static_cast<int>(file.replacement_count());
        current = std::move(next);
    }

    DOMAINFIX_LOG_ERROR("fix", path << ": content still changing after " << MAX_FIX_PASSES
                                    << " passes, giving up");
    report.fix_failed = true;
    report.fixed_content = std::move(current);
    return report;
}

// ============================================================================
// File Linting
// ============================================================================

auto lint_file(const fs::path& path, const rules::TextDomainRule& rule, bool fix_mode)
    -> Result<FileReport, std::string> {
    auto source_result = lexer::Source::from_file(path.string());
    if (is_err(source_result)) {
        return unwrap_err(source_result);
    }

    std::string content(unwrap(source_result).content());
    FileReport report = lint_content(path.string(), content, rule, fix_mode);

    if (fix_mode && report.changed()) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return "Cannot write file: " + path.string();
        }
        out << report.fixed_content;
        if (!out) {
            return "Failed writing file: " + path.string();
        }
        DOMAINFIX_LOG_INFO("fix",
                           "Fixed " << report.fixes_applied << " issue(s) in " << path.string());
    }

    return report;
}

} // namespace domainfix::linter
