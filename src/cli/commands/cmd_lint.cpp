//! # Lint Command
//!
//! Implements `domainfix lint` and `domainfix fix`.
//!
//! ## Lint Flow
//!
//! ```text
//! run_lint()
//!   ├─ parse_lint_options()
//!   ├─ Warn about an inert configuration
//!   ├─ Collect files (find_php_files for directories)
//!   │     └─ For each file: lint_file()
//!   │           ├─ lint mode: emit one diagnostic per issue
//!   │           └─ fix mode:  [FIXED] / [FAILED] per changed file
//!   └─ Report totals and exit code
//! ```

#include "cmd_lint.hpp"

#include "cli/utils.hpp"
#include "log/log.hpp"

#include <iostream>
#include <sstream>

namespace domainfix::cli {

using namespace linter;

namespace {

/// Resolves the command-line paths to the list of files to lint. Returns
/// false if any path could not be used.
bool collect_files(const std::vector<std::string>& paths, std::vector<fs::path>& files) {
    bool ok = true;
    for (const auto& path : paths) {
        fs::path p(path);
        std::error_code ec;
        if (fs::is_directory(p, ec)) {
            find_php_files(p, files);
        } else if (fs::is_regular_file(p, ec) && is_php_file(p)) {
            files.push_back(p);
        } else if (fs::is_regular_file(p, ec)) {
            DOMAINFIX_LOG_WARN("lint", path << " is not a PHP file, skipping");
        } else {
            DOMAINFIX_LOG_ERROR("lint", path << " does not exist");
            ok = false;
        }
    }
    return ok;
}

void warn_inert_config(const rules::TextDomainConfig& config) {
    if (!config.is_active()) {
        DOMAINFIX_LOG_WARN("lint", "No target text domain set (--target-text-domain), "
                                   "nothing will be reported");
    } else if (config.original_domain == config.target_domain) {
        DOMAINFIX_LOG_WARN("lint", "Original and target text domain are both \""
                                       << config.target_domain
                                       << "\", issues will be reported but fixes change nothing");
    }
}

void emit_fix_outcome(std::ostream& out, const FileReport& report, DiagnosticFormat format,
                      bool colors) {
    if (!report.fix_failed && !report.changed()) {
        return;
    }

    if (format == DiagnosticFormat::JSON) {
        out << "{\"file\":\"" << DiagnosticEmitter::escape_json_string(report.path)
            << "\",\"fixed\":" << report.fixes_applied
            << ",\"failed\":" << (report.fix_failed ? "true" : "false") << "}\n";
        return;
    }

    const char* green = colors ? Colors::Green : "";
    const char* red = colors ? Colors::Red : "";
    const char* reset = colors ? Colors::Reset : "";
    if (report.fix_failed) {
        out << "  " << red << "[FAILED]" << reset << " " << report.path << "\n";
    } else {
        out << "  " << green << "[FIXED]" << reset << " " << report.path << " ("
            << report.fixes_applied << ")\n";
    }
}

} // anonymous namespace

// ============================================================================
// Diagnostics
// ============================================================================

Diagnostic issue_to_diagnostic(const LintIssue& issue) {
    SourceLocation start{.file = issue.file,
                         .line = issue.line,
                         .column = issue.column,
                         .offset = 0,
                         .length = issue.length};
    SourceLocation end = start;
    end.line = issue.end_line;
    end.column = issue.end_column;
    end.length = 0;

    Diagnostic diag;
    diag.code = issue.code;
    diag.message = issue.message;
    diag.primary_span = SourceSpan{start, end};

    if (issue.fixable && !issue.replacement.empty()) {
        diag.fixes.push_back(DiagnosticFixIt{.span = diag.primary_span,
                                             .replacement = issue.replacement,
                                             .description = "replace with " + issue.replacement});
    }
    return diag;
}

std::string format_summary(const LintResult& result, bool fix_mode) {
    std::ostringstream summary;
    summary << "Checked " << result.files_checked << " file(s)";

    if (fix_mode) {
        summary << ", fixed " << result.files_fixed << " file(s)";
        if (result.fix_failures > 0) {
            summary << ", " << result.fix_failures << " could not be fixed";
        }
        return summary.str();
    }

    if (result.errors == 0) {
        summary << ", no issues found";
    } else {
        summary << ": " << result.errors << " error(s), " << result.fixable << " fixable";
    }
    return summary.str();
}

// ============================================================================
// Main Entry Point
// ============================================================================

int run_lint(const std::vector<std::string>& args, bool fix_command) {
    auto parsed = parse_lint_options(args);
    if (is_err(parsed)) {
        DOMAINFIX_LOG_ERROR("cli", unwrap_err(parsed));
        std::cerr << "Run 'domainfix --help' for usage information.\n";
        return EXIT_USAGE;
    }

    const LintOptions& options = unwrap(parsed);
    if (options.show_help) {
        print_usage();
        return EXIT_CLEAN;
    }

    bool fix_mode = fix_command || options.fix_mode;
    const rules::TextDomainRule rule(options.rule_config());
    warn_inert_config(rule.config());

    std::vector<fs::path> files;
    bool io_ok = collect_files(options.paths, files);

    auto format =
        options.format == OutputFormat::Json ? DiagnosticFormat::JSON : DiagnosticFormat::Text;
    bool colors = options.colors && terminal_supports_colors();

    DiagnosticEmitter emitter(std::cout);
    emitter.set_format(format);
    emitter.set_color_enabled(colors);

    DOMAINFIX_LOG_INFO("lint", (fix_mode ? "Fixing " : "Checking ") << files.size()
                                                                    << " file(s)");

    LintResult result;
    for (const auto& file : files) {
        DOMAINFIX_LOG_DEBUG("lint", "Checking: " << file.string());

        auto outcome = lint_file(file, rule, fix_mode);
        if (is_err(outcome)) {
            DOMAINFIX_LOG_ERROR("lint", unwrap_err(outcome));
            io_ok = false;
            continue;
        }

        const FileReport& report = unwrap(outcome);
        result.files_checked++;
        for (const auto& issue : report.issues) {
            result.errors++;
            if (issue.fixable) {
                result.fixable++;
            }
        }

        if (fix_mode) {
            if (report.fix_failed) {
                result.fix_failures++;
            } else if (report.changed()) {
                result.files_fixed++;
            }
            emit_fix_outcome(std::cout, report, format, colors);
            continue;
        }

        emitter.set_source_content(report.path, report.content);
        for (const auto& issue : report.issues) {
            emitter.emit(issue_to_diagnostic(issue));
        }
    }

    if (format == DiagnosticFormat::Text) {
        std::cout << format_summary(result, fix_mode) << "\n";
    } else {
        DOMAINFIX_LOG_INFO("lint", format_summary(result, fix_mode));
    }

    if (!io_ok) {
        return EXIT_USAGE;
    }
    if (fix_mode) {
        return result.fix_failures > 0 ? EXIT_ISSUES : EXIT_CLEAN;
    }
    return result.errors > 0 ? EXIT_ISSUES : EXIT_CLEAN;
}

} // namespace domainfix::cli
