//! # Lint Command Interface
//!
//! This header defines the `lint` and `fix` command API.
//!
//! ## Usage
//!
//! - `domainfix lint --original-text-domain=old --target-text-domain=new src/`
//! - `domainfix fix ...`: same, but rewrites the files

#pragma once

#include "cli/diagnostic.hpp"
#include "linter/linter.hpp"

#include <string>
#include <vector>

namespace domainfix::cli {

/// Exit codes of the lint and fix commands.
enum ExitCode : int {
    EXIT_CLEAN = 0,  ///< Nothing found, or everything fixed
    EXIT_ISSUES = 1, ///< Issues found, or a fix failed
    EXIT_USAGE = 2,  ///< Bad options or an I/O error
};

// Lint (or, with `fix_command`, fix) the files named by `args`
int run_lint(const std::vector<std::string>& args, bool fix_command);

// Converts a lint issue into a printable diagnostic. The diagnostic's spans
// view into `issue.file`.
Diagnostic issue_to_diagnostic(const linter::LintIssue& issue);

// Final report line for a run
std::string format_summary(const linter::LintResult& result, bool fix_mode);

} // namespace domainfix::cli
