//! # CLI Command Dispatcher
//!
//! ## Architecture
//!
//! ```text
//! domainfix_main()
//!   ├─ Logger::init(parse_log_options())
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ lint           → run_lint()
//!   ├─ fix            → run_lint(fix)
//!   └─ anything else  → run_lint() on all arguments
//! ```

#include "commands/cmd_lint.hpp"
#include "common.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <string>
#include <vector>

namespace domainfix::cli {

/// Main entry point for the domainfix CLI.
///
/// ## Return Codes
///
/// | Code | Meaning                              |
/// |------|--------------------------------------|
/// | 0    | Nothing to report, or all fixed      |
/// | 1    | Issues found, or a fix failed        |
/// | 2    | Usage or I/O error                   |
int domainfix_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    if (argc < 2) {
        print_usage();
        return EXIT_CLEAN;
    }

    std::string command = argv[1];

    if (command == "--help" || command == "-h") {
        print_usage();
        return EXIT_CLEAN;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return EXIT_CLEAN;
    }

    int result = EXIT_CLEAN;
    if (command == "lint" || command == "fix") {
        std::vector<std::string> args(argv + 2, argv + argc);
        result = run_lint(args, command == "fix");
    } else {
        // No command: lint is the default
        std::vector<std::string> args(argv + 1, argv + argc);
        result = run_lint(args, false);
    }

    log::Logger::instance().flush();
    return result;
}

} // namespace domainfix::cli

// Entry point wrapper (outside namespace)
int domainfix_main(int argc, char* argv[]) {
    return domainfix::cli::domainfix_main(argc, argv);
}
