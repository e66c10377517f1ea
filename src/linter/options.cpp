//! # Lint Options
//!
//! Command-line options of the `lint` and `fix` commands.
//!
//! | Option                                 | Effect                       |
//! |----------------------------------------|------------------------------|
//! | `--original-text-domain=<d>`           | Domain to look for           |
//! | `--target-text-domain=<d>`             | Domain to replace it with    |
//! | `--runtime-set <name> <value>`         | PHPCS-style setting          |
//! | `--fix`                                | Apply fixes in place         |
//! | `--format=text\|json`                  | Report format                |
//! | `--no-color`                           | Plain text output            |
//! | `--help`, `-h`                         | Command help                 |
//!
//! Logging options (`--log-level=`, `-v`, ...) are recognized here so they are
//! not mistaken for paths, but they are applied by the logger.

#include "linter/linter.hpp"

#include "log/log.hpp"

namespace domainfix::linter {

namespace {

constexpr std::string_view ORIGINAL_DOMAIN_OPTION = "--original-text-domain=";
constexpr std::string_view TARGET_DOMAIN_OPTION = "--target-text-domain=";
constexpr std::string_view FORMAT_OPTION = "--format=";

auto apply_runtime_setting(LintOptions& options, const std::string& name,
                           const std::string& value) -> bool {
    if (name == "originalTextDomain") {
        options.original_domain = value;
        return true;
    }
    if (name == "targetTextDomain") {
        options.target_domain = value;
        return true;
    }
    return false;
}

} // anonymous namespace

auto parse_lint_options(const std::vector<std::string>& args) -> Result<LintOptions, std::string> {
    LintOptions options;
    bool only_paths = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (only_paths || arg.empty() || arg[0] != '-' || arg == "-") {
            options.paths.push_back(arg);
            continue;
        }

        if (arg == "--") {
            only_paths = true;
        } else if (arg == "--fix") {
            options.fix_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg.starts_with(ORIGINAL_DOMAIN_OPTION)) {
            options.original_domain = arg.substr(ORIGINAL_DOMAIN_OPTION.size());
        } else if (arg.starts_with(TARGET_DOMAIN_OPTION)) {
            options.target_domain = arg.substr(TARGET_DOMAIN_OPTION.size());
        } else if (arg == "--runtime-set") {
            if (i + 2 >= args.size()) {
                return std::string("--runtime-set requires a name and a value");
            }
            const std::string& name = args[i + 1];
            const std::string& value = args[i + 2];
            if (!apply_runtime_setting(options, name, value)) {
                return "Unknown runtime setting '" + name +
                       "' (expected originalTextDomain or targetTextDomain)";
            }
            i += 2;
        } else if (arg.starts_with(FORMAT_OPTION)) {
            std::string format = arg.substr(FORMAT_OPTION.size());
            if (format == "text") {
                options.format = OutputFormat::Text;
            } else if (format == "json") {
                options.format = OutputFormat::Json;
            } else {
                return "Unknown report format '" + format + "' (expected text or json)";
            }
        } else if (arg == "--no-color") {
            options.colors = false;
        } else if (log::is_log_option(arg)) {
            continue;
        } else {
            return "Unknown option '" + arg + "'";
        }
    }

    if (options.paths.empty()) {
        options.paths.push_back(".");
    }

    return options;
}

} // namespace domainfix::linter
