#include "utils.hpp"

#include "common.hpp"
#include "rules/text_domain.hpp"

#include <iostream>

namespace domainfix::cli {

void print_usage() {
    std::cout << "domainfix " << VERSION << "\n\n";
    std::cout << "Replace the text domain of WordPress translation calls.\n\n";
    std::cout << "Usage: domainfix [lint|fix] [options] [paths...]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  lint      Report calls that use the original text domain (default)\n";
    std::cout << "  fix       Rewrite them to use the target text domain\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --original-text-domain=<d>      Text domain to look for\n";
    std::cout << "  --target-text-domain=<d>        Text domain to replace it with\n";
    std::cout << "  --runtime-set <name> <value>    originalTextDomain or targetTextDomain\n";
    std::cout << "  --fix                           Same as the fix command\n";
    std::cout << "  --format=text|json              Report format (default: text)\n";
    std::cout << "  --no-color                      Disable colored output\n";
    std::cout << "  --help, -h                      Show this help\n";
    std::cout << "  --version, -V                   Show version\n";
    std::cout << "\nLogging:\n";
    std::cout << "  -v, -vv, -vvv                   Info, debug or trace logging\n";
    std::cout << "  -q, --quiet                     Errors only\n";
    std::cout << "  --log-level=<level>             trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>             Per-module levels, e.g. rules=trace,*=warn\n";
    std::cout << "  --log-file=<path>               Also write logs to a file\n";
    std::cout << "  --log-format=text|json          Log record format\n";
    std::cout << "\nIf no paths are given, the current directory is checked.\n";
    std::cout << "\nChecked functions:\n ";
    for (auto name : rules::TRANSLATION_FUNCTIONS) {
        std::cout << " " << name;
    }
    std::cout << "\n";
    std::cout << "\nExit codes: 0 clean, 1 issues found or fix failed, 2 usage or I/O error\n";
}

void print_version() {
    std::cout << "domainfix " << VERSION << "\n";
}

} // namespace domainfix::cli
