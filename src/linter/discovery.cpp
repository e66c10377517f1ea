//! # Lint File Discovery
//!
//! ## Discovery Rules
//!
//! - All `*.php` and `*.inc` files in specified directories, recursively
//! - Excludes `vendor/`, `node_modules/` and hidden directories (`.git/`, ...)
//! - Results are sorted so reports are stable across runs

#include "linter/linter.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace domainfix::linter {

namespace {

auto is_skipped_directory(const fs::path& dir) -> bool {
    std::string name = dir.filename().string();
    if (name == "vendor" || name == "node_modules") {
        return true;
    }
    return name.size() > 1 && name[0] == '.' && name != "..";
}

} // anonymous namespace

auto is_php_file(const fs::path& path) -> bool {
    auto ext = path.extension();
    return ext == ".php" || ext == ".inc";
}

void find_php_files(const fs::path& dir, std::vector<fs::path>& files) {
    std::vector<fs::path> found;

    try {
        if (!fs::exists(dir)) {
            return;
        }

        auto options = fs::directory_options::skip_permission_denied;
        for (auto it = fs::recursive_directory_iterator(dir, options);
             it != fs::recursive_directory_iterator(); ++it) {
            if (it->is_directory() && is_skipped_directory(it->path())) {
                DOMAINFIX_LOG_DEBUG("lint", "Skipping directory " << it->path().string());
                it.disable_recursion_pending();
                continue;
            }
            if (it->is_regular_file() && is_php_file(it->path())) {
                found.push_back(it->path());
            }
        }
    } catch (const fs::filesystem_error& e) {
        DOMAINFIX_LOG_WARN("lint", "Cannot access " << dir.string() << ": " << e.what());
    }

    std::sort(found.begin(), found.end());
    files.insert(files.end(), found.begin(), found.end());
}

} // namespace domainfix::linter
