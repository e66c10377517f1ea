//! # CLI Utilities Interface
//!
//! ## Functions
//!
//! | Function          | Description                 |
//! |-------------------|-----------------------------|
//! | `print_usage()`   | Print CLI help text         |
//! | `print_version()` | Print tool version          |

#pragma once

namespace domainfix::cli {

// Help text
void print_usage();
void print_version();

} // namespace domainfix::cli
