//! # domainfix Entry Point
//!
//! ```bash
//! domainfix lint --original-text-domain=old --target-text-domain=new src/
//! domainfix fix  --original-text-domain=old --target-text-domain=new src/
//! ```
//!
//! `main()` only delegates to the CLI driver (`cli/driver.hpp`).

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return domainfix_main(argc, argv);
}
