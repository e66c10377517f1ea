//! # CLI Driver Interface
//!
//! `domainfix_main()` dispatches to the command handler named by argv[1].

#pragma once

// Main entry point, dispatches to the command handlers
int domainfix_main(int argc, char* argv[]);
