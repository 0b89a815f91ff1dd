//! # Front-End Driver Interface
//!
//! `yuho_main()` dispatches to the command handler named by the first
//! argument.

#pragma once

// Main driver entry point
int yuho_main(int argc, char* argv[]);
