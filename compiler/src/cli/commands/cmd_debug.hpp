//! # Debug Commands Interface
//!
//! Inspection commands for the first two pipeline stages.
//!
//! ## Commands
//!
//! | Function       | Command         | Output                          |
//! |----------------|-----------------|---------------------------------|
//! | `run_tokens()` | `yuhoc tokens`  | Token stream with categories    |
//! | `run_parse()`  | `yuhoc parse`   | Canonical source or syntax tree |

#pragma once
#include <iostream>
#include <string>

namespace yuho::cli {

struct ParseCommandOptions {
    bool recover = false; // keep the partial program after syntax errors
    bool dump_ast = false;
};

// Debug commands; both write their result to `out` and diagnostics to stderr
int run_tokens(const std::string& path, std::ostream& out = std::cout);
int run_parse(const std::string& path, const ParseCommandOptions& options,
              std::ostream& out = std::cout);

} // namespace yuho::cli
