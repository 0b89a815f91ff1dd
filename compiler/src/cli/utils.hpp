//! # CLI Utilities Interface
//!
//! Shared helpers for the command handlers.
//!
//! ## Functions
//!
//! | Function          | Description                            |
//! |-------------------|----------------------------------------|
//! | `read_file()`     | Read an entire file                    |
//! | `print_usage()`   | Print CLI help text                    |
//! | `print_version()` | Print front-end version                |

#pragma once
#include "common.hpp"
#include "types/resolver.hpp"

#include <iostream>
#include <string>

namespace yuho::cli {

/// Exit codes shared by every command.
constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1; // fatal error or an Error diagnostic
constexpr int EXIT_USAGE = 2;

// File I/O
auto read_file(const std::string& path) -> Result<std::string, types::ReadError>;

// Help text
void print_usage(std::ostream& out = std::cout);
void print_version();

} // namespace yuho::cli
