//! # Check Command Interface
//!
//! `yuhoc check` runs the whole front end: module resolution followed by
//! semantic analysis, rendering every diagnostic.

#pragma once
#include <string>
#include <vector>

namespace yuho::cli {

struct CheckCommandOptions {
    std::vector<std::string> include_dirs; // -I, searched before YUHO_PATH and yuho.toml
    bool json = false;
    bool warnings_as_errors = false;
    bool no_warnings = false;
    int max_errors = 0; // 0 = no limit
};

int run_check(const std::string& path, const CheckCommandOptions& options);

} // namespace yuho::cli
