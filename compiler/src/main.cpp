//! # Yuho Front-End Entry Point
//!
//! The `yuhoc` binary. All work happens in the CLI driver.
//!
//! ```bash
//! yuhoc tokens penal.yh   # token stream
//! yuhoc parse penal.yh    # canonical source
//! yuhoc check penal.yh    # resolve and analyze
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return yuho_main(argc, argv);
}
