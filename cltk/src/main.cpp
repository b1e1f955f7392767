//! # cltk Entry Point
//!
//! ```bash
//! cltk repeat --count=3 hello world
//! cltk repeat --count=2 --separator=, --quiet-info a b c
//! cltk pwd
//! cltk --version
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return cltk_main(argc, argv);
}
