//! # srcfmt Entry Point
//!
//! ```bash
//! srcfmt src/                          # Format a tree in place
//! srcfmt -s crlf -H LICENSE.txt Foo.java
//! srcfmt --check -j 0 src/             # Report, write nothing
//! ```
//!
//! All work happens in `cli::srcfmt_main()` (`cli/dispatcher.cpp`).

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return srcfmt::cli::srcfmt_main(argc, argv);
}
