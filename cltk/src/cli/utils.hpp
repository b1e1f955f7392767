//! # CLI Utilities Interface
//!
//! | Function         | Description                          |
//! |------------------|--------------------------------------|
//! | `collect_args()` | argv slice to a vector of strings    |
//! | `tool_names()`   | Names of every dispatchable tool     |
//! | `print_usage()`  | Print the top-level help text        |
//! | `print_version()`| Print the cltk version               |

#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace cltk::cli {

std::vector<std::string> collect_args(int argc, char* argv[], int first);

std::vector<std::string> tool_names();

void print_usage(std::ostream& out);
void print_version(std::ostream& out);

} // namespace cltk::cli
