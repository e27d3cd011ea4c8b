#pragma once

namespace biotok::cli {

// Standard exit codes for the command-line host
// Named with BIOTOK_ prefix to avoid conflict with system macros
constexpr int BIOTOK_EXIT_SUCCESS = 0;
constexpr int BIOTOK_EXIT_USER_ERROR = 1;  // Invalid or missing options
constexpr int BIOTOK_EXIT_IO_ERROR = 3;    // Input/output file errors
constexpr int BIOTOK_EXIT_INTERNAL = 4;    // Internal/unexpected errors

}  // namespace biotok::cli
