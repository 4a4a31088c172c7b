/** LICENSE TEMPLATE */
#pragma once

#include <source_location>
#include <string_view>

namespace dgate {
// Logs `err_msg` with a demangled backtrace to the core channel and stderr, then aborts the process.
[[noreturn]] void panic(std::string_view err_msg, const char *functionName, const char *file, int line,
                        int strip_levels);

[[noreturn]] void panic(std::string_view err_msg, const std::source_location &loc, int strip_levels);
} // namespace dgate

#define PANIC(err_msg)                                                                                            \
  {                                                                                                               \
    auto loc = std::source_location::current();                                                                   \
    dgate::panic(err_msg, loc, 1);                                                                                \
  }
