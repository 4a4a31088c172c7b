/** LICENSE TEMPLATE */
#include "panic.h"

// dgate
#include <utils/logger.h>

// stdlib
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <regex>
#include <string>

// system
#include <cxxabi.h>
#include <execinfo.h>

namespace dgate {
template <typename T>
void
replace_regex(T &str)
{
  static const std::regex str_view_regex("std::basic_string_view<char, std::char_traits<char> >");
  static const std::regex str_regex{
    "std::__cxx11::basic_string<char, std::char_traits<char>, std::allocator<char> >"
  };

  str = std::regex_replace(str, str_view_regex, "std::string_view");
  str = std::regex_replace(str, str_regex, "std::string");
}

[[noreturn]] void
panic(std::string_view err_msg, const char *functionName, const char *file, int line, int strip_levels)
{
  constexpr auto logIf = [](std::string_view msg) { logging::Logger::LogIf(Channel::core, msg); };
  constexpr auto BT_BUF_SIZE = 100;
  void *buffer[BT_BUF_SIZE];
  const int nptrs = backtrace(buffer, BT_BUF_SIZE);
  logIf(fmt::format("backtrace() returned {} addresses", nptrs));
  fmt::print(stderr, "backtrace() returned {} addresses\n", nptrs);

  if (char **strings = backtrace_symbols(buffer, nptrs); strings != nullptr) {
    for (int j = strip_levels; j < nptrs; j++) {
      std::string_view view{ strings[j] };
      const auto mangledBegin = view.find("_Z");
      const auto mangledEnd = view.find_first_of('+', mangledBegin);
      if (mangledBegin != std::string_view::npos && mangledEnd != std::string_view::npos) {
        std::string mangled{ view.substr(mangledBegin, mangledEnd - mangledBegin) };
        int stat = 0;
        if (char *res = abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &stat); stat == 0 && res) {
          std::string demangled{ res };
          free(res);
          replace_regex(demangled);
          logIf(demangled);
          fmt::print(stderr, "{}\n", demangled);
          continue;
        }
      }
      logIf(strings[j]);
      fmt::print(stderr, "{}\n", strings[j]);
    }
    free(strings);
  } else {
    perror("backtrace_symbols");
  }

  const auto message =
    fmt::format("--- [PANIC] ---\n[FILE]: {}:{}\n[FUNCTION]: {}\n[REASON]: {}\nErrno: {}: {}\n--- [PANIC] ---",
      file,
      line,
      functionName,
      err_msg,
      errno,
      strerror(errno));
  logIf(message);
  fmt::print(stderr, "{}\n", message);
  logging::Logger::GetLogger()->OnAbort();
  std::abort();
}

[[noreturn]] void
panic(std::string_view err_msg, const std::source_location &loc, int strip_levels)
{
  panic(err_msg, loc.function_name(), loc.file_name(), loc.line(), strip_levels);
}
} // namespace dgate
