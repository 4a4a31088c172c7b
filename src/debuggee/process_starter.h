/** LICENSE TEMPLATE */
#pragma once
// dgate
#include <common/typedefs.h>
#include <session/debuggee_logger.h>
#include <session/session_state.h>

// stdlib
#include <chrono>
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace dgate::debuggee {

/// Cuts a byte stream into lines. The trailing newline (and a carriage return before it) is not part of a line.
class LineSplitter
{
  std::string mPending;

public:
  void Feed(std::span<const char> bytes, const std::function<void(std::string_view)> &onLine) noexcept;
  /// Emit what is left as a final, unterminated line.
  void Flush(const std::function<void(std::string_view)> &onLine) noexcept;
};

/// Runs the debuggee as a child process with its standard out and error piped back to the session.
class ProcessStarter
{
  std::vector<std::string> mCommand;
  std::chrono::milliseconds mTerminateGrace;

public:
  ProcessStarter(std::vector<std::string> command, std::chrono::milliseconds terminateGrace) noexcept;

  /// Forks and execs the command, relays its output line by line, and returns once the child has been reaped.
  /// When `stop` is requested the child gets SIGTERM, and SIGKILL if it is still alive after the grace period.
  void Run(session::DebuggeeLogger &logger, std::stop_token stop) const noexcept;

  static session::DebuggeeStarter Create(std::vector<std::string> command,
                                         std::chrono::milliseconds terminateGrace = std::chrono::milliseconds{
                                           2000 }) noexcept;
};
} // namespace dgate::debuggee
