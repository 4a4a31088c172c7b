/** LICENSE TEMPLATE */
#pragma once
// dgate
#include <interface/dap/protocol_engine.h>
#include <session/session_state.h>
#include <utils/logger.h>
#include <utils/one_shot.h>

// stdlib
#include <memory>
#include <optional>
#include <regex>
#include <string_view>

namespace dgate::session {

/// Matches the line a JVM (or anything imitating it) prints once its debug agent accepts connections. Group 1 is the
/// optional host, group 2 the port.
constexpr auto DefaultAddressPattern = R"(Listening for transport dt_socket at address: (?:([^:\s]+):)?(\d+))";

/// Handed to the debuggee starter. Relays the debuggee's output to the client and resolves where the debuggee
/// can be attached to.
class DebuggeeLogger
{
  dap::ProtocolEngine &mEvents;
  utils::OneShot<DebuggeeAddress> &mAddressResolved;
  std::shared_ptr<logging::LogSink> mLog;
  std::regex mAddressPattern;

  void ScanForAddress(std::string_view line) noexcept;

public:
  /// `addressPattern` must be a valid ECMAScript regex.
  DebuggeeLogger(dap::ProtocolEngine &events, utils::OneShot<DebuggeeAddress> &addressResolved,
                 std::shared_ptr<logging::LogSink> log, std::string_view addressPattern) noexcept;
  NO_COPY(DebuggeeLogger);

  /// A line the debuggee wrote to standard out.
  void Out(std::string_view line) noexcept;
  /// A line the debuggee wrote to standard error.
  void Err(std::string_view line) noexcept;
  /// Diagnostics of the layer that manages the debuggee.
  void Debug(std::string_view message) noexcept;
  void Info(std::string_view message) noexcept;
  void Error(std::string_view message) noexcept;

  /// Extract host and port from `line`, if it matches `pattern`.
  static std::optional<DebuggeeAddress> MatchAddress(const std::regex &pattern, std::string_view line) noexcept;
};
} // namespace dgate::session
