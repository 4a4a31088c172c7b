/** LICENSE TEMPLATE */
#pragma once
// dgate
#include <common/macros.h>
#include <utils/worker_thread.h>

// stdlib
#include <atomic>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <variant>

#define FOR_EACH_EXIT_VERDICT(VERDICT)                                                                             \
  VERDICT(Terminated)                                                                                              \
  VERDICT(Restarted)

ENUM_TYPE_METADATA(ExitVerdict, FOR_EACH_EXIT_VERDICT, u8)

namespace dgate::session {
class DebuggeeLogger;

/// Runs the debuggee to completion. Returns when the debuggee has finished or `stop` has been requested.
using DebuggeeStarter = std::function<void(DebuggeeLogger &logger, std::stop_token stop)>;

/// Where the debuggee's debug engine can be reached.
struct DebuggeeAddress
{
  std::string mHost;
  int mPort;
};

/// The running debuggee computation.
class DebuggeeHandle
{
  WorkerThread::OwnedPtr mThread{ nullptr };
  std::atomic<bool> mCancelled{ false };

public:
  DebuggeeHandle() noexcept = default;
  NO_COPY(DebuggeeHandle);

  void Run(std::string threadName, std::function<void(std::stop_token &)> computation) noexcept;
  /// Requests the computation to stop without waiting for it. Returns true for the call that requested it.
  bool Cancel() noexcept;
  bool IsCancelled() const noexcept;
  void Join() noexcept;
};

namespace phase {
struct Idle
{
  DebuggeeStarter mStarter;
};

struct Started
{
  std::shared_ptr<DebuggeeHandle> mDebuggee;
};

struct Cancelled
{
};
} // namespace phase

using SessionPhase = std::variant<phase::Idle, phase::Started, phase::Cancelled>;

constexpr std::string_view
PhaseName(const SessionPhase &phase) noexcept
{
  switch (phase.index()) {
  case 0:
    return "Idle";
  case 1:
    return "Started";
  case 2:
    return "Cancelled";
  }
  DGATE_UNREACHABLE
}
} // namespace dgate::session
