/** LICENSE TEMPLATE */
#pragma once
// dgate
#include <interface/dap/connection.h>
#include <interface/dap/protocol_engine.h>
#include <session/debuggee_logger.h>
#include <session/logger_adapter.h>
#include <session/session_state.h>
#include <session/termination_tracker.h>
#include <utils/one_shot.h>
#include <utils/synchronized.h>
#include <utils/thread_pool.h>
#include <utils/worker_thread.h>

// stdlib
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace dgate::session {

struct SessionOptions
{
  // How long a launch request waits for the debuggee address before it fails.
  std::chrono::milliseconds mHandshakeTimeout{ 5000 };
  // How long a cancelled session waits for the client to wind the conversation down.
  std::chrono::milliseconds mShutdownTimeout{ 5000 };
  std::string mAddressPattern{ DefaultAddressPattern };
};

/// One debugging conversation with one debuggee. Sits in front of the protocol engine: the client's launch is
/// turned into an attach once the debuggee can be reached, and the outbound event stream is watched to tell when
/// the conversation is over. The owner starts it, waits on ExitStatus() and may cancel it at any time.
class DebugSession final : public dap::ProtocolEngine, public std::enable_shared_from_this<DebugSession>
{
  std::shared_ptr<dap::Connection> mConnection;
  std::shared_ptr<dap::ProtocolEngine> mEngine;
  ThreadPool &mPool;
  std::shared_ptr<LoggerAdapter> mLoggerAdapter;
  std::shared_ptr<logging::LogSink> mLog;
  SessionOptions mOptions;

  utils::Synchronized<SessionPhase> mPhase;
  utils::OneShot<DebuggeeAddress> mAddressResolved{};
  utils::Signal mEndOfConnection{};
  utils::OneShot<ExitVerdict> mExitStatus{};
  TerminationTracker mTerminalEvents{};

  mutable std::mutex mLaunchedRequestsLock{};
  std::unordered_set<i64> mLaunchedRequests{};
  std::atomic<bool> mDisconnectSent{ false };
  std::once_flag mConnectionClosed{};

  DebuggeeLogger mDebuggeeLogger;
  // Kept after the Started phase is left, so that cancelling never has to wait for the debuggee thread.
  std::shared_ptr<DebuggeeHandle> mDebuggee{ nullptr };
  WorkerThread::OwnedPtr mReadLoop{ nullptr };

  DebugSession(std::shared_ptr<dap::Connection> connection, std::shared_ptr<dap::ProtocolEngine> engine,
               DebuggeeStarter starter, ThreadPool &pool, std::shared_ptr<LoggerAdapter> loggerAdapter,
               std::shared_ptr<logging::LogSink> log, SessionOptions options) noexcept;

  void StartHandshake(const dap::Request &launch) noexcept;
  void HandleDisconnect(const dap::Request &disconnect) noexcept;
  void OnDebuggeeComputationDone() noexcept;
  void CancelDebuggee(DebuggeeHandle &debuggee) noexcept;
  void ScheduleForcedEndOfConnection() noexcept;
  void SettleEndOfConnection(std::string_view reason) noexcept;
  void CloseConnection() noexcept;
  bool IsLaunchedRequest(i64 requestSeq) const noexcept;

public:
  NO_COPY(DebugSession);
  ~DebugSession() noexcept override;

  /// The session starts out Idle. `engine` gets this session installed as its front.
  static std::shared_ptr<DebugSession> Create(std::shared_ptr<dap::Connection> connection,
                                              std::shared_ptr<dap::ProtocolEngine> engine, DebuggeeStarter starter,
                                              ThreadPool &pool, std::shared_ptr<LoggerAdapter> loggerAdapter,
                                              std::shared_ptr<logging::LogSink> log,
                                              SessionOptions options = {}) noexcept;

  /// Starts the protocol read loop and the debuggee. Does nothing unless the session is Idle.
  void Start() noexcept;
  /// Safe from any phase, any number of times.
  void Cancel() noexcept;

  /// Settles exactly once, to Terminated or Restarted.
  const utils::OneShot<ExitVerdict> &ExitStatus() const noexcept;
  const utils::Signal &EndOfConnection() const noexcept;
  const utils::OneShot<DebuggeeAddress> &AddressResolved() const noexcept;
  SessionPhase Phase() const noexcept;
  DebuggeeLogger &GetDebuggeeLogger() noexcept;

  void DispatchRequest(const dap::Request &request) noexcept final;
  void SendResponse(dap::Response response) noexcept final;
  void SendEvent(dap::Event event) noexcept final;
  void Run() noexcept final;
  void SetFront(dap::ProtocolEngine *front) noexcept final;
};
} // namespace dgate::session
