/** LICENSE TEMPLATE */
#include "debug_session.h"
#include <common.h>
#include <utils/logger.h>

namespace dgate::session {

static constexpr auto CouldNotStartDebuggee = "Could not start debuggee";
static constexpr auto FrozenClientWarning = "Communication with DAP client is frozen, closing client forcefully...";

DebugSession::DebugSession(std::shared_ptr<dap::Connection> connection, std::shared_ptr<dap::ProtocolEngine> engine,
                           DebuggeeStarter starter, ThreadPool &pool, std::shared_ptr<LoggerAdapter> loggerAdapter,
                           std::shared_ptr<logging::LogSink> log, SessionOptions options) noexcept
    : mConnection(std::move(connection)), mEngine(std::move(engine)), mPool(pool),
      mLoggerAdapter(std::move(loggerAdapter)), mLog(std::move(log)), mOptions(std::move(options)),
      mPhase(SessionPhase{ phase::Idle{ std::move(starter) } }),
      mDebuggeeLogger(*this, mAddressResolved, mLog, mOptions.mAddressPattern)
{
}

/* static */
std::shared_ptr<DebugSession>
DebugSession::Create(std::shared_ptr<dap::Connection> connection, std::shared_ptr<dap::ProtocolEngine> engine,
                     DebuggeeStarter starter, ThreadPool &pool, std::shared_ptr<LoggerAdapter> loggerAdapter,
                     std::shared_ptr<logging::LogSink> log, SessionOptions options) noexcept
{
  VERIFY(connection != nullptr && engine != nullptr, "A session needs a connection and a protocol engine");
  VERIFY(loggerAdapter != nullptr && log != nullptr, "A session needs its loggers");
  VERIFY(starter != nullptr, "A session needs a debuggee starter");
  auto session = std::shared_ptr<DebugSession>(new DebugSession{ std::move(connection), std::move(engine),
                                                                 std::move(starter), pool, std::move(loggerAdapter),
                                                                 std::move(log), std::move(options) });
  session->mEngine->SetFront(session.get());
  return session;
}

DebugSession::~DebugSession() noexcept
{
  Cancel();
  // Nothing can be waiting on the session anymore, a pool task would have kept it alive.
  SettleEndOfConnection("session destroyed");
  CloseConnection();
  if (mReadLoop) {
    mReadLoop->Join();
  }
  if (mDebuggee) {
    mDebuggee->Join();
  }
  mEngine->SetFront(nullptr);
}

void
DebugSession::Start() noexcept
{
  auto self = shared_from_this();
  mPhase.Transform([&](SessionPhase current) -> SessionPhase {
    auto idle = std::get_if<phase::Idle>(&current);
    if (idle == nullptr) {
      DBGLOG(session, "start ignored, session is {}", PhaseName(current));
      return current;
    }

    mReadLoop = WorkerThread::SpawnWorkerThread("dap-read-loop", [self](std::stop_token &) {
      self->mEngine->Run();
      DBGLOG(session, "protocol read loop finished");
    });

    auto debuggee = std::make_shared<DebuggeeHandle>();
    debuggee->Run("debuggee", [self, starter = std::move(idle->mStarter)](std::stop_token &token) {
      starter(self->mDebuggeeLogger, token);
      // All output events are sent before the starter returns.
      self->OnDebuggeeComputationDone();
    });
    mDebuggee = debuggee;
    DBGLOG(session, "session started");
    return phase::Started{ std::move(debuggee) };
  });
}

void
DebugSession::OnDebuggeeComputationDone() noexcept
{
  DBGLOG(session, "debuggee computation finished, waiting for the conversation to end");
  mEndOfConnection.Wait();
  if (mExitStatus.TrySettle(ExitVerdict::Terminated)) {
    mLog->Info("session terminated");
  }
  CloseConnection();
}

void
DebugSession::Cancel() noexcept
{
  mPhase.Transform([&](SessionPhase current) -> SessionPhase {
    if (std::holds_alternative<phase::Idle>(current)) {
      DBGLOG(session, "cancelling idle session");
      CloseConnection();
      return phase::Cancelled{};
    }
    if (auto started = std::get_if<phase::Started>(&current); started) {
      DBGLOG(session, "cancelling started session");
      CancelDebuggee(*started->mDebuggee);
      ScheduleForcedEndOfConnection();
      return phase::Cancelled{};
    }
    return current;
  });
}

void
DebugSession::CancelDebuggee(DebuggeeHandle &debuggee) noexcept
{
  mLoggerAdapter->OnDebuggeeFinished();
  if (debuggee.Cancel()) {
    mLog->Debug("debuggee cancelled");
  }
}

void
DebugSession::ScheduleForcedEndOfConnection() noexcept
{
  auto self = weak_from_this().lock();
  if (!self) {
    SettleEndOfConnection("session is being destroyed");
    return;
  }
  mPool.Post("forced-end-of-connection", [self]() {
    if (!self->mEndOfConnection.WaitFor(self->mOptions.mShutdownTimeout)) {
      self->mLog->Warn(FrozenClientWarning);
    }
    self->SettleEndOfConnection("shutdown fallback finished");
  });
}

void
DebugSession::SettleEndOfConnection(std::string_view reason) noexcept
{
  if (mEndOfConnection.TrySettle(std::monostate{})) {
    DBGLOG(session, "end of connection: {}", reason);
  }
}

void
DebugSession::CloseConnection() noexcept
{
  std::call_once(mConnectionClosed, [this]() {
    mConnection->Close();
    DBGLOG(session, "client connection closed");
  });
}

bool
DebugSession::IsLaunchedRequest(i64 requestSeq) const noexcept
{
  std::lock_guard lock{ mLaunchedRequestsLock };
  return mLaunchedRequests.contains(requestSeq);
}

void
DebugSession::DispatchRequest(const dap::Request &request) noexcept
{
  if (request.mCommand == dap::command::Launch) {
    StartHandshake(request);
  } else if (request.mCommand == dap::command::Disconnect) {
    HandleDisconnect(request);
  } else {
    mEngine->DispatchRequest(request);
  }
}

void
DebugSession::StartHandshake(const dap::Request &launch) noexcept
{
  {
    std::lock_guard lock{ mLaunchedRequestsLock };
    mLaunchedRequests.insert(launch.mSeq);
  }
  auto self = shared_from_this();
  mPool.Post(fmt::format("launch-handshake-{}", launch.mSeq), [self, launch]() {
    auto address = self->mAddressResolved.WaitFor(self->mOptions.mHandshakeTimeout);
    if (!address) {
      self->mLog->Error(fmt::format("debuggee address not resolved within {}ms for launch request {}",
                                    self->mOptions.mHandshakeTimeout.count(), launch.mSeq));
      self->SendResponse(dap::Failed(launch, CouldNotStartDebuggee));
      return;
    }
    DBGLOG(session, "launch {} becomes attach to {}:{}", launch.mSeq, address->mHost, address->mPort);
    self->mEngine->DispatchRequest(dap::AttachRequest(launch.mSeq, address->mHost, address->mPort));
  });
}

void
DebugSession::HandleDisconnect(const dap::Request &disconnect) noexcept
{
  if (dap::ShouldRestart(disconnect) && mExitStatus.TrySettle(ExitVerdict::Restarted)) {
    mLog->Info("client requested a restart");
  }
  SendResponse(dap::Acknowledge(disconnect));

  // A debuggee the client has disconnected from will not report "exited".
  if (mTerminalEvents.Remove(dap::event::Exited)) {
    SettleEndOfConnection("disconnected after termination");
  }

  bool forward = false;
  mPhase.Transform([&](SessionPhase current) -> SessionPhase {
    if (auto started = std::get_if<phase::Started>(&current); started) {
      CancelDebuggee(*started->mDebuggee);
      ScheduleForcedEndOfConnection();
      forward = true;
      return phase::Cancelled{};
    }
    return current;
  });

  // Outside the phase lock. The engine may block on a slow downstream.
  if (forward) {
    mEngine->DispatchRequest(disconnect);
  }
}

void
DebugSession::SendResponse(dap::Response response) noexcept
{
  if (response.mCommand == dap::command::Attach && IsLaunchedRequest(response.mRequestSeq)) {
    response.mCommand = std::string{ dap::command::Launch };
  } else if (response.mCommand == dap::command::Disconnect) {
    bool expected = false;
    if (!mDisconnectSent.compare_exchange_strong(expected, true)) {
      DBGLOG(session, "dropping duplicate disconnect response for request {}", response.mRequestSeq);
      return;
    }
  }
  mEngine->SendResponse(std::move(response));
}

void
DebugSession::SendEvent(dap::Event event) noexcept
{
  const auto name = event.mEvent;
  mEngine->SendEvent(std::move(event));

  if (name == dap::event::Exited) {
    mLoggerAdapter->OnDebuggeeFinished();
  }

  if (mTerminalEvents.Remove(name)) {
    SettleEndOfConnection("all terminal events sent");
  }
}

void
DebugSession::Run() noexcept
{
  mEngine->Run();
}

void
DebugSession::SetFront(dap::ProtocolEngine *front) noexcept
{
  mEngine->SetFront(front != nullptr ? front : this);
}

const utils::OneShot<ExitVerdict> &
DebugSession::ExitStatus() const noexcept
{
  return mExitStatus;
}

const utils::Signal &
DebugSession::EndOfConnection() const noexcept
{
  return mEndOfConnection;
}

const utils::OneShot<DebuggeeAddress> &
DebugSession::AddressResolved() const noexcept
{
  return mAddressResolved;
}

SessionPhase
DebugSession::Phase() const noexcept
{
  return mPhase.Get();
}

DebuggeeLogger &
DebugSession::GetDebuggeeLogger() noexcept
{
  return mDebuggeeLogger;
}
} // namespace dgate::session
