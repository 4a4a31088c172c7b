/** LICENSE TEMPLATE */
#pragma once
// dgate
#include <interface/dap/connection.h>
#include <interface/dap/protocol_engine.h>
#include <session/logger_adapter.h>
#include <utils/worker_thread.h>

// stdlib
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace dgate::backend {

/// Forwards the client's requests to the debug adapter inside the debuggee, and everything that adapter sends back
/// to the client. Nothing can be forwarded before an attach tells where the adapter is; requests that arrive before
/// that are queued and replayed in order once it is connected. `initialize` is answered right away so that a client
/// waiting on it gets to send its launch.
class RelayHandler final : public dap::RequestHandler
{
  session::RecordSink &mLog;
  mutable std::mutex mLock{};
  std::vector<dap::Request> mPending{};
  // Requests answered here whose downstream response must not reach the client a second time.
  std::unordered_set<i64> mAnsweredLocally{};
  std::shared_ptr<dap::Connection> mDownstream{ nullptr };
  dap::ProtocolEngine *mFront{ nullptr };
  WorkerThread::OwnedPtr mReader{ nullptr };
  bool mShutdown{ false };

  void Attach(const dap::Request &request, dap::ProtocolEngine &front) noexcept;
  void Forward(const dap::Request &request, dap::ProtocolEngine &front) noexcept;
  void ReadDownstream(std::stop_token &token) noexcept;
  bool ShouldDropResponse(const dap::Response &response) noexcept;

public:
  explicit RelayHandler(session::RecordSink &log) noexcept;
  ~RelayHandler() noexcept override;
  NO_COPY(RelayHandler);

  void HandleRequest(const dap::Request &request, dap::ProtocolEngine &front) noexcept final;
  void Shutdown() noexcept final;

  bool IsConnected() const noexcept;
  size_t PendingRequests() const noexcept;
};
} // namespace dgate::backend
