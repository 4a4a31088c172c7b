/** LICENSE TEMPLATE */
#pragma once
// dgate
#include <interface/dap/connection.h>
#include <interface/dap/parse_buffer.h>
#include <interface/dap/protocol_engine.h>

// stdlib
#include <memory>
#include <mutex>

namespace dgate::dap {

/// The engine at the bottom of a decorator chain: frames and parses what the client writes, and serializes what
/// is sent to it.
class ProtocolServer final : public ProtocolEngine
{
  std::shared_ptr<Connection> mConnection;
  std::unique_ptr<RequestHandler> mHandler;
  ProtocolEngine *mFront;
  MessageBuffer mReadBuffer{};
  std::mutex mWriteLock{};
  i64 mSequence{ 1 };

  void WriteMessage(std::string_view kind, const auto &serialize) noexcept;

public:
  ProtocolServer(std::shared_ptr<Connection> connection, std::unique_ptr<RequestHandler> handler) noexcept;
  ~ProtocolServer() noexcept override;
  NO_COPY(ProtocolServer);

  void DispatchRequest(const Request &request) noexcept final;
  void SendResponse(Response response) noexcept final;
  void SendEvent(Event event) noexcept final;
  void Run() noexcept final;
  void SetFront(ProtocolEngine *front) noexcept final;
};
} // namespace dgate::dap
