/** LICENSE TEMPLATE */
#include "protocol_server.h"
#include <array>
#include <cstring>
#include <utils/logger.h>

namespace dgate::dap {

ProtocolServer::ProtocolServer(std::shared_ptr<Connection> connection,
                               std::unique_ptr<RequestHandler> handler) noexcept
    : mConnection(std::move(connection)), mHandler(std::move(handler)), mFront(this)
{
  VERIFY(mConnection != nullptr, "Protocol server requires a connection");
  VERIFY(mHandler != nullptr, "Protocol server requires a request handler");
}

ProtocolServer::~ProtocolServer() noexcept { mHandler->Shutdown(); }

void
ProtocolServer::SetFront(ProtocolEngine *front) noexcept
{
  mFront = front != nullptr ? front : this;
}

void
ProtocolServer::DispatchRequest(const Request &request) noexcept
{
  DBGLOG(dap, "dispatching request {} '{}'", request.mSeq, request.mCommand);
  mHandler->HandleRequest(request, *mFront);
}

void
ProtocolServer::WriteMessage(std::string_view kind, const auto &serialize) noexcept
{
  std::lock_guard lock{ mWriteLock };
  const auto seq = mSequence++;
  const std::string payload = serialize(seq);
  CDLOG(DGATE_DEBUG == 1, dap, "WRITING -->{}<---", payload);
  if (!mConnection->Write(Frame(payload))) {
    DBGLOG(dap, "dropped {} (seq {}), client connection is gone", kind, seq);
  }
}

void
ProtocolServer::SendResponse(Response response) noexcept
{
  WriteMessage("response", [&](i64 seq) { return response.Serialize(seq); });
}

void
ProtocolServer::SendEvent(Event event) noexcept
{
  WriteMessage("event", [&](i64 seq) { return event.Serialize(seq); });
}

void
ProtocolServer::Run() noexcept
{
  std::array<char, 4096> buffer{};
  while (true) {
    const auto bytesRead = mConnection->Read(buffer);
    if (!bytesRead) {
      DBGLOG(dap, "reading from client failed: {}", strerror(bytesRead.error()));
      break;
    }
    if (bytesRead.value() == 0) {
      DBGLOG(dap, "client stream ended");
      break;
    }
    mReadBuffer.Append(std::span{ buffer.data(), bytesRead.value() });
    for (const auto &payload : mReadBuffer.TakeCompleteMessages()) {
      CDLOG(DGATE_DEBUG == 1, dap, "READ -->{}<---", payload);
      auto request = ParseRequest(payload);
      if (!request) {
        DBGLOG(warning, "skipping malformed client message: {}", request.error());
        continue;
      }
      mFront->DispatchRequest(request.value());
    }
  }
  mHandler->Shutdown();
}
} // namespace dgate::dap
