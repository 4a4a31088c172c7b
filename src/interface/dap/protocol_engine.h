/** LICENSE TEMPLATE */
#pragma once
#include <interface/dap/messages.h>

namespace dgate::dap {

/// The request/response/event surface of a DAP conversation. Implementations either talk to the wire (the
/// ProtocolServer) or decorate another engine. Inbound requests read by the bottom engine, and the messages its
/// backend wants to send, are routed through the "front" engine so a decorator sees all traffic in both
/// directions.
class ProtocolEngine
{
public:
  virtual ~ProtocolEngine() noexcept = default;

  virtual void DispatchRequest(const Request &request) noexcept = 0;
  virtual void SendResponse(Response response) noexcept = 0;
  virtual void SendEvent(Event event) noexcept = 0;
  /// Read loop. Returns when the underlying stream is closed.
  virtual void Run() noexcept = 0;
  virtual void SetFront(ProtocolEngine *front) noexcept = 0;
};

/// Serves the requests that the protocol engine dispatches. Responses and events go out through `front`.
class RequestHandler
{
public:
  virtual ~RequestHandler() noexcept = default;
  virtual void HandleRequest(const Request &request, ProtocolEngine &front) noexcept = 0;
  /// The conversation is over; release whatever the handler holds on to.
  virtual void Shutdown() noexcept {}
};
} // namespace dgate::dap
