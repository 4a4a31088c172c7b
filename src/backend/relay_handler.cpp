/** LICENSE TEMPLATE */
#include "relay_handler.h"
#include <array>
#include <cstring>
#include <interface/dap/parse_buffer.h>
#include <utils/logger.h>
#include <utils/scoped_fd.h>

namespace dgate::backend {
using namespace std::string_view_literals;

static constexpr auto Initialize = "initialize"sv;

RelayHandler::RelayHandler(session::RecordSink &log) noexcept : mLog(log) {}

RelayHandler::~RelayHandler() noexcept { Shutdown(); }

bool
RelayHandler::IsConnected() const noexcept
{
  std::lock_guard lock{ mLock };
  return mDownstream != nullptr;
}

size_t
RelayHandler::PendingRequests() const noexcept
{
  std::lock_guard lock{ mLock };
  return mPending.size();
}

void
RelayHandler::HandleRequest(const dap::Request &request, dap::ProtocolEngine &front) noexcept
{
  if (request.mCommand == dap::command::Attach) {
    Attach(request, front);
    return;
  }

  std::unique_lock lock{ mLock };
  if (mShutdown) {
    return;
  }
  if (mDownstream) {
    lock.unlock();
    Forward(request, front);
    return;
  }

  mPending.push_back(request);
  DBGLOG(dap, "queued '{}' ({}) until the debuggee is attached", request.mCommand, request.mSeq);
  if (request.mCommand == Initialize) {
    mAnsweredLocally.insert(request.mSeq);
    lock.unlock();
    auto response = dap::Acknowledge(request);
    response.mBody["supportsConfigurationDoneRequest"] = true;
    front.SendResponse(std::move(response));
  }
}

void
RelayHandler::Attach(const dap::Request &request, dap::ProtocolEngine &front) noexcept
{
  std::unique_lock lock{ mLock };
  if (mShutdown) {
    return;
  }
  if (mDownstream) {
    lock.unlock();
    Forward(request, front);
    return;
  }

  const auto &args = request.mArguments;
  const auto host = args.is_object() && args.contains("hostName") && args["hostName"].is_string()
                      ? args["hostName"].get<std::string>()
                      : std::string{ "127.0.0.1" };
  if (!args.is_object() || !args.contains("port") || !args["port"].is_number_integer()) {
    lock.unlock();
    mLog.Publish(RecordLevel::Severe, "attach request without a port");
    front.SendResponse(dap::Failed(request, "attach requires a port"));
    return;
  }
  const auto requestedPort = args["port"].get<i64>();
  if (requestedPort <= 0 || requestedPort > 65535) {
    lock.unlock();
    mLog.Publish(RecordLevel::Severe, fmt::format("attach request with invalid port {}", requestedPort));
    front.SendResponse(dap::Failed(request, fmt::format("invalid port {}", requestedPort)));
    return;
  }
  const auto port = static_cast<int>(requestedPort);

  auto socket = ScopedFd::OpenSocketConnectTo(host, port);
  if (!socket) {
    const auto message = fmt::format("{}: {}", socket.error().msg, strerror(socket.error().sys_errno));
    lock.unlock();
    mLog.Publish(RecordLevel::Severe, message);
    front.SendResponse(dap::Failed(request, message));
    return;
  }

  mLog.Publish(RecordLevel::Info, fmt::format("connected to debuggee at {}:{}", host, port));
  mDownstream = std::make_shared<dap::SocketConnection>(std::move(socket.value()));
  mFront = &front;
  mReader = WorkerThread::SpawnWorkerThread("relay-reader", [this](std::stop_token &token) { ReadDownstream(token); });

  auto pending = std::move(mPending);
  mPending.clear();
  lock.unlock();

  for (const auto &queued : pending) {
    Forward(queued, front);
  }
  Forward(request, front);
}

void
RelayHandler::Forward(const dap::Request &request, dap::ProtocolEngine &front) noexcept
{
  std::shared_ptr<dap::Connection> downstream;
  {
    std::lock_guard lock{ mLock };
    downstream = mDownstream;
  }
  if (downstream && downstream->Write(dap::Frame(request.Serialize()))) {
    return;
  }
  mLog.Publish(RecordLevel::Severe,
               fmt::format("could not forward '{}' ({}) to the debuggee", request.mCommand, request.mSeq));
  front.SendResponse(dap::Failed(request, "debuggee is not reachable"));
}

bool
RelayHandler::ShouldDropResponse(const dap::Response &response) noexcept
{
  std::lock_guard lock{ mLock };
  if (response.mCommand == Initialize) {
    return mAnsweredLocally.erase(response.mRequestSeq) > 0;
  }
  return false;
}

void
RelayHandler::ReadDownstream(std::stop_token &token) noexcept
{
  std::shared_ptr<dap::Connection> downstream;
  dap::ProtocolEngine *front = nullptr;
  {
    std::lock_guard lock{ mLock };
    downstream = mDownstream;
    front = mFront;
  }

  dap::MessageBuffer buffer{};
  std::array<char, 4096> bytes{};
  while (!token.stop_requested()) {
    const auto bytesRead = downstream->Read(bytes);
    if (!bytesRead || bytesRead.value() == 0) {
      break;
    }
    buffer.Append(std::span{ bytes.data(), bytesRead.value() });
    for (const auto &payload : buffer.TakeCompleteMessages()) {
      auto message = dap::ParseProtocolMessage(payload);
      if (!message) {
        mLog.Publish(RecordLevel::Warning, fmt::format("malformed message from debuggee: {}", message.error()));
        continue;
      }
      if (auto response = std::get_if<dap::Response>(&message.value()); response) {
        if (!ShouldDropResponse(*response)) {
          front->SendResponse(std::move(*response));
        }
      } else if (auto event = std::get_if<dap::Event>(&message.value()); event) {
        front->SendEvent(std::move(*event));
      } else if (auto request = std::get_if<dap::Request>(&message.value()); request) {
        mLog.Publish(RecordLevel::Warning,
                     fmt::format("debuggee sent reverse request '{}', which is not relayed", request->mCommand));
      }
    }
  }
  mLog.Publish(RecordLevel::Severe, "connection to debuggee lost: Socket closed");
}

void
RelayHandler::Shutdown() noexcept
{
  WorkerThread::OwnedPtr reader;
  {
    std::lock_guard lock{ mLock };
    if (mShutdown) {
      return;
    }
    mShutdown = true;
    if (mDownstream) {
      mDownstream->Close();
    }
    reader = std::move(mReader);
    mPending.clear();
  }
  if (reader) {
    reader->RequestStop();
    reader->Join();
  }
}
} // namespace dgate::backend
