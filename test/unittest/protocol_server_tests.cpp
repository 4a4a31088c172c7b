#include <array>
#include <atomic>
#include <gtest/gtest.h>
#include <span>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>

#include <interface/dap/connection.h>
#include <interface/dap/messages.h>
#include <interface/dap/parse_buffer.h>
#include <interface/dap/protocol_server.h>
#include <utils/scoped_fd.h>

using namespace dgate::dap;
using dgate::ScopedFd;

// Acknowledges every request it is handed.
class AcknowledgingHandler final : public RequestHandler
{
public:
  std::atomic<int> mHandled{ 0 };
  std::atomic<int> mShutdowns{ 0 };

  void
  HandleRequest(const Request &request, ProtocolEngine &front) noexcept final
  {
    ++mHandled;
    front.SendResponse(Acknowledge(request));
  }

  void
  Shutdown() noexcept final
  {
    ++mShutdowns;
  }
};

// Sees inbound requests before the server does.
class CountingFront final : public ProtocolEngine
{
  ProtocolEngine &mNext;

public:
  explicit CountingFront(ProtocolEngine &next) : mNext(next) {}
  std::atomic<int> mDispatched{ 0 };
  std::atomic<int> mResponses{ 0 };

  void
  DispatchRequest(const Request &request) noexcept final
  {
    ++mDispatched;
    mNext.DispatchRequest(request);
  }
  void
  SendResponse(Response response) noexcept final
  {
    ++mResponses;
    mNext.SendResponse(std::move(response));
  }
  void
  SendEvent(Event event) noexcept final
  {
    mNext.SendEvent(std::move(event));
  }
  void
  Run() noexcept final
  {
    mNext.Run();
  }
  void
  SetFront(ProtocolEngine *front) noexcept final
  {
    mNext.SetFront(front);
  }
};

class ProtocolServerTest : public ::testing::Test
{
protected:
  ScopedFd mClient{};
  std::shared_ptr<SocketConnection> mConnection{ nullptr };
  AcknowledgingHandler *mHandler{ nullptr };
  std::unique_ptr<ProtocolServer> mServer{ nullptr };

  void
  SetUp() override
  {
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    mClient = ScopedFd{ fds[1] };
    timeval timeout{ .tv_sec = 2, .tv_usec = 0 };
    setsockopt(mClient.Get(), SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
    mConnection = std::make_shared<SocketConnection>(ScopedFd{ fds[0] });
    auto handler = std::make_unique<AcknowledgingHandler>();
    mHandler = handler.get();
    mServer = std::make_unique<ProtocolServer>(mConnection, std::move(handler));
  }

  void
  ClientWrite(std::string_view bytes)
  {
    ASSERT_EQ(::write(mClient.Get(), bytes.data(), bytes.size()), static_cast<ssize_t>(bytes.size()));
  }

  std::vector<Json>
  ClientRead(size_t count)
  {
    MessageBuffer buffer;
    std::vector<Json> messages;
    std::array<char, 1024> bytes{};
    while (messages.size() < count) {
      const auto n = ::read(mClient.Get(), bytes.data(), bytes.size());
      if (n <= 0) {
        break;
      }
      buffer.Append(std::span{ bytes.data(), static_cast<size_t>(n) });
      for (const auto &payload : buffer.TakeCompleteMessages()) {
        messages.push_back(Json::parse(payload));
      }
    }
    return messages;
  }
};

TEST_F(ProtocolServerTest, RequestsAreDispatchedAndAnsweredInOrder)
{
  std::thread reader{ [this]() { mServer->Run(); } };

  ClientWrite(Frame(R"({"seq":1,"type":"request","command":"initialize"})"));
  ClientWrite(Frame("this is not json"));
  ClientWrite(Frame(R"({"seq":2,"type":"request","command":"threads"})"));

  const auto replies = ClientRead(2);
  ASSERT_EQ(replies.size(), 2u);
  EXPECT_EQ(replies[0]["seq"], 1);
  EXPECT_EQ(replies[0]["request_seq"], 1);
  EXPECT_EQ(replies[0]["command"], "initialize");
  EXPECT_EQ(replies[1]["seq"], 2);
  EXPECT_EQ(replies[1]["request_seq"], 2);
  EXPECT_EQ(replies[1]["command"], "threads");

  ::shutdown(mClient.Get(), SHUT_RDWR);
  reader.join();
  EXPECT_EQ(mHandler->mHandled, 2);
  EXPECT_GE(mHandler->mShutdowns, 1);
}

TEST_F(ProtocolServerTest, SplitWritesAreReassembled)
{
  std::thread reader{ [this]() { mServer->Run(); } };
  const auto framed = Frame(R"({"seq":5,"type":"request","command":"stackTrace","arguments":{"threadId":1}})");
  ClientWrite(std::string_view{ framed }.substr(0, 7));
  std::this_thread::sleep_for(std::chrono::milliseconds{ 20 });
  ClientWrite(std::string_view{ framed }.substr(7));

  const auto replies = ClientRead(1);
  ASSERT_EQ(replies.size(), 1u);
  EXPECT_EQ(replies[0]["request_seq"], 5);

  mConnection->Close();
  reader.join();
}

TEST_F(ProtocolServerTest, FrontSeesTraffic)
{
  CountingFront front{ *mServer };
  mServer->SetFront(&front);
  std::thread reader{ [this]() { mServer->Run(); } };

  ClientWrite(Frame(R"({"seq":1,"type":"request","command":"initialize"})"));
  const auto replies = ClientRead(1);
  ASSERT_EQ(replies.size(), 1u);
  EXPECT_EQ(front.mDispatched, 1);
  EXPECT_EQ(front.mResponses, 1);

  mConnection->Close();
  reader.join();
  mServer->SetFront(nullptr);
}

TEST_F(ProtocolServerTest, EventsGetIncreasingSequenceNumbers)
{
  mServer->SendEvent(OutputEvent("stdout", "a\n"));
  mServer->SendEvent(Event{ .mEvent = "terminated", .mBody = {} });
  const auto messages = ClientRead(2);
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0]["seq"], 1);
  EXPECT_EQ(messages[0]["event"], "output");
  EXPECT_EQ(messages[1]["seq"], 2);
  EXPECT_EQ(messages[1]["event"], "terminated");
  EXPECT_FALSE(messages[1].contains("body"));
}

TEST_F(ProtocolServerTest, WritesAfterCloseAreDropped)
{
  mConnection->Close();
  EXPECT_TRUE(mConnection->IsClosed());
  mServer->SendEvent(Event{ .mEvent = "terminated", .mBody = {} });
  EXPECT_FALSE(mConnection->Write("x"));
}
