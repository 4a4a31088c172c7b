#include <chrono>
#include <gtest/gtest.h>
#include <stop_token>
#include <thread>

#include "session_fakes.h"
#include <debuggee/process_starter.h>

using dgate::debuggee::LineSplitter;
using dgate::debuggee::ProcessStarter;
using dgate::session::DebuggeeAddress;
using dgate::session::DebuggeeLogger;
using dgate::session::DefaultAddressPattern;

static std::vector<std::string>
Feed(LineSplitter &splitter, std::string_view bytes)
{
  std::vector<std::string> lines;
  splitter.Feed(std::span{ bytes.data(), bytes.size() }, [&](std::string_view line) { lines.emplace_back(line); });
  return lines;
}

TEST(LineSplitter, SplitsOnNewlinesAndStripsCarriageReturns)
{
  LineSplitter splitter;
  EXPECT_EQ(Feed(splitter, "a\nb\r\nc"), (std::vector<std::string>{ "a", "b" }));
  EXPECT_EQ(Feed(splitter, "ontinued\n\n"), (std::vector<std::string>{ "continued", "" }));
  std::vector<std::string> rest;
  splitter.Flush([&](std::string_view line) { rest.emplace_back(line); });
  EXPECT_TRUE(rest.empty());
}

TEST(LineSplitter, FlushEmitsUnterminatedLine)
{
  LineSplitter splitter;
  EXPECT_TRUE(Feed(splitter, "no newline").empty());
  std::vector<std::string> rest;
  splitter.Flush([&](std::string_view line) { rest.emplace_back(line); });
  EXPECT_EQ(rest, (std::vector<std::string>{ "no newline" }));
}

class ProcessStarterTest : public ::testing::Test
{
protected:
  std::shared_ptr<FakeConnection> mConnection = std::make_shared<FakeConnection>();
  FakeEngine mEngine{ mConnection };
  dgate::utils::OneShot<DebuggeeAddress> mAddress{};
  std::shared_ptr<RecordingLogSink> mLog = std::make_shared<RecordingLogSink>();
  DebuggeeLogger mLogger{ mEngine, mAddress, mLog, DefaultAddressPattern };

  std::vector<std::pair<std::string, std::string>>
  Output() const
  {
    std::vector<std::pair<std::string, std::string>> output;
    for (const auto &event : mEngine.Events()) {
      output.emplace_back(event.mBody["category"].get<std::string>(), event.mBody["output"].get<std::string>());
    }
    return output;
  }
};

TEST_F(ProcessStarterTest, RelaysOutputAndResolvesAddress)
{
  auto starter = ProcessStarter::Create(
    { "/bin/sh", "-c", "echo out; echo err 1>&2; echo 'Listening for transport dt_socket at address: 4321'" });
  std::stop_source never;
  starter(mLogger, never.get_token());

  const auto output = Output();
  EXPECT_NE(std::ranges::find(output, std::pair<std::string, std::string>{ "stdout", "out\n" }), output.end());
  EXPECT_NE(std::ranges::find(output, std::pair<std::string, std::string>{ "stderr", "err\n" }), output.end());
  ASSERT_TRUE(mAddress.IsSettled());
  EXPECT_EQ(mAddress.Peek()->mPort, 4321);
  EXPECT_EQ(mLog->Count(LogLevel::info, "exited with code 0"), 1u);
}

TEST_F(ProcessStarterTest, StopTerminatesDebuggee)
{
  auto starter = ProcessStarter::Create({ "/bin/sh", "-c", "echo started; exec sleep 30" }, 500ms);
  std::stop_source stop;
  const auto begin = std::chrono::steady_clock::now();
  std::thread debuggee{ [&]() { starter(mLogger, stop.get_token()); } };
  ASSERT_TRUE(mEngine.WaitForEvents(1, 5s));
  stop.request_stop();
  debuggee.join();
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 10s);
  EXPECT_EQ(mLog->Count(LogLevel::info, "killed by signal"), 1u);
}

TEST_F(ProcessStarterTest, MissingProgramReportsExecFailure)
{
  auto starter = ProcessStarter::Create({ "/this/program/does/not/exist" });
  std::stop_source never;
  starter(mLogger, never.get_token());
  const auto output = Output();
  ASSERT_EQ(output.size(), 1u);
  EXPECT_EQ(output[0].first, "stderr");
  EXPECT_EQ(output[0].second, "dgate: failed to exec debuggee\n");
  EXPECT_EQ(mLog->Count(LogLevel::info, "exited with code 127"), 1u);
  EXPECT_FALSE(mAddress.IsSettled());
}
