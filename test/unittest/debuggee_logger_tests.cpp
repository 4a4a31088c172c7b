#include <gtest/gtest.h>

#include "session_fakes.h"
#include <session/debuggee_logger.h>

using dgate::session::DebuggeeAddress;
using dgate::session::DebuggeeLogger;
using dgate::session::DefaultAddressPattern;
using dgate::utils::OneShot;

class DebuggeeLoggerTest : public ::testing::Test
{
protected:
  std::shared_ptr<FakeConnection> mConnection = std::make_shared<FakeConnection>();
  FakeEngine mEngine{ mConnection };
  OneShot<DebuggeeAddress> mAddress{};
  std::shared_ptr<RecordingLogSink> mLog = std::make_shared<RecordingLogSink>();
  DebuggeeLogger mLogger{ mEngine, mAddress, mLog, DefaultAddressPattern };
};

TEST_F(DebuggeeLoggerTest, AddressLineResolvesDefaultHost)
{
  mLogger.Out("Listening for transport dt_socket at address: 5005");
  const auto address = mAddress.Peek();
  ASSERT_TRUE(address.has_value());
  EXPECT_EQ(address->mHost, "127.0.0.1");
  EXPECT_EQ(address->mPort, 5005);
}

TEST_F(DebuggeeLoggerTest, AddressLineWithHost)
{
  mLogger.Err("Listening for transport dt_socket at address: localhost:41235");
  const auto address = mAddress.Peek();
  ASSERT_TRUE(address.has_value());
  EXPECT_EQ(address->mHost, "localhost");
  EXPECT_EQ(address->mPort, 41235);
}

TEST_F(DebuggeeLoggerTest, FirstAddressWins)
{
  mLogger.Out("Listening for transport dt_socket at address: 5005");
  mLogger.Out("Listening for transport dt_socket at address: 6006");
  EXPECT_EQ(mAddress.Peek()->mPort, 5005);
  EXPECT_EQ(mLog->Count(LogLevel::info, "debuggee listening at 127.0.0.1:5005"), 1u);
}

TEST_F(DebuggeeLoggerTest, OrdinaryOutputDoesNotResolve)
{
  mLogger.Out("Compiling 3 Scala sources");
  mLogger.Err("warning: deprecated");
  EXPECT_FALSE(mAddress.IsSettled());
}

TEST_F(DebuggeeLoggerTest, OutputIsRelayedAsEvents)
{
  mLogger.Out("hello");
  mLogger.Err("oops");
  const auto events = mEngine.Events();
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].mEvent, "output");
  EXPECT_EQ(events[0].mBody["category"], "stdout");
  EXPECT_EQ(events[0].mBody["output"], "hello\n");
  EXPECT_EQ(events[1].mBody["category"], "stderr");
  EXPECT_EQ(events[1].mBody["output"], "oops\n");
}

TEST_F(DebuggeeLoggerTest, DiagnosticsGoToTheLog)
{
  mLogger.Debug("d");
  mLogger.Info("i");
  mLogger.Error("e");
  const auto records = mLog->Records();
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[0].first, LogLevel::debug);
  EXPECT_EQ(records[1].first, LogLevel::info);
  EXPECT_EQ(records[2].first, LogLevel::error);
  EXPECT_TRUE(mEngine.Events().empty());
}

TEST(DebuggeeLoggerMatch, RejectsPortsOutOfRange)
{
  const std::regex pattern{ DefaultAddressPattern, std::regex::ECMAScript };
  EXPECT_FALSE(DebuggeeLogger::MatchAddress(pattern, "Listening for transport dt_socket at address: 0"));
  EXPECT_FALSE(DebuggeeLogger::MatchAddress(pattern, "Listening for transport dt_socket at address: 70000"));
  EXPECT_TRUE(DebuggeeLogger::MatchAddress(pattern, "Listening for transport dt_socket at address: 65535"));
}

TEST(DebuggeeLoggerMatch, CustomPattern)
{
  const std::regex pattern{ R"(debugger on (\S+?):(\d+))", std::regex::ECMAScript };
  const auto address = DebuggeeLogger::MatchAddress(pattern, "[info] debugger on 0.0.0.0:9000 ready");
  ASSERT_TRUE(address.has_value());
  EXPECT_EQ(address->mHost, "0.0.0.0");
  EXPECT_EQ(address->mPort, 9000);
}
