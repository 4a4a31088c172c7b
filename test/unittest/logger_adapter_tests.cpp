#include <gtest/gtest.h>

#include "session_fakes.h"
#include <session/logger_adapter.h>

using dgate::session::LoggerAdapter;
using dgate::session::LoggerFactory;
using dgate::session::NoiseMatchers;

class LoggerAdapterTest : public ::testing::Test
{
protected:
  std::shared_ptr<RecordingLogSink> mLog = std::make_shared<RecordingLogSink>();
  LoggerAdapter mAdapter{ mLog };

  LogLevel
  LastLevel() const
  {
    const auto records = mLog->Records();
    EXPECT_FALSE(records.empty());
    return records.empty() ? LogLevel::debug : records.back().first;
  }
};

TEST_F(LoggerAdapterTest, LevelsMapOntoDomainLog)
{
  mAdapter.Publish(RecordLevel::Info, "info");
  EXPECT_EQ(LastLevel(), LogLevel::info);
  mAdapter.Publish(RecordLevel::Config, "config");
  EXPECT_EQ(LastLevel(), LogLevel::info);
  mAdapter.Publish(RecordLevel::Warning, "warning");
  EXPECT_EQ(LastLevel(), LogLevel::warn);
  mAdapter.Publish(RecordLevel::Severe, "severe");
  EXPECT_EQ(LastLevel(), LogLevel::error);
  mAdapter.Publish(RecordLevel::Fine, "fine");
  EXPECT_EQ(LastLevel(), LogLevel::debug);
  mAdapter.Publish(RecordLevel::Finest, "finest");
  EXPECT_EQ(LastLevel(), LogLevel::debug);
  EXPECT_EQ(mLog->Records().size(), 6u);
}

TEST_F(LoggerAdapterTest, SocketClosedIsAnErrorWhileDebuggeeRuns)
{
  mAdapter.Publish(RecordLevel::Severe, "Failed to read: java.net.SocketException: Socket closed");
  EXPECT_EQ(LastLevel(), LogLevel::error);
}

TEST_F(LoggerAdapterTest, SocketClosedIsNoiseOnceDebuggeeFinished)
{
  mAdapter.OnDebuggeeFinished();
  mAdapter.OnDebuggeeFinished();
  EXPECT_TRUE(mAdapter.DebuggeeFinished());
  mAdapter.Publish(RecordLevel::Severe, "Failed to read: java.net.SocketException: Socket closed");
  EXPECT_EQ(LastLevel(), LogLevel::debug);
  mAdapter.Publish(RecordLevel::Severe, "Socket closed while reading");
  EXPECT_EQ(LastLevel(), LogLevel::error);
}

TEST_F(LoggerAdapterTest, BenignDisconnectIsAlwaysNoise)
{
  mAdapter.Publish(RecordLevel::Severe,
                   "Exception on recording event: com.sun.jdi.VMDisconnectedException: connection lost");
  EXPECT_EQ(LastLevel(), LogLevel::debug);
}

TEST_F(LoggerAdapterTest, OnlySevereRecordsAreDowngraded)
{
  mAdapter.OnDebuggeeFinished();
  mAdapter.Publish(RecordLevel::Warning, "Socket closed");
  EXPECT_EQ(LastLevel(), LogLevel::warn);
}

TEST(LoggerAdapter, CustomMatchers)
{
  auto log = std::make_shared<RecordingLogSink>();
  LoggerAdapter adapter{ log, NoiseMatchers{ .mStreamClosedSuffixes = { "pipe gone" }, .mBenignPrefixes = {} } };
  adapter.Publish(RecordLevel::Severe, "Exception on recording event: com.sun.jdi.VMDisconnectedException");
  adapter.OnDebuggeeFinished();
  adapter.Publish(RecordLevel::Severe, "stdout: pipe gone");
  const auto records = log->Records();
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0].first, LogLevel::error);
  EXPECT_EQ(records[1].first, LogLevel::debug);
}

TEST(LoggerFactory, OnlyEngineLoggerReachesAdapter)
{
  auto log = std::make_shared<RecordingLogSink>();
  auto adapter = std::make_shared<LoggerAdapter>(log);
  LoggerFactory factory{ adapter };

  factory.GetSink("dgate.engine").Publish(RecordLevel::Info, "kept");
  factory.GetSink("some.other.logger").Publish(RecordLevel::Severe, "dropped");
  factory.GetSink("").Publish(RecordLevel::Severe, "dropped");

  const auto records = log->Records();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].second, "kept");
  EXPECT_EQ(&factory.GetSink(LoggerFactory::EngineLoggerName), adapter.get());
}
