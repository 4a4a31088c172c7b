/** LICENSE TEMPLATE */
#pragma once
// dgate
#include <common.h>
#include <utils/log_channel.h>

// stdlib
#include <array>
#include <atomic>
#include <fstream>
#include <mutex>
#include <source_location>
#include <span>
#include <string>
#include <string_view>

namespace dgate::cfg {
class InitializationConfiguration;
}

namespace dgate::logging {

struct LogChannel
{
  std::mutex mChannelMutex;
  std::fstream mFileStream;
  void LogMessage(const char *file, u32 line, u32 column, std::string_view message) noexcept;
  void Log(std::string_view msg) noexcept;
};

class Logger
{
  static Logger *sLoggerInstance;
  std::atomic<uint64_t> mSequenceId{ 0 };

public:
  Logger() noexcept = default;
  ~Logger() noexcept;
  void SetupChannel(const Path &logDirectory, Channel id) noexcept;
  void Log(Channel id, std::string_view log_msg) noexcept;
  static Logger *GetLogger() noexcept;
  static uint64_t GetLogMessageId() noexcept;

  void OnAbort() noexcept;
  LogChannel *GetLogChannel(Channel id) noexcept;

  static void
  LogIf(Channel id, std::string_view message) noexcept
  {
    if (auto *channel = GetLogger()->GetLogChannel(id); channel) {
      channel->Log(message);
    }
  }

  static void ConfigureLogging(const cfg::InitializationConfiguration &config) noexcept;
  static void ConfigureLogging(const Path &logDirectory, std::span<const Channel> channels) noexcept;

private:
  std::array<LogChannel *, Enum<Channel>::Count()> mLogChannels{};
};

Logger *GetLogger() noexcept;
LogChannel *GetLogChannel(Channel id) noexcept;

// Leveled logging for components that report to "a logger" rather than a specific channel. The session
// controller and the debuggee layer only know about this interface, which is what lets tests observe them.
class LogSink
{
public:
  virtual ~LogSink() noexcept = default;
  virtual void Log(LogLevel level, std::string_view message) noexcept = 0;

  void
  Debug(std::string_view message) noexcept
  {
    Log(LogLevel::debug, message);
  }

  void
  Info(std::string_view message) noexcept
  {
    Log(LogLevel::info, message);
  }

  void
  Warn(std::string_view message) noexcept
  {
    Log(LogLevel::warn, message);
  }

  void
  Error(std::string_view message) noexcept
  {
    Log(LogLevel::error, message);
  }
};

/// Writes "[level] message" to a log channel. Warnings and errors are mirrored to the warning channel.
class ChannelSink final : public LogSink
{
  Channel mChannel;

public:
  explicit ChannelSink(Channel channel) noexcept : mChannel(channel) {}
  void Log(LogLevel level, std::string_view message) noexcept final;
};

#if defined(DGATE_DEBUG) and DGATE_DEBUG == 1

// CONDITIONAL DEBUG LOG
#define CDLOG(condition, channel_name, ...)                                                                        \
  if ((condition)) {                                                                                               \
    auto LOC = std::source_location::current();                                                                    \
    if (auto channel = dgate::logging::GetLogChannel(Channel::channel_name); channel) {                            \
      channel->LogMessage(LOC.file_name(), LOC.line() - 1, LOC.column() - 2, fmt::format(__VA_ARGS__));            \
    }                                                                                                              \
  }

#else
#define CDLOG(...)
#endif

#define DBGLOG(channel, ...)                                                                                       \
  if (auto channel = dgate::logging::GetLogChannel(Channel::channel); channel) {                                   \
    std::source_location srcLoc = std::source_location::current();                                                 \
    channel->LogMessage(srcLoc.file_name(), srcLoc.line() - 1, srcLoc.column() - 2, fmt::format(__VA_ARGS__));     \
  }

} // namespace dgate::logging
