/** LICENSE TEMPLATE */
#include "logger.h"
#include <configuration/config.h>

namespace dgate::logging {

Logger *Logger::sLoggerInstance = new Logger{};

/* static */
void
Logger::ConfigureLogging(const cfg::InitializationConfiguration &config) noexcept
{
  ConfigureLogging(config.mLogDirectory, config.mLogChannels);
}

/* static */
void
Logger::ConfigureLogging(const Path &logDirectory, std::span<const Channel> channels) noexcept
{
  for (auto channel : channels) {
    if (sLoggerInstance->GetLogChannel(channel) == nullptr) {
      sLoggerInstance->SetupChannel(logDirectory, channel);
    }
  }
  DBGLOG(core, "channels set: {}", channels.size());
}

Logger::~Logger() noexcept
{
  for (auto ptr : mLogChannels) {
    if (ptr) {
      ptr->mFileStream.flush();
      ptr->mFileStream.close();
      delete ptr;
    }
  }
}

void
Logger::SetupChannel(const Path &logDirectory, Channel id) noexcept
{
  VERIFY(mLogChannels[std::to_underlying(id)] == nullptr, "Channel {} already created", id);
  Path p = logDirectory / fmt::format("{}.log", id);
  auto channel = new LogChannel{ .mChannelMutex = {},
    .mFileStream = std::fstream{ p, std::ios_base::in | std::ios_base::out | std::ios_base::trunc } };
  if (!channel->mFileStream.is_open()) {
    channel->mFileStream.open(p, std::ios_base::out | std::ios_base::trunc);
  }
  mLogChannels[std::to_underlying(id)] = channel;
}

void
Logger::Log(Channel id, std::string_view log_msg) noexcept
{
  if (auto ptr = mLogChannels[std::to_underlying(id)]; ptr) {
    ptr->Log(log_msg);
  }
}

Logger *
Logger::GetLogger() noexcept
{
  return Logger::sLoggerInstance;
}

/* static */
uint64_t
Logger::GetLogMessageId() noexcept
{
  return GetLogger()->mSequenceId++;
}

void
Logger::OnAbort() noexcept
{
  for (auto chan : mLogChannels) {
    if (chan) {
      chan->mFileStream.flush();
    }
  }
}

LogChannel *
Logger::GetLogChannel(Channel id) noexcept
{
  return mLogChannels[std::to_underlying(id)];
}

void
LogChannel::LogMessage(const char *file, u32 line, u32 column, std::string_view message) noexcept
{
  std::lock_guard guard{ mChannelMutex };
  const auto id = Logger::GetLogMessageId();
  mFileStream << '[' << id << "] " << message << fmt::format(" [{}:{}:{}]", file, line, column) << std::endl;
}

void
LogChannel::Log(std::string_view msg) noexcept
{
  std::lock_guard guard{ mChannelMutex };
  mFileStream << msg << std::endl;
}

void
ChannelSink::Log(LogLevel level, std::string_view message) noexcept
{
  const auto line = fmt::format("[{}] {}", level, message);
  Logger::LogIf(mChannel, line);
  if (level == LogLevel::warn || level == LogLevel::error) {
    Logger::LogIf(Channel::warning, line);
  }
}

Logger *
GetLogger() noexcept
{
  return Logger::GetLogger();
}

LogChannel *
GetLogChannel(Channel id) noexcept
{
  return GetLogger()->GetLogChannel(id);
}

} // namespace dgate::logging
