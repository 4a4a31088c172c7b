/** LICENSE TEMPLATE */
#include "logger_adapter.h"
#include <algorithm>

namespace dgate::session {

NoiseMatchers
NoiseMatchers::Defaults() noexcept
{
  return NoiseMatchers{
    .mStreamClosedSuffixes = { "java.net.SocketException: Socket closed", "Socket closed" },
    .mBenignPrefixes = { "Exception on recording event: com.sun.jdi.VMDisconnectedException" },
  };
}

LoggerAdapter::LoggerAdapter(std::shared_ptr<logging::LogSink> log, NoiseMatchers matchers) noexcept
    : mLog(std::move(log)), mMatchers(std::move(matchers))
{
  VERIFY(mLog != nullptr, "Logger adapter requires a log sink");
}

bool
LoggerAdapter::IsNoise(std::string_view message) const noexcept
{
  const auto streamClosed = std::ranges::any_of(
    mMatchers.mStreamClosedSuffixes, [message](const std::string &suffix) { return message.ends_with(suffix); });
  if (streamClosed && mDebuggeeFinished.load()) {
    return true;
  }
  return std::ranges::any_of(mMatchers.mBenignPrefixes,
                             [message](const std::string &prefix) { return message.starts_with(prefix); });
}

void
LoggerAdapter::Publish(RecordLevel level, std::string_view message) noexcept
{
  switch (level) {
  case RecordLevel::Info:
  case RecordLevel::Config:
    mLog->Info(message);
    break;
  case RecordLevel::Warning:
    mLog->Warn(message);
    break;
  case RecordLevel::Severe:
    if (IsNoise(message)) {
      mLog->Debug(message);
    } else {
      mLog->Error(message);
    }
    break;
  case RecordLevel::Fine:
  case RecordLevel::Finer:
  case RecordLevel::Finest:
    mLog->Debug(message);
    break;
  }
}

void
LoggerAdapter::OnDebuggeeFinished() noexcept
{
  mDebuggeeFinished.store(true);
}

bool
LoggerAdapter::DebuggeeFinished() const noexcept
{
  return mDebuggeeFinished.load();
}

LoggerFactory::LoggerFactory(std::shared_ptr<LoggerAdapter> adapter) noexcept : mAdapter(std::move(adapter))
{
  VERIFY(mAdapter != nullptr, "Logger factory requires an adapter");
}

RecordSink &
LoggerFactory::GetSink(std::string_view loggerName) noexcept
{
  if (loggerName == EngineLoggerName) {
    return *mAdapter;
  }
  return mDiscard;
}
} // namespace dgate::session
