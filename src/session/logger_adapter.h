/** LICENSE TEMPLATE */
#pragma once
// dgate
#include <common/macros.h>
#include <utils/logger.h>

// stdlib
#include <atomic>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// Severity of a log record reported by the debuggee-management layer, most severe first.
#define FOR_EACH_RECORD_LEVEL(LEVEL)                                                                               \
  LEVEL(Severe)                                                                                                    \
  LEVEL(Warning)                                                                                                   \
  LEVEL(Info)                                                                                                      \
  LEVEL(Config)                                                                                                    \
  LEVEL(Fine)                                                                                                      \
  LEVEL(Finer)                                                                                                     \
  LEVEL(Finest)

ENUM_TYPE_METADATA(RecordLevel, FOR_EACH_RECORD_LEVEL, u8)

namespace dgate::session {
using namespace std::string_view_literals;

/// Receives raw log records. Components that produce records (the relay backend, the process starter) only see this
/// interface.
class RecordSink
{
public:
  virtual ~RecordSink() noexcept = default;
  virtual void Publish(RecordLevel level, std::string_view message) noexcept = 0;
};

class DiscardingSink final : public RecordSink
{
public:
  void Publish(RecordLevel, std::string_view) noexcept final {}
};

/// Literal matchers for the errors a debuggee produces while it is being torn down.
struct NoiseMatchers
{
  // Noise only once the debuggee is known to have finished.
  std::vector<std::string> mStreamClosedSuffixes;
  // Always noise.
  std::vector<std::string> mBenignPrefixes;

  static NoiseMatchers Defaults() noexcept;
};

/// Maps records onto the domain log and downgrades expected shutdown noise to debug.
class LoggerAdapter final : public RecordSink
{
  std::shared_ptr<logging::LogSink> mLog;
  NoiseMatchers mMatchers;
  std::atomic<bool> mDebuggeeFinished{ false };

  bool IsNoise(std::string_view message) const noexcept;

public:
  explicit LoggerAdapter(std::shared_ptr<logging::LogSink> log,
                         NoiseMatchers matchers = NoiseMatchers::Defaults()) noexcept;
  NO_COPY(LoggerAdapter);

  void Publish(RecordLevel level, std::string_view message) noexcept final;
  /// Idempotent.
  void OnDebuggeeFinished() noexcept;
  bool DebuggeeFinished() const noexcept;
};

/// Hands out record sinks by logger name. The protocol engine's logger goes through the adapter, every other logger
/// is silenced.
class LoggerFactory
{
  std::shared_ptr<LoggerAdapter> mAdapter;
  DiscardingSink mDiscard{};

public:
  static constexpr auto EngineLoggerName = "dgate.engine"sv;

  explicit LoggerFactory(std::shared_ptr<LoggerAdapter> adapter) noexcept;
  RecordSink &GetSink(std::string_view loggerName) noexcept;
};
} // namespace dgate::session
