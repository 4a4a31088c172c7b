/** LICENSE TEMPLATE */
#pragma once

// dgate
#include <common.h>
#include <configuration/command_line.h>
#include <utils/log_channel.h>
// std
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace dgate::cfg {

class InitializationConfiguration
{
  // Construction only allowed via `ConfigureWithParser`
  InitializationConfiguration() noexcept = default;

public:
  i32 mPort;
  u32 mThreadPoolSize;
  std::filesystem::path mLogDirectory;
  i32 mWaitForConnectionTimeout;
  std::string mAddressPattern;
  bool mPrintHelp;
  std::vector<Channel> mLogChannels;
  std::vector<std::string> mDebuggeeCommand;

  std::chrono::milliseconds
  ConnectionTimeout() const noexcept
  {
    return std::chrono::milliseconds{ mWaitForConnectionTimeout };
  }

  /// Registers every option with `parser`; the returned configuration is filled in by `parser.Parse`.
  static std::unique_ptr<InitializationConfiguration> ConfigureWithParser(CommandLineRegistry &parser) noexcept;
};

/// Parses the comma separated channel list of the LOG environment variable. "all" opens every channel, unknown
/// names are ignored.
std::vector<Channel> ParseLogChannels(std::string_view value) noexcept;
} // namespace dgate::cfg
