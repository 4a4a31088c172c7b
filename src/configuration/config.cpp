/** LICENSE TEMPLATE */
#include "config.h"

// dgate
#include <configuration/command_line.h>
#include <session/debuggee_logger.h>
#include <utils/thread_pool.h>

// std
#include <algorithm>
#include <filesystem>
#include <regex>

namespace dgate::cfg {

std::vector<Channel>
ParseLogChannels(std::string_view value) noexcept
{
  std::vector<Channel> result{};
  while (!value.empty()) {
    const auto comma = value.find(',');
    auto name = value.substr(0, comma);
    value.remove_prefix(comma == std::string_view::npos ? value.size() : comma + 1);
    while (!name.empty() && name.front() == ' ') {
      name.remove_prefix(1);
    }
    while (!name.empty() && name.back() == ' ') {
      name.remove_suffix(1);
    }

    if (name == "all") {
      const auto channels = Enum<Channel>::Variants();
      return std::vector<Channel>{ channels.begin(), channels.end() };
    }
    if (const auto chan = Enum<Channel>::FromString(name); chan && std::ranges::find(result, *chan) == result.end()) {
      result.push_back(*chan);
    }
  }
  return result;
}

std::unique_ptr<InitializationConfiguration>
InitializationConfiguration::ConfigureWithParser(CommandLineRegistry &parser) noexcept
{
  auto config = std::unique_ptr<InitializationConfiguration>(new InitializationConfiguration{});

  parser.AddOption(
    "-p", "--port",
    "Port on 127.0.0.1 to accept the debug adapter client on. 0 lets the system pick a free port; the port in use "
    "is printed on standard out.",
    config->mPort,
    [](ArgIterator &it) noexcept -> ParseResult<i32> {
      auto port = FromTraits<i32>::From(it);
      if (port && (*port < 0 || *port > 65535)) {
        return it.Error(ParseErrorType::OutOfRange);
      }
      return port;
    },
    0);

  parser.AddOption("-t", "--threads",
                   "Configure the worker thread pool size. Defaults to amount of threads on system minus two, "
                   "at least 2.",
                   config->mThreadPoolSize,
                   [](ArgIterator &it) noexcept -> ParseResult<u32> {
                     auto threads = FromTraits<u32>::From(it);
                     if (threads && *threads == 0) {
                       return it.Error(ParseErrorType::OutOfRange);
                     }
                     return threads;
                   },
                   ThreadPool::DefaultPoolSize());

  parser.AddOption(
    "-l", "--log",
    "The directory where log files should be saved. If that directory doesn't exist, it will not be created for "
    "you, and dgate will terminate.",
    config->mLogDirectory,
    [](ArgIterator &it) noexcept -> ParseResult<fs::path> {
      auto arg = TryExpected(it);
      std::error_code ec;
      if (fs::is_directory(arg, ec)) {
        return fs::path{ arg };
      }
      return it.Error(ParseErrorType::DirectoryDoesNotExist);
    },
    fs::current_path());

  parser.AddOption("-w", "--timeout",
                   "Milliseconds to wait for the debug adapter client to connect before giving up.",
                   config->mWaitForConnectionTimeout,
                   [](ArgIterator &it) noexcept -> ParseResult<i32> {
                     auto timeout = FromTraits<i32>::From(it);
                     if (timeout && *timeout <= 0) {
                       return it.Error(ParseErrorType::OutOfRange);
                     }
                     return timeout;
                   },
                   5000);

  parser.AddOption(
    "-a", "--address-pattern",
    "ECMAScript regular expression matched against each line the debuggee prints. The first match tells where "
    "the debuggee accepts a debugger: group 1 is the host (127.0.0.1 when it does not participate), group 2 the "
    "port.",
    config->mAddressPattern,
    [](ArgIterator &it) noexcept -> ParseResult<std::string> {
      auto arg = TryExpected(it);
      std::string pattern{ arg };
      // std::regex reports a malformed pattern only by throwing.
      try {
        std::regex compiled{ pattern, std::regex::ECMAScript };
        if (compiled.mark_count() < 2) {
          return it.Error(ParseErrorType::InvalidPattern);
        }
      } catch (const std::regex_error &) {
        return it.Error(ParseErrorType::InvalidPattern);
      }
      return pattern;
    },
    std::string{ session::DefaultAddressPattern });

  parser.AddOption("-h", "--help", "Print this help and exit.", config->mPrintHelp, &FromTraits<bool>::From, false);

  parser.AddTrailingArguments(config->mDebuggeeCommand,
                              "The debuggee command. It is started once per client connection and is expected to "
                              "print the address its debug agent listens on.");

#define LOG_HELP(channel, name, help) "\n - " #channel ": " help

  parser.AddEnvironmentVariable<std::vector<Channel>>(
    "LOG", "Configure what logging channels should be opened, comma separated, or 'all'.\n" FOR_EACH_LOG(LOG_HELP),
    config->mLogChannels,
    [](std::string_view value) noexcept -> ParseResult<std::vector<Channel>> { return ParseLogChannels(value); });

#undef LOG_HELP

  return config;
}
} // namespace dgate::cfg
