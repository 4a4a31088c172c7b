/** LICENSE TEMPLATE */
#include "debuggee_logger.h"
#include <charconv>

namespace dgate::session {

static constexpr auto DefaultDebuggeeHost = "127.0.0.1";

DebuggeeLogger::DebuggeeLogger(dap::ProtocolEngine &events, utils::OneShot<DebuggeeAddress> &addressResolved,
                               std::shared_ptr<logging::LogSink> log, std::string_view addressPattern) noexcept
    : mEvents(events), mAddressResolved(addressResolved), mLog(std::move(log)),
      mAddressPattern(std::string{ addressPattern }, std::regex::ECMAScript)
{
}

/* static */
std::optional<DebuggeeAddress>
DebuggeeLogger::MatchAddress(const std::regex &pattern, std::string_view line) noexcept
{
  std::match_results<std::string_view::const_iterator> match;
  if (!std::regex_search(line.begin(), line.end(), match, pattern) || match.size() < 3 || !match[2].matched) {
    return std::nullopt;
  }

  const std::string_view portString{ match[2].first, match[2].second };
  int port = 0;
  const auto res = std::from_chars(portString.data(), portString.data() + portString.size(), port);
  if (res.ec != std::errc() || port <= 0 || port > 65535) {
    return std::nullopt;
  }

  std::string host = match[1].matched ? std::string{ match[1].first, match[1].second } : DefaultDebuggeeHost;
  return DebuggeeAddress{ .mHost = std::move(host), .mPort = port };
}

void
DebuggeeLogger::ScanForAddress(std::string_view line) noexcept
{
  if (mAddressResolved.IsSettled()) {
    return;
  }
  if (auto address = MatchAddress(mAddressPattern, line); address) {
    const auto host = address->mHost;
    const auto port = address->mPort;
    if (mAddressResolved.TrySettle(std::move(*address))) {
      mLog->Info(fmt::format("debuggee listening at {}:{}", host, port));
    }
  }
}

void
DebuggeeLogger::Out(std::string_view line) noexcept
{
  ScanForAddress(line);
  mEvents.SendEvent(dap::OutputEvent("stdout", fmt::format("{}\n", line)));
}

void
DebuggeeLogger::Err(std::string_view line) noexcept
{
  ScanForAddress(line);
  mEvents.SendEvent(dap::OutputEvent("stderr", fmt::format("{}\n", line)));
}

void
DebuggeeLogger::Debug(std::string_view message) noexcept
{
  mLog->Debug(message);
}

void
DebuggeeLogger::Info(std::string_view message) noexcept
{
  mLog->Info(message);
}

void
DebuggeeLogger::Error(std::string_view message) noexcept
{
  mLog->Error(message);
}
} // namespace dgate::session
