/** LICENSE TEMPLATE */
#pragma once
// dgate
#include <common.h>
#include <common/typedefs.h>

// stdlib
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

// dependency
#include <nlohmann/json.hpp>

namespace dgate::dap {
using Json = nlohmann::json;
using namespace std::string_view_literals;

namespace command {
constexpr auto Launch = "launch"sv;
constexpr auto Attach = "attach"sv;
constexpr auto Disconnect = "disconnect"sv;
} // namespace command

namespace event {
constexpr auto Terminated = "terminated"sv;
constexpr auto Exited = "exited"sv;
constexpr auto Output = "output"sv;
} // namespace event

struct Request
{
  i64 mSeq;
  std::string mCommand;
  Json mArguments;

  Json ToJson() const noexcept;
  std::string Serialize() const noexcept;
};

struct Response
{
  i64 mRequestSeq;
  std::string mCommand;
  bool mSuccess;
  std::optional<std::string> mMessage;
  Json mBody;

  /// `seq` is the sender's sequence number for this message.
  Json ToJson(i64 seq) const noexcept;
  std::string Serialize(i64 seq) const noexcept;
};

struct Event
{
  std::string mEvent;
  Json mBody;

  Json ToJson(i64 seq) const noexcept;
  std::string Serialize(i64 seq) const noexcept;
};

using ProtocolMessage = std::variant<Request, Response, Event>;

/// Parse one DAP message payload (the JSON body, without the header).
std::expected<ProtocolMessage, std::string> ParseProtocolMessage(std::string_view payload) noexcept;
std::expected<Request, std::string> ParseRequest(std::string_view payload) noexcept;

/// An attach request for `host:port`, carrying `seq` as its request id.
Request AttachRequest(i64 seq, std::string_view host, int port) noexcept;
/// Successful, body-less response to `request`.
Response Acknowledge(const Request &request) noexcept;
Response Failed(i64 requestSeq, std::string_view command, std::string_view message) noexcept;
Response Failed(const Request &request, std::string_view message) noexcept;
Event OutputEvent(std::string_view category, std::string_view output) noexcept;

/// True only when `arguments.restart` is present and is the boolean `true`.
bool ShouldRestart(const Request &request) noexcept;
} // namespace dgate::dap
