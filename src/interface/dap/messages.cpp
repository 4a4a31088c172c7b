/** LICENSE TEMPLATE */
#include "messages.h"

namespace dgate::dap {

// Debuggee output is not guaranteed to be UTF-8. Invalid bytes become U+FFFD instead of throwing.
static std::string
Dump(const Json &json) noexcept
{
  return json.dump(-1, ' ', false, Json::error_handler_t::replace);
}

Json
Request::ToJson() const noexcept
{
  Json dict;
  dict["seq"] = mSeq;
  dict["type"] = "request";
  dict["command"] = mCommand;
  if (!mArguments.is_null()) {
    dict["arguments"] = mArguments;
  }
  return dict;
}

std::string
Request::Serialize() const noexcept
{
  return Dump(ToJson());
}

Json
Response::ToJson(i64 seq) const noexcept
{
  Json dict;
  dict["seq"] = seq;
  dict["type"] = "response";
  dict["request_seq"] = mRequestSeq;
  dict["success"] = mSuccess;
  dict["command"] = mCommand;
  if (mMessage) {
    dict["message"] = *mMessage;
  }
  if (!mBody.is_null()) {
    dict["body"] = mBody;
  }
  return dict;
}

std::string
Response::Serialize(i64 seq) const noexcept
{
  return Dump(ToJson(seq));
}

Json
Event::ToJson(i64 seq) const noexcept
{
  Json dict;
  dict["seq"] = seq;
  dict["type"] = "event";
  dict["event"] = mEvent;
  if (!mBody.is_null()) {
    dict["body"] = mBody;
  }
  return dict;
}

std::string
Event::Serialize(i64 seq) const noexcept
{
  return Dump(ToJson(seq));
}

static std::optional<std::string>
StringField(const Json &dict, const char *key) noexcept
{
  const auto it = dict.find(key);
  if (it == dict.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

static std::optional<i64>
IntegerField(const Json &dict, const char *key) noexcept
{
  const auto it = dict.find(key);
  if (it == dict.end() || !it->is_number_integer()) {
    return std::nullopt;
  }
  return it->get<i64>();
}

static Json
OptionalField(const Json &dict, const char *key) noexcept
{
  const auto it = dict.find(key);
  if (it == dict.end()) {
    return Json{};
  }
  return *it;
}

std::expected<ProtocolMessage, std::string>
ParseProtocolMessage(std::string_view payload) noexcept
{
  auto dict = Json::parse(payload, nullptr, false);
  if (dict.is_discarded()) {
    return std::unexpected(std::string{ "payload is not valid JSON" });
  }
  if (!dict.is_object()) {
    return std::unexpected(std::string{ "payload is not a JSON object" });
  }
  const auto type = StringField(dict, "type");
  if (!type) {
    return std::unexpected(std::string{ "message has no 'type'" });
  }

  if (*type == "request") {
    const auto seq = IntegerField(dict, "seq");
    const auto command = StringField(dict, "command");
    if (!seq || !command) {
      return std::unexpected(std::string{ "request requires 'seq' and 'command'" });
    }
    return Request{ .mSeq = *seq, .mCommand = *command, .mArguments = OptionalField(dict, "arguments") };
  }

  if (*type == "response") {
    const auto requestSeq = IntegerField(dict, "request_seq");
    const auto command = StringField(dict, "command");
    const auto success = dict.find("success");
    if (!requestSeq || !command || success == dict.end() || !success->is_boolean()) {
      return std::unexpected(std::string{ "response requires 'request_seq', 'command' and 'success'" });
    }
    return Response{ .mRequestSeq = *requestSeq,
                     .mCommand = *command,
                     .mSuccess = success->get<bool>(),
                     .mMessage = StringField(dict, "message"),
                     .mBody = OptionalField(dict, "body") };
  }

  if (*type == "event") {
    const auto name = StringField(dict, "event");
    if (!name) {
      return std::unexpected(std::string{ "event requires 'event'" });
    }
    return Event{ .mEvent = *name, .mBody = OptionalField(dict, "body") };
  }

  return std::unexpected(fmt::format("unknown message type '{}'", *type));
}

std::expected<Request, std::string>
ParseRequest(std::string_view payload) noexcept
{
  auto message = ParseProtocolMessage(payload);
  if (!message) {
    return std::unexpected(std::move(message.error()));
  }
  if (auto request = std::get_if<Request>(&message.value()); request) {
    return std::move(*request);
  }
  return std::unexpected(std::string{ "message is not a request" });
}

Request
AttachRequest(i64 seq, std::string_view host, int port) noexcept
{
  Json arguments;
  arguments["hostName"] = host;
  arguments["port"] = port;
  return Request{ .mSeq = seq, .mCommand = std::string{ command::Attach }, .mArguments = std::move(arguments) };
}

Response
Acknowledge(const Request &request) noexcept
{
  return Response{
    .mRequestSeq = request.mSeq, .mCommand = request.mCommand, .mSuccess = true, .mMessage = {}, .mBody = {}
  };
}

Response
Failed(i64 requestSeq, std::string_view command, std::string_view message) noexcept
{
  return Response{ .mRequestSeq = requestSeq,
                   .mCommand = std::string{ command },
                   .mSuccess = false,
                   .mMessage = std::string{ message },
                   .mBody = {} };
}

Response
Failed(const Request &request, std::string_view message) noexcept
{
  return Failed(request.mSeq, request.mCommand, message);
}

Event
OutputEvent(std::string_view category, std::string_view output) noexcept
{
  Json body;
  body["category"] = category;
  body["output"] = output;
  return Event{ .mEvent = std::string{ event::Output }, .mBody = std::move(body) };
}

bool
ShouldRestart(const Request &request) noexcept
{
  if (!request.mArguments.is_object()) {
    return false;
  }
  const auto it = request.mArguments.find("restart");
  return it != request.mArguments.end() && it->is_boolean() && it->get<bool>();
}
} // namespace dgate::dap
