/** LICENSE TEMPLATE */
#pragma once
// dgate
#include <common.h>
#include <common/typedefs.h>

// stdlib
#include <regex>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dgate::dap {

// We've parsed the header of a message and we've verified that the body is contained in the buffer that we read
// into.
// - `payload_length` is the length of the body
// - `packet_offset` is the offset to the start of the header, into the owning buffer
// - `header_begin` points to the first position of the header in the buffer
// - `payload_begin` points to the first byte of the body in the buffer
struct ContentDescriptor
{
  u64 payload_length;
  u64 packet_offset;
  const char *header_begin;
  const char *payload_begin;

  std::string_view Payload() const noexcept;
};

// We've parsed the header of a message, but we haven't read the entire body
// - `payload_missing` is how much of the body that was missing (and needs to be added after the next read)
// - `packet_offset` is where the header of this message starts; everything from there must be kept for the next
// parse
struct PartialContentDescriptor
{
  u64 payload_length;
  u64 payload_missing;
  u64 packet_offset;
  const char *payload_begin;
};

// Data that we couldn't parse a "Content-Length" header from, which probably means we only read part of the
// header. It is always the last item found in the buffer.
struct RemainderData
{
  u64 length;
  u64 offset;
};

using ViewMatchResult = std::match_results<std::string_view::const_iterator>;
using ContentParse = std::variant<ContentDescriptor, PartialContentDescriptor, RemainderData>;

/// Split `bufferView` into framed messages. `allMessagesComplete` is set to false when the last item is a partial
/// message or remainder data.
std::vector<ContentParse> ParseHeadersFrom(std::string_view bufferView,
                                           bool *allMessagesComplete = nullptr) noexcept;

/// Accumulates bytes read from a stream and hands out the payloads of every complete message, keeping incomplete
/// data around for the next read.
class MessageBuffer
{
  std::string mBuffer;

public:
  void Append(std::span<const char> bytes) noexcept;
  std::vector<std::string> TakeCompleteMessages() noexcept;
  u64 PendingBytes() const noexcept;
};

/// Frame `payload` with its Content-Length header.
std::string Frame(std::string_view payload) noexcept;
} // namespace dgate::dap
