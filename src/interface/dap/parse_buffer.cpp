/** LICENSE TEMPLATE */
#include "parse_buffer.h"
#include <charconv>
#include <utils/logger.h>

namespace dgate::dap {

static const std::regex CONTENT_LENGTH_HEADER = std::regex{ R"(Content-Length: (\d+)\r\n\r\n)" };

std::string_view
ContentDescriptor::Payload() const noexcept
{
  return std::string_view{ payload_begin, payload_begin + payload_length };
}

static std::optional<u64>
ToIntegral(std::string_view str) noexcept
{
  u64 value = 0;
  const auto res = std::from_chars(str.data(), str.data() + str.size(), value);
  if (res.ec != std::errc() || res.ptr != str.data() + str.size()) {
    return std::nullopt;
  }
  return value;
}

std::vector<ContentParse>
ParseHeadersFrom(std::string_view bufferView, bool *allMessagesComplete) noexcept
{
  std::vector<ContentParse> result{};

  std::string_view internalView{ bufferView };
  ViewMatchResult baseMatch;
  bool partialFound = false;
  while (std::regex_search(internalView.begin(), internalView.end(), baseMatch, CONTENT_LENGTH_HEADER)) {
    std::string_view lengthString{ baseMatch[1].first, baseMatch[1].second };
    const auto res = ToIntegral(lengthString);
    VERIFY(res.has_value(), "Failed to parse length from Content-Length header: '{}'", lengthString);
    const auto len = res.value();
    const u64 headerEnd = baseMatch.position() + baseMatch.length();
    const auto headerBegin = internalView.data() + baseMatch.position();
    const auto packetOffset = static_cast<u64>(std::distance(bufferView.data(), headerBegin));
    if (headerEnd + len <= internalView.size()) {
      result.push_back(ContentDescriptor{ .payload_length = len,
                                          .packet_offset = packetOffset,
                                          .header_begin = headerBegin,
                                          .payload_begin = internalView.data() + headerEnd });
      internalView.remove_prefix(headerEnd + len);
    } else {
      result.push_back(PartialContentDescriptor{ .payload_length = len,
                                                 .payload_missing = (headerEnd + len) - internalView.size(),
                                                 .packet_offset = packetOffset,
                                                 .payload_begin = internalView.data() + headerEnd });
      internalView.remove_prefix(internalView.size());
      partialFound = true;
    }
  }
  if (!internalView.empty()) {
    const u64 offset = std::distance(bufferView.data(), internalView.data());
    result.push_back(RemainderData{ .length = internalView.size(), .offset = offset });
    partialFound = true;
  }
  if (allMessagesComplete != nullptr) {
    *allMessagesComplete = !partialFound;
  }
  return result;
}

void
MessageBuffer::Append(std::span<const char> bytes) noexcept
{
  mBuffer.append(bytes.data(), bytes.size());
}

std::vector<std::string>
MessageBuffer::TakeCompleteMessages() noexcept
{
  std::vector<std::string> messages;
  const auto parsed = ParseHeadersFrom(mBuffer);
  u64 consumed = mBuffer.size();
  for (const auto &item : parsed) {
    if (const auto cd = std::get_if<ContentDescriptor>(&item); cd) {
      messages.emplace_back(cd->Payload());
    } else if (const auto pcd = std::get_if<PartialContentDescriptor>(&item); pcd) {
      consumed = pcd->packet_offset;
    } else if (const auto rd = std::get_if<RemainderData>(&item); rd) {
      consumed = rd->offset;
    }
  }
  mBuffer.erase(0, consumed);
  return messages;
}

u64
MessageBuffer::PendingBytes() const noexcept
{
  return mBuffer.size();
}

std::string
Frame(std::string_view payload) noexcept
{
  return fmt::format("Content-Length: {}\r\n\r\n{}", payload.size(), payload);
}
} // namespace dgate::dap
