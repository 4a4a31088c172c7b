/** LICENSE TEMPLATE */
#pragma once
// dgate
#include <common/typedefs.h>
#include <utils/scoped_fd.h>

// stdlib
#include <atomic>
#include <expected>
#include <span>
#include <string_view>

namespace dgate::dap {

/// Duplex byte stream carrying a DAP conversation.
class Connection
{
public:
  virtual ~Connection() noexcept = default;
  /// Returns the number of bytes read, 0 at end of stream, or errno.
  virtual std::expected<u64, int> Read(std::span<char> buffer) noexcept = 0;
  /// Writes all of `bytes`. Returns false if the stream is closed or broken.
  virtual bool Write(std::string_view bytes) noexcept = 0;
  /// Idempotent. A reader blocked in Read returns end of stream.
  virtual void Close() noexcept = 0;
  virtual bool IsClosed() const noexcept = 0;
};

class SocketConnection final : public Connection
{
  ScopedFd mSocket;
  std::atomic<bool> mClosed{ false };

public:
  explicit SocketConnection(ScopedFd socket) noexcept;
  ~SocketConnection() noexcept override;
  NO_COPY(SocketConnection);

  std::expected<u64, int> Read(std::span<char> buffer) noexcept final;
  bool Write(std::string_view bytes) noexcept final;
  void Close() noexcept final;
  bool IsClosed() const noexcept final;
};
} // namespace dgate::dap
