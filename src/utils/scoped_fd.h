/** LICENSE TEMPLATE */
#pragma once
// dgate
#include <common.h>
#include <common/typedefs.h>

// stdlib
#include <chrono>
#include <expected>
#include <string>

namespace dgate {

struct ConnectError
{
  enum class Kind
  {
    GetAddressInfo,
    Socket,
    Connect,
    Bind,
    Listen,
    Accept,
    Timeout
  };

  Kind kind;
  std::string msg;
  int sys_errno;

  static ConnectError
  AddrInfo(int sys) noexcept
  {
    return ConnectError{ .kind = Kind::GetAddressInfo, .msg = "getaddrinfo failed", .sys_errno = sys };
  }

  static ConnectError
  Socket(int sys) noexcept
  {
    return ConnectError{ .kind = Kind::Socket, .msg = "Failed to open socket", .sys_errno = sys };
  }

  static ConnectError
  Connect(const std::string &host, int port, int sys) noexcept
  {
    return ConnectError{
      .kind = Kind::Connect, .msg = fmt::format("Failed to connect to {}:{}", host, port), .sys_errno = sys
    };
  }

  static ConnectError
  Bind(const std::string &host, int port, int sys) noexcept
  {
    return ConnectError{ .kind = Kind::Bind, .msg = fmt::format("Failed to bind {}:{}", host, port), .sys_errno = sys };
  }

  static ConnectError
  Listen(int sys) noexcept
  {
    return ConnectError{ .kind = Kind::Listen, .msg = "Failed to listen on socket", .sys_errno = sys };
  }

  static ConnectError
  Accept(int sys) noexcept
  {
    return ConnectError{ .kind = Kind::Accept, .msg = "Failed to accept connection", .sys_errno = sys };
  }

  static ConnectError
  Timeout(std::chrono::milliseconds waited) noexcept
  {
    return ConnectError{ .kind = Kind::Timeout,
                         .msg = fmt::format("No connection within {}ms", waited.count()),
                         .sys_errno = 0 };
  }
};

class ScopedFd
{
public:
  ScopedFd() noexcept;
  explicit ScopedFd(int fd) noexcept;
  ScopedFd &operator=(ScopedFd &&other) noexcept;
  ScopedFd(ScopedFd &&) noexcept;
  NO_COPY(ScopedFd);
  ~ScopedFd() noexcept;

  int Get() const noexcept;
  bool IsOpen() const noexcept;
  void Close() noexcept;
  operator int() const noexcept;
  /// Give up ownership without closing. Returns the file descriptor.
  int Release() noexcept;

  /// Port the socket is bound to, if this is a bound socket.
  std::optional<u16> LocalPort() const noexcept;
  /// Waits at most `timeout` for a client on a listening socket.
  std::expected<ScopedFd, ConnectError> Accept(std::chrono::milliseconds timeout) const noexcept;

  static std::expected<ScopedFd, ConnectError> OpenSocketConnectTo(const std::string &host, int port) noexcept;
  /// Bind and listen on `host:port`. Port 0 lets the kernel pick one, see LocalPort.
  static std::expected<ScopedFd, ConnectError> OpenListeningSocket(const std::string &host, int port) noexcept;
  static ScopedFd TakeFileDescriptorOwnership(int fd) noexcept;

private:
  int mFd;
};
} // namespace dgate
