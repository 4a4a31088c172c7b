/** LICENSE TEMPLATE */
#include "scoped_fd.h"
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <utils/logger.h>
#include <utils/scope_defer.h>

namespace dgate {

ScopedFd::ScopedFd() noexcept : mFd(-1) {}

ScopedFd::ScopedFd(int fd) noexcept : mFd(fd)
{
  VERIFY(fd != -1, "Taking ownership of a closed file or error file: {}", strerror(errno));
}

ScopedFd::ScopedFd(ScopedFd &&other) noexcept : mFd(other.mFd) { other.mFd = -1; }

ScopedFd &
ScopedFd::operator=(ScopedFd &&other) noexcept
{
  if (this == &other) {
    return *this;
  }
  Close();
  mFd = other.mFd;
  other.mFd = -1;
  return *this;
}

ScopedFd::~ScopedFd() noexcept { Close(); }

int
ScopedFd::Get() const noexcept
{
  return mFd;
}

bool
ScopedFd::IsOpen() const noexcept
{
  return mFd != -1;
}

void
ScopedFd::Close() noexcept
{
  if (mFd >= 0) {
    if (::close(mFd) != 0 && errno != EINTR && errno != EIO) {
      PANIC("Failed to close file");
    }
  }
  mFd = -1;
}

ScopedFd::operator int() const noexcept { return Get(); }

int
ScopedFd::Release() noexcept
{
  const auto fd = mFd;
  mFd = -1;
  return fd;
}

std::optional<u16>
ScopedFd::LocalPort() const noexcept
{
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(mFd, reinterpret_cast<sockaddr *>(&addr), &len) == -1) {
    return std::nullopt;
  }
  if (addr.ss_family == AF_INET) {
    return ntohs(reinterpret_cast<sockaddr_in *>(&addr)->sin_port);
  }
  if (addr.ss_family == AF_INET6) {
    return ntohs(reinterpret_cast<sockaddr_in6 *>(&addr)->sin6_port);
  }
  return std::nullopt;
}

std::expected<ScopedFd, ConnectError>
ScopedFd::Accept(std::chrono::milliseconds timeout) const noexcept
{
  pollfd pfd{ .fd = mFd, .events = POLLIN, .revents = 0 };
  int ready = 0;
  do {
    ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  } while (ready == -1 && errno == EINTR);

  if (ready == -1) {
    return std::unexpected(ConnectError::Accept(errno));
  }
  if (ready == 0) {
    return std::unexpected(ConnectError::Timeout(timeout));
  }

  const auto client = ::accept(mFd, nullptr, nullptr);
  if (client == -1) {
    return std::unexpected(ConnectError::Accept(errno));
  }
  DBGLOG(core, "accepted connection on fd {}", client);
  return ScopedFd{ client };
}

/* static */
std::expected<ScopedFd, ConnectError>
ScopedFd::OpenSocketConnectTo(const std::string &host, int port) noexcept
{
  addrinfo hints = {};
  addrinfo *result = nullptr;
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  auto portNumber = std::to_string(port);
  if (const auto err = getaddrinfo(host.c_str(), portNumber.c_str(), &hints, &result); err != 0) {
    DBGLOG(core, "getaddrinfo failed when attempting to connect to {}:{}. Reported reason: {}", host, port,
           gai_strerror(err));
    return std::unexpected(ConnectError::AddrInfo(err));
  }

  ScopedDefer defer{ [&]() { freeaddrinfo(result); } };

  bool socketErrorOnly = true;
  int lastErrno = 0;
  for (auto rp = result; rp != nullptr; rp = rp->ai_next) {
    if (const auto fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol); fd != -1) {
      if (::connect(fd, rp->ai_addr, rp->ai_addrlen) != -1) {
        DBGLOG(core, "Successfully opened socket and connected to {}:{}", host, port);
        return ScopedFd{ fd };
      }
      lastErrno = errno;
      socketErrorOnly = false;
      ::close(fd);
    } else {
      lastErrno = errno;
    }
  }
  if (socketErrorOnly) {
    DBGLOG(core, "Failed to connect to {}:{} due to socket error. Reported reason: {}", host, port,
           strerror(lastErrno));
    return std::unexpected(ConnectError::Socket(lastErrno));
  }
  DBGLOG(core, "Failed to connect to {}:{}. Reported reason: {}", host, port, strerror(lastErrno));
  return std::unexpected(ConnectError::Connect(host, port, lastErrno));
}

/* static */
std::expected<ScopedFd, ConnectError>
ScopedFd::OpenListeningSocket(const std::string &host, int port) noexcept
{
  addrinfo hints = {};
  addrinfo *result = nullptr;
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

  auto portNumber = std::to_string(port);
  if (const auto err = getaddrinfo(host.c_str(), portNumber.c_str(), &hints, &result); err != 0) {
    DBGLOG(core, "getaddrinfo failed for listening address {}:{}: {}", host, port, gai_strerror(err));
    return std::unexpected(ConnectError::AddrInfo(err));
  }

  ScopedDefer defer{ [&]() { freeaddrinfo(result); } };

  std::optional<ConnectError> error;
  for (auto rp = result; rp != nullptr; rp = rp->ai_next) {
    const auto fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (fd == -1) {
      error = ConnectError::Socket(errno);
      continue;
    }
    ScopedFd socket{ fd };
    const int reuse = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) == -1) {
      DBGLOG(warning, "setsockopt(SO_REUSEADDR) failed: {}", strerror(errno));
    }
    if (::bind(fd, rp->ai_addr, rp->ai_addrlen) == -1) {
      error = ConnectError::Bind(host, port, errno);
      continue;
    }
    if (::listen(fd, SOMAXCONN) == -1) {
      error = ConnectError::Listen(errno);
      continue;
    }
    DBGLOG(core, "listening on {}:{}", host, socket.LocalPort().value_or(0));
    return std::move(socket);
  }
  return std::unexpected(error.value_or(ConnectError::Socket(0)));
}

/*static*/
ScopedFd
ScopedFd::TakeFileDescriptorOwnership(int fd) noexcept
{
  return ScopedFd{ fd };
}
} // namespace dgate
