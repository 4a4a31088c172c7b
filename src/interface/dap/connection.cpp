/** LICENSE TEMPLATE */
#include "connection.h"
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>
#include <utils/logger.h>

namespace dgate::dap {

SocketConnection::SocketConnection(ScopedFd socket) noexcept : mSocket(std::move(socket)) {}

SocketConnection::~SocketConnection() noexcept { Close(); }

std::expected<u64, int>
SocketConnection::Read(std::span<char> buffer) noexcept
{
  while (true) {
    const auto bytesRead = ::read(mSocket.Get(), buffer.data(), buffer.size());
    if (bytesRead >= 0) {
      return static_cast<u64>(bytesRead);
    }
    if (errno != EINTR) {
      return std::unexpected(errno);
    }
  }
}

bool
SocketConnection::Write(std::string_view bytes) noexcept
{
  if (mClosed.load()) {
    return false;
  }
  while (!bytes.empty()) {
    const auto written = ::send(mSocket.Get(), bytes.data(), bytes.size(), MSG_NOSIGNAL);
    if (written == -1) {
      if (errno == EINTR) {
        continue;
      }
      DBGLOG(dap, "write to client failed: {}", strerror(errno));
      return false;
    }
    bytes.remove_prefix(static_cast<u64>(written));
  }
  return true;
}

void
SocketConnection::Close() noexcept
{
  if (mClosed.exchange(true)) {
    return;
  }
  // The descriptor stays open until destruction; another thread may be blocked reading from it.
  if (::shutdown(mSocket.Get(), SHUT_RDWR) == -1 && errno != ENOTCONN) {
    DBGLOG(dap, "shutdown of client socket failed: {}", strerror(errno));
  }
  DBGLOG(dap, "client connection closed");
}

bool
SocketConnection::IsClosed() const noexcept
{
  return mClosed.load();
}
} // namespace dgate::dap
