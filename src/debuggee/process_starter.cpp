/** LICENSE TEMPLATE */
#include "process_starter.h"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <posix/argslist.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utils/logger.h>
#include <utils/scoped_fd.h>

namespace dgate::debuggee {

static constexpr auto PollInterval = std::chrono::milliseconds{ 200 };

void
LineSplitter::Feed(std::span<const char> bytes, const std::function<void(std::string_view)> &onLine) noexcept
{
  mPending.append(bytes.data(), bytes.size());
  std::string_view view{ mPending };
  u64 consumed = 0;
  while (true) {
    const auto newline = view.find('\n', consumed);
    if (newline == std::string_view::npos) {
      break;
    }
    auto line = view.substr(consumed, newline - consumed);
    if (line.ends_with('\r')) {
      line.remove_suffix(1);
    }
    onLine(line);
    consumed = newline + 1;
  }
  mPending.erase(0, consumed);
}

void
LineSplitter::Flush(const std::function<void(std::string_view)> &onLine) noexcept
{
  if (!mPending.empty()) {
    onLine(mPending);
    mPending.clear();
  }
}

ProcessStarter::ProcessStarter(std::vector<std::string> command, std::chrono::milliseconds terminateGrace) noexcept
    : mCommand(std::move(command)), mTerminateGrace(terminateGrace)
{
  VERIFY(!mCommand.empty(), "Debuggee command can not be empty");
}

/* static */
session::DebuggeeStarter
ProcessStarter::Create(std::vector<std::string> command, std::chrono::milliseconds terminateGrace) noexcept
{
  auto starter = std::make_shared<ProcessStarter>(std::move(command), terminateGrace);
  return [starter](session::DebuggeeLogger &logger, std::stop_token stop) { starter->Run(logger, stop); };
}

namespace {
struct OutputStream
{
  ScopedFd mFd;
  LineSplitter mLines{};
  bool mIsStdout;

  bool
  IsOpen() const noexcept
  {
    return mFd.IsOpen();
  }
};

struct Pipe
{
  ScopedFd mRead;
  ScopedFd mWrite;
};

std::optional<Pipe>
OpenPipe() noexcept
{
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) == -1) {
    return std::nullopt;
  }
  return Pipe{ .mRead = ScopedFd{ fds[0] }, .mWrite = ScopedFd{ fds[1] } };
}

void
EmitLine(session::DebuggeeLogger &logger, bool isStdout, std::string_view line) noexcept
{
  if (isStdout) {
    logger.Out(line);
  } else {
    logger.Err(line);
  }
}

// Returns false once the stream has reached end of file.
bool
DrainStream(OutputStream &stream, session::DebuggeeLogger &logger) noexcept
{
  std::array<char, 4096> buffer{};
  const auto bytesRead = ::read(stream.mFd.Get(), buffer.data(), buffer.size());
  if (bytesRead == -1 && (errno == EINTR || errno == EAGAIN)) {
    return true;
  }
  if (bytesRead <= 0) {
    stream.mLines.Flush([&](std::string_view line) { EmitLine(logger, stream.mIsStdout, line); });
    stream.mFd.Close();
    return false;
  }
  stream.mLines.Feed(std::span{ buffer.data(), static_cast<u64>(bytesRead) },
                     [&](std::string_view line) { EmitLine(logger, stream.mIsStdout, line); });
  return true;
}

void
PollStreams(std::array<OutputStream, 2> &streams, session::DebuggeeLogger &logger,
            std::chrono::milliseconds timeout) noexcept
{
  std::array<pollfd, 2> fds{};
  std::array<OutputStream *, 2> polled{};
  nfds_t count = 0;
  for (auto &stream : streams) {
    if (stream.IsOpen()) {
      fds[count] = pollfd{ .fd = stream.mFd.Get(), .events = POLLIN, .revents = 0 };
      polled[count] = &stream;
      ++count;
    }
  }
  const auto ready = ::poll(fds.data(), count, static_cast<int>(timeout.count()));
  if (ready <= 0) {
    return;
  }
  for (nfds_t i = 0; i < count; ++i) {
    if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
      DrainStream(*polled[i], logger);
    }
  }
}

std::string
DescribeExit(int status) noexcept
{
  if (WIFEXITED(status)) {
    return fmt::format("exited with code {}", WEXITSTATUS(status));
  }
  if (WIFSIGNALED(status)) {
    return fmt::format("killed by signal {}", strsignal(WTERMSIG(status)));
  }
  return fmt::format("ended with status {}", status);
}
} // namespace

void
ProcessStarter::Run(session::DebuggeeLogger &logger, std::stop_token stop) const noexcept
{
  auto stdoutPipe = OpenPipe();
  auto stderrPipe = OpenPipe();
  if (!stdoutPipe || !stderrPipe) {
    logger.Error(fmt::format("failed to create pipes for the debuggee: {}", strerror(errno)));
    return;
  }

  // Everything the child needs is prepared before fork, the child only makes async-signal-safe calls.
  auto command = mCommand;
  PosixArgsList args{ std::move(command) };
  const int childOut = stdoutPipe->mWrite.Get();
  const int childErr = stderrPipe->mWrite.Get();

  const auto pid = ::fork();
  if (pid == -1) {
    logger.Error(fmt::format("failed to fork debuggee: {}", strerror(errno)));
    return;
  }

  if (pid == 0) {
    if (::dup2(childOut, STDOUT_FILENO) == -1 || ::dup2(childErr, STDERR_FILENO) == -1) {
      _exit(126);
    }
    ::execvp(args.Program(), args.Argv());
    static constexpr char ExecFailed[] = "dgate: failed to exec debuggee\n";
    [[maybe_unused]] const auto _ = ::write(STDERR_FILENO, ExecFailed, sizeof(ExecFailed) - 1);
    _exit(127);
  }

  stdoutPipe->mWrite.Close();
  stderrPipe->mWrite.Close();
  logger.Info(fmt::format("started debuggee '{}' as pid {}", args.Program(), pid));

  std::array<OutputStream, 2> streams{ OutputStream{ .mFd = std::move(stdoutPipe->mRead), .mIsStdout = true },
                                       OutputStream{ .mFd = std::move(stderrPipe->mRead), .mIsStdout = false } };

  using Clock = std::chrono::steady_clock;
  std::optional<Clock::time_point> terminateSent;
  bool killSent = false;
  int status = 0;

  while (true) {
    PollStreams(streams, logger, PollInterval);

    if (stop.stop_requested()) {
      if (!terminateSent) {
        logger.Debug(fmt::format("stopping debuggee {}", pid));
        ::kill(pid, SIGTERM);
        terminateSent = Clock::now();
      } else if (!killSent && Clock::now() - *terminateSent >= mTerminateGrace) {
        logger.Debug(fmt::format("debuggee {} ignored SIGTERM, killing it", pid));
        ::kill(pid, SIGKILL);
        killSent = true;
      }
    }

    const auto waited = ::waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }
    if (waited == -1 && errno != EINTR) {
      logger.Error(fmt::format("waitpid for debuggee {} failed: {}", pid, strerror(errno)));
      return;
    }
  }

  // The child is gone; pick up what it wrote before exiting without waiting on descendants that inherited the pipes.
  for (auto &stream : streams) {
    while (stream.IsOpen()) {
      pollfd pfd{ .fd = stream.mFd.Get(), .events = POLLIN, .revents = 0 };
      if (::poll(&pfd, 1, 0) <= 0) {
        stream.mLines.Flush([&](std::string_view line) { EmitLine(logger, stream.mIsStdout, line); });
        break;
      }
      DrainStream(stream, logger);
    }
  }

  logger.Info(fmt::format("debuggee {} {}", pid, DescribeExit(status)));
}
} // namespace dgate::debuggee
