/** LICENSE TEMPLATE */
#include <backend/relay_handler.h>
#include <configuration/command_line.h>
#include <configuration/config.h>
#include <debuggee/process_starter.h>
#include <interface/dap/connection.h>
#include <interface/dap/protocol_server.h>
#include <session/debug_session.h>
#include <session/logger_adapter.h>
#include <utils/logger.h>
#include <utils/scoped_fd.h>
#include <utils/thread_pool.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fmt/core.h>
#include <span>

static std::atomic<bool> sInterrupted{ false };

namespace dgate {

enum class ConnectionOutcome
{
  Restarted,
  Terminated,
  Interrupted
};

// Serve one client connection until the session settles or we get interrupted.
static ConnectionOutcome
ServeConnection(ScopedFd client, const cfg::InitializationConfiguration &config, ThreadPool &pool) noexcept
{
  using namespace std::chrono_literals;
  auto log = std::make_shared<logging::ChannelSink>(Channel::session);
  auto adapter = std::make_shared<session::LoggerAdapter>(log);
  session::LoggerFactory loggers{ adapter };

  auto connection = std::make_shared<dap::SocketConnection>(std::move(client));
  auto relay = std::make_unique<backend::RelayHandler>(loggers.GetSink(session::LoggerFactory::EngineLoggerName));
  auto engine = std::make_shared<dap::ProtocolServer>(connection, std::move(relay));

  auto starter = debuggee::ProcessStarter::Create(config.mDebuggeeCommand);
  auto session = session::DebugSession::Create(connection, engine, std::move(starter), pool, adapter, log,
                                               session::SessionOptions{ .mAddressPattern = config.mAddressPattern });
  session->Start();

  while (true) {
    if (sInterrupted) {
      DBGLOG(core, "interrupted, cancelling session");
      session->Cancel();
      session->EndOfConnection().WaitFor(5000ms);
      return ConnectionOutcome::Interrupted;
    }
    if (const auto verdict = session->ExitStatus().WaitFor(100ms); verdict) {
      DBGLOG(core, "session exited: {}", *verdict);
      if (*verdict == ExitVerdict::Restarted) {
        session->Cancel();
        return ConnectionOutcome::Restarted;
      }
      return ConnectionOutcome::Terminated;
    }
  }
}
} // namespace dgate

int
main(int argc, const char **argv)
{
  using dgate::logging::Logger;
  signal(SIGPIPE, SIG_IGN);
  signal(SIGINT, [](int) { sInterrupted = true; });
  signal(SIGTERM, [](int) { sInterrupted = true; });

  dgate::cfg::CommandLineRegistry parser{ "dgate" };
  auto config = dgate::cfg::InitializationConfiguration::ConfigureWithParser(parser);
  const auto result = parser.Parse(argc, argv);

  if (config->mPrintHelp) {
    parser.PrintHelp();
    return 0;
  }

  if (!result.mErrors.empty()) {
    for (const auto &error : result.mErrors) {
      fmt::print(stderr, "{}\n", error);
    }
    return -1;
  }

  if (config->mDebuggeeCommand.empty()) {
    fmt::print(stderr, "No debuggee command given. Pass it after '--'.\n");
    return -1;
  }

  Logger::ConfigureLogging(*config);
  std::span<const char *> args(argv, argc);
  DBGLOG(core, "dgate CLI Arguments");
  for (const auto arg : args.subspan(1)) {
    DBGLOG(core, "{}", arg);
  }

  dgate::ThreadPool pool{};
  pool.Init(config->mThreadPoolSize);

  auto listener = dgate::ScopedFd::OpenListeningSocket("127.0.0.1", config->mPort);
  if (!listener) {
    fmt::print(stderr, "{}: {}\n", listener.error().msg, strerror(listener.error().sys_errno));
    return -1;
  }
  const auto port = listener->LocalPort();
  fmt::print("{}\n", port.value_or(0));
  std::fflush(stdout);
  DBGLOG(core, "accepting debug adapter clients on 127.0.0.1:{}", port.value_or(0));

  while (!sInterrupted) {
    auto client = listener->Accept(config->ConnectionTimeout());
    if (!client) {
      if (client.error().kind == dgate::ConnectError::Kind::Timeout) {
        DBGLOG(core, "{}", client.error().msg);
      } else {
        DBGLOG(warning, "{}: {}", client.error().msg, strerror(client.error().sys_errno));
      }
      fmt::print(stderr, "{}\n", client.error().msg);
      return -1;
    }

    DBGLOG(core, "client connected");
    const auto outcome = dgate::ServeConnection(std::move(client.value()), *config, pool);
    if (outcome != dgate::ConnectionOutcome::Restarted) {
      break;
    }
    DBGLOG(core, "client asked for a restart, waiting for the next connection");
  }

  DBGLOG(core, "Exited...");
  return 0;
}
