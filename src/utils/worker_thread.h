/** LICENSE TEMPLATE */
#pragma once
// dgate
#include <common/macros.h>

// stdlib
#include <atomic>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

namespace dgate {

/// A named thread that runs one function with a stop token. Used for the long-lived flows of the gateway (protocol
/// read loops, the debuggee computation, pool workers) so that each shows up with a recognizable name in tools
/// like `top -H` and gdb.
class WorkerThread
{
  static int
  GetNextWorkerThreadNumber() noexcept
  {
    static std::atomic<int> i = 0;
    return i++;
  }

  std::string mThreadName;
  explicit WorkerThread(std::string &&name, std::function<void(std::stop_token &)> &&task) noexcept;

public:
  NO_COPY(WorkerThread);
  using OwnedPtr = std::unique_ptr<WorkerThread>;

  ~WorkerThread() noexcept;
  static OwnedPtr SpawnWorkerThread(std::function<void(std::stop_token &)> task) noexcept;
  static OwnedPtr SpawnWorkerThread(std::string threadName, std::function<void(std::stop_token &)> task) noexcept;

  void Start() noexcept;
  /// Join the thread. Called from the thread itself, the thread is detached instead.
  void Join() noexcept;
  bool IsJoinable() const noexcept;
  /// Request jthread to stop. Returns false if a stop was already requested.
  bool RequestStop() noexcept;
  bool StopRequested() const noexcept;
  const std::string &Name() const noexcept;

private:
  std::function<void(std::stop_token &tok)> mWork;
  std::jthread mThread;
  bool mStarted;
};
} // namespace dgate
