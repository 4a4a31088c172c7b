/** LICENSE TEMPLATE */
#pragma once
// dgate
#include <common/typedefs.h>
#include <utils/worker_task.h>
#include <utils/worker_thread.h>

// stdlib
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <span>
#include <string>
#include <vector>

namespace dgate {

class ThreadPool
{
public:
  ThreadPool() noexcept;
  ~ThreadPool() noexcept;
  NO_COPY(ThreadPool);

  void Init(u32 poolSize) noexcept;
  u32 WorkerCount() const noexcept;
  /// Takes ownership of `task`.
  void PostTask(Task *task) noexcept;
  void PostTasks(std::span<Task *> tasks) noexcept;
  void Post(std::string name, std::function<void()> fn) noexcept;
  void WorkerLoop(std::stop_token &stopToken) noexcept;

  /// Default worker count for a pool: hardware concurrency minus two, but never fewer than 2.
  static u32 DefaultPoolSize() noexcept;

private:
  std::vector<Task *> ShutdownTasks() noexcept;

  std::vector<WorkerThread::OwnedPtr> mThreadPool;
  std::queue<Task *> mTaskQueue;
  std::mutex mTaskMutex;
  std::condition_variable mTaskConditionVariable;
};
} // namespace dgate
