/** LICENSE TEMPLATE */
#include "thread_pool.h"
#include <algorithm>
#include <common.h>
#include <utils/logger.h>

namespace dgate {

void
ThreadPool::PostTask(Task *task) noexcept
{
  std::lock_guard lock(mTaskMutex);
  mTaskQueue.push(task);
  mTaskConditionVariable.notify_one();
}

void
ThreadPool::PostTasks(std::span<Task *> tasks) noexcept
{
  std::lock_guard lock(mTaskMutex);
  for (auto t : tasks) {
    mTaskQueue.push(t);
  }
  mTaskConditionVariable.notify_all();
}

void
ThreadPool::Post(std::string name, std::function<void()> fn) noexcept
{
  PostTask(new FunctionTask{ std::move(name), std::move(fn) });
}

ThreadPool::ThreadPool() noexcept : mThreadPool(), mTaskQueue(), mTaskMutex(), mTaskConditionVariable() {}

ThreadPool::~ThreadPool() noexcept
{
  auto tasks = ShutdownTasks();
  for (auto &t : mThreadPool) {
    t->RequestStop();
  }
  PostTasks(tasks);

  for (auto &t : mThreadPool) {
    t->Join();
  }

  // Workers may have left before reaching the back of the queue. Deleting the tasks releases what they captured.
  std::lock_guard lock(mTaskMutex);
  while (!mTaskQueue.empty()) {
    delete mTaskQueue.front();
    mTaskQueue.pop();
  }
}

void
ThreadPool::Init(u32 poolSize) noexcept
{
  VERIFY(poolSize > 0, "Thread pool needs at least one worker");
  mThreadPool.reserve(poolSize);
  for (auto i = 0u; i < poolSize; ++i) {
    mThreadPool.emplace_back(WorkerThread::SpawnWorkerThread(fmt::format("PoolWorker-{}", i),
                                                             [this](std::stop_token &token) { WorkerLoop(token); }));
  }
  DBGLOG(core, "thread pool started with {} workers", poolSize);
}

u32
ThreadPool::WorkerCount() const noexcept
{
  return static_cast<u32>(mThreadPool.size());
}

/* static */
u32
ThreadPool::DefaultPoolSize() noexcept
{
  const auto hw = static_cast<i64>(std::thread::hardware_concurrency());
  return static_cast<u32>(std::max<i64>(hw - 2, 2));
}

std::vector<Task *>
ThreadPool::ShutdownTasks() noexcept
{
  std::vector<Task *> res;
  const auto sz = WorkerCount();
  res.reserve(sz);
  for (auto i = 0u; i < sz; ++i) {
    res.push_back(new NoOp{});
  }
  return res;
}

void
ThreadPool::WorkerLoop(std::stop_token &stopToken) noexcept
{
  while (!stopToken.stop_requested()) {
    Task *job = nullptr;
    {
      std::unique_lock lock(mTaskMutex);
      mTaskConditionVariable.wait(lock, [this]() { return !mTaskQueue.empty(); });
      job = mTaskQueue.front();
      mTaskQueue.pop();
    }
    DGATE_ASSERT(job != nullptr, "Failed to retrieve work from task queue");
    job->Execute();
    delete job;
  }
}
} // namespace dgate
