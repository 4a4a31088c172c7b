/** LICENSE TEMPLATE */
#include "worker_thread.h"
#include <common.h>
#include <linux/prctl.h>
#include <sys/prctl.h>
#include <utils/logger.h>

namespace dgate {
WorkerThread::WorkerThread(std::string &&name, std::function<void(std::stop_token &)> &&task) noexcept
    : mThreadName(std::move(name)), mWork(std::move(task)), mThread(), mStarted(false)
{
}

WorkerThread::~WorkerThread() noexcept
{
  mThread.request_stop();
  Join();
}

/* static */
WorkerThread::OwnedPtr
WorkerThread::SpawnWorkerThread(std::function<void(std::stop_token &)> task) noexcept
{
  return SpawnWorkerThread(fmt::format("dgate-{}", GetNextWorkerThreadNumber()), std::move(task));
}

/* static */
WorkerThread::OwnedPtr
WorkerThread::SpawnWorkerThread(std::string name, std::function<void(std::stop_token &)> task) noexcept
{
  auto thread = std::unique_ptr<WorkerThread>(new WorkerThread{ std::move(name), std::move(task) });
  thread->Start();
  return thread;
}

void
WorkerThread::Start() noexcept
{
  DGATE_ASSERT(mStarted == false, "Thread already started");
  mStarted = true;
  mThread = std::jthread([this](std::stop_token token) {
    // Linux caps thread names at 15 characters, longer names make prctl fail.
    const auto name = mThreadName.substr(0, 15);
    if (prctl(PR_SET_NAME, name.c_str()) == -1) {
      DBGLOG(warning, "Failed to set name of thread {}", mThreadName);
    }
    // The owner may be destroyed by the work itself (last reference released on this thread), so nothing on
    // `this` may be touched once the work runs.
    auto work = std::move(mWork);
    work(token);
  });
}

void
WorkerThread::Join() noexcept
{
  if (!mThread.joinable()) {
    return;
  }
  if (mThread.get_id() == std::this_thread::get_id()) {
    mThread.detach();
    return;
  }
  mThread.join();
}

bool
WorkerThread::IsJoinable() const noexcept
{
  return mThread.joinable();
}

bool
WorkerThread::RequestStop() noexcept
{
  return mThread.request_stop();
}

bool
WorkerThread::StopRequested() const noexcept
{
  return mThread.get_stop_token().stop_requested();
}

const std::string &
WorkerThread::Name() const noexcept
{
  return mThreadName;
}
} // namespace dgate
