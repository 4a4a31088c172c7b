/** LICENSE TEMPLATE */
#include "session_state.h"
#include <common.h>

namespace dgate::session {

void
DebuggeeHandle::Run(std::string threadName, std::function<void(std::stop_token &)> computation) noexcept
{
  VERIFY(mThread == nullptr, "Debuggee computation already running");
  mThread = WorkerThread::SpawnWorkerThread(std::move(threadName), std::move(computation));
}

bool
DebuggeeHandle::Cancel() noexcept
{
  if (mCancelled.exchange(true)) {
    return false;
  }
  if (mThread) {
    mThread->RequestStop();
  }
  return true;
}

bool
DebuggeeHandle::IsCancelled() const noexcept
{
  return mCancelled.load();
}

void
DebuggeeHandle::Join() noexcept
{
  if (mThread) {
    mThread->Join();
  }
}
} // namespace dgate::session
