/** LICENSE TEMPLATE */
#include "termination_tracker.h"
#include <interface/dap/messages.h>

namespace dgate::session {

TerminationTracker::TerminationTracker() noexcept : TerminationTracker({ dap::event::Terminated, dap::event::Exited })
{
}

TerminationTracker::TerminationTracker(std::initializer_list<std::string_view> expected) noexcept
{
  for (auto name : expected) {
    mExpected.emplace(name);
  }
}

bool
TerminationTracker::Remove(std::string_view eventName) noexcept
{
  std::lock_guard lock{ mMutex };
  if (auto it = mExpected.find(eventName); it != std::end(mExpected)) {
    mExpected.erase(it);
  }
  return mExpected.empty();
}

bool
TerminationTracker::IsEmpty() const noexcept
{
  std::lock_guard lock{ mMutex };
  return mExpected.empty();
}

std::vector<std::string>
TerminationTracker::Pending() const noexcept
{
  std::lock_guard lock{ mMutex };
  return std::vector<std::string>{ mExpected.begin(), mExpected.end() };
}
} // namespace dgate::session
