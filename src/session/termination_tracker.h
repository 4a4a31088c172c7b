/** LICENSE TEMPLATE */
#pragma once
// stdlib
#include <initializer_list>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace dgate::session {

/// The terminal events a conversation still has to go through before it is over. Names are only ever removed.
class TerminationTracker
{
  mutable std::mutex mMutex;
  std::set<std::string, std::less<>> mExpected;

public:
  /// Expects "terminated" and "exited".
  TerminationTracker() noexcept;
  TerminationTracker(std::initializer_list<std::string_view> expected) noexcept;

  /// Marks `eventName` as observed. Returns true when no terminal events remain after this call; removal and the
  /// emptiness check happen under one lock.
  bool Remove(std::string_view eventName) noexcept;
  bool IsEmpty() const noexcept;
  std::vector<std::string> Pending() const noexcept;
};
} // namespace dgate::session
