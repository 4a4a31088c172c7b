/** LICENSE TEMPLATE */
#pragma once
#include <common/macros.h>
#include <mutex>
#include <type_traits>
#include <utility>

namespace dgate::utils {

/// Owns a value that is only ever read or replaced while holding its mutex.
template <typename T, typename Mutex = std::mutex> class Synchronized
{
public:
  explicit Synchronized(T t) noexcept : mValue(std::move(t)), mMutex() {}
  NO_COPY(Synchronized);

  /// Replaces the value with `fn(old value)` atomically and returns a copy of the new value. `fn` runs with the lock
  /// held, so any side effect it performs is serialized with every other Transform.
  template <typename Fn>
  T
  Transform(Fn &&fn)
  {
    std::lock_guard lock{ mMutex };
    mValue = std::forward<Fn>(fn)(std::move(mValue));
    return mValue;
  }

  T
  Get() const
  {
    std::lock_guard lock{ mMutex };
    return mValue;
  }

  /// Runs `fn` with a const reference to the value, under the lock.
  template <typename Fn>
  auto
  Read(Fn &&fn) const
  {
    std::lock_guard lock{ mMutex };
    return std::forward<Fn>(fn)(std::as_const(mValue));
  }

private:
  T mValue;
  mutable Mutex mMutex;
};
} // namespace dgate::utils
