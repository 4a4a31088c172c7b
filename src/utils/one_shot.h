/** LICENSE TEMPLATE */
#pragma once
// dgate
#include <common/macros.h>

// stdlib
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <variant>

namespace dgate::utils {

/// A value that is settled at most once and can be waited on by any number of threads. Unlike std::promise, a
/// second settle attempt is not an error: it reports that it lost the race and leaves the first value in place.
template <typename T> class OneShot
{
  mutable std::mutex mMutex;
  mutable std::condition_variable mSettled;
  std::optional<T> mValue;

public:
  using ValueType = T;

  OneShot() noexcept = default;
  NO_COPY(OneShot);

  /// Returns true if this call settled the cell.
  bool
  TrySettle(T value) noexcept
  {
    {
      std::lock_guard lock{ mMutex };
      if (mValue.has_value()) {
        return false;
      }
      mValue.emplace(std::move(value));
    }
    mSettled.notify_all();
    return true;
  }

  bool
  IsSettled() const noexcept
  {
    std::lock_guard lock{ mMutex };
    return mValue.has_value();
  }

  std::optional<T>
  Peek() const noexcept
  {
    std::lock_guard lock{ mMutex };
    return mValue;
  }

  T
  Wait() const noexcept
  {
    std::unique_lock lock{ mMutex };
    mSettled.wait(lock, [this]() { return mValue.has_value(); });
    return *mValue;
  }

  /// Returns nullopt if `timeout` elapsed without the cell being settled.
  template <typename Rep, typename Period>
  std::optional<T>
  WaitFor(std::chrono::duration<Rep, Period> timeout) const noexcept
  {
    std::unique_lock lock{ mMutex };
    if (!mSettled.wait_for(lock, timeout, [this]() { return mValue.has_value(); })) {
      return std::nullopt;
    }
    return mValue;
  }
};

/// Settled without a value; used for "this has happened" signals.
using Signal = OneShot<std::monostate>;

} // namespace dgate::utils
