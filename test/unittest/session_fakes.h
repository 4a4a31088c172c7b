#pragma once
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include <interface/dap/connection.h>
#include <interface/dap/protocol_engine.h>
#include <session/debuggee_logger.h>
#include <session/logger_adapter.h>
#include <session/session_state.h>
#include <utils/logger.h>

using namespace std::chrono_literals;

// A stream that never delivers any bytes. Read blocks until the connection is closed.
class FakeConnection final : public dgate::dap::Connection
{
  mutable std::mutex mMutex;
  std::condition_variable mClosedCondition;
  bool mClosed{ false };
  int mCloseCount{ 0 };
  std::vector<std::string> mWritten;

public:
  std::expected<u64, int>
  Read(std::span<char>) noexcept final
  {
    std::unique_lock lock{ mMutex };
    mClosedCondition.wait(lock, [this]() { return mClosed; });
    return u64{ 0 };
  }

  bool
  Write(std::string_view bytes) noexcept final
  {
    std::lock_guard lock{ mMutex };
    if (mClosed) {
      return false;
    }
    mWritten.emplace_back(bytes);
    return true;
  }

  void
  Close() noexcept final
  {
    {
      std::lock_guard lock{ mMutex };
      mClosed = true;
      ++mCloseCount;
    }
    mClosedCondition.notify_all();
  }

  bool
  IsClosed() const noexcept final
  {
    std::lock_guard lock{ mMutex };
    return mClosed;
  }

  int
  CloseCount() const noexcept
  {
    std::lock_guard lock{ mMutex };
    return mCloseCount;
  }

  void
  WaitClosed() noexcept
  {
    std::unique_lock lock{ mMutex };
    mClosedCondition.wait(lock, [this]() { return mClosed; });
  }
};

// Records everything that reaches the bottom of the engine chain.
class FakeEngine final : public dgate::dap::ProtocolEngine
{
  std::shared_ptr<FakeConnection> mConnection;
  mutable std::mutex mMutex;
  std::condition_variable mChanged;
  std::vector<dgate::dap::Request> mDispatched;
  std::vector<dgate::dap::Response> mResponses;
  std::vector<dgate::dap::Event> mEvents;
  dgate::dap::ProtocolEngine *mFront{ nullptr };
  std::function<void(const dgate::dap::Request &)> mDispatchHook{ nullptr };

  template <typename Fn>
  void
  Record(Fn &&fn) noexcept
  {
    {
      std::lock_guard lock{ mMutex };
      fn();
    }
    mChanged.notify_all();
  }

public:
  explicit FakeEngine(std::shared_ptr<FakeConnection> connection) noexcept : mConnection(std::move(connection)) {}

  void
  DispatchRequest(const dgate::dap::Request &request) noexcept final
  {
    std::function<void(const dgate::dap::Request &)> hook;
    {
      std::lock_guard lock{ mMutex };
      hook = mDispatchHook;
    }
    // Runs like the real engine's blocking write would, outside our own lock.
    if (hook) {
      hook(request);
    }
    Record([&]() { mDispatched.push_back(request); });
  }

  void
  SetDispatchHook(std::function<void(const dgate::dap::Request &)> hook) noexcept
  {
    std::lock_guard lock{ mMutex };
    mDispatchHook = std::move(hook);
  }

  void
  SendResponse(dgate::dap::Response response) noexcept final
  {
    Record([&]() { mResponses.push_back(std::move(response)); });
  }

  void
  SendEvent(dgate::dap::Event event) noexcept final
  {
    Record([&]() { mEvents.push_back(std::move(event)); });
  }

  void
  Run() noexcept final
  {
    mConnection->WaitClosed();
  }

  void
  SetFront(dgate::dap::ProtocolEngine *front) noexcept final
  {
    std::lock_guard lock{ mMutex };
    mFront = front;
  }

  dgate::dap::ProtocolEngine *
  Front() const noexcept
  {
    std::lock_guard lock{ mMutex };
    return mFront;
  }

  std::vector<dgate::dap::Request>
  Dispatched() const noexcept
  {
    std::lock_guard lock{ mMutex };
    return mDispatched;
  }

  std::vector<dgate::dap::Response>
  Responses() const noexcept
  {
    std::lock_guard lock{ mMutex };
    return mResponses;
  }

  std::vector<dgate::dap::Event>
  Events() const noexcept
  {
    std::lock_guard lock{ mMutex };
    return mEvents;
  }

  bool
  WaitForDispatched(size_t count, std::chrono::milliseconds timeout) noexcept
  {
    std::unique_lock lock{ mMutex };
    return mChanged.wait_for(lock, timeout, [&]() { return mDispatched.size() >= count; });
  }

  bool
  WaitForResponses(size_t count, std::chrono::milliseconds timeout) noexcept
  {
    std::unique_lock lock{ mMutex };
    return mChanged.wait_for(lock, timeout, [&]() { return mResponses.size() >= count; });
  }

  bool
  WaitForEvents(size_t count, std::chrono::milliseconds timeout) noexcept
  {
    std::unique_lock lock{ mMutex };
    return mChanged.wait_for(lock, timeout, [&]() { return mEvents.size() >= count; });
  }
};

class RecordingLogSink final : public dgate::logging::LogSink
{
  mutable std::mutex mMutex;
  std::vector<std::pair<LogLevel, std::string>> mRecords;

public:
  void
  Log(LogLevel level, std::string_view message) noexcept final
  {
    std::lock_guard lock{ mMutex };
    mRecords.emplace_back(level, std::string{ message });
  }

  std::vector<std::pair<LogLevel, std::string>>
  Records() const noexcept
  {
    std::lock_guard lock{ mMutex };
    return mRecords;
  }

  size_t
  Count(LogLevel level, std::string_view needle) const noexcept
  {
    std::lock_guard lock{ mMutex };
    return static_cast<size_t>(std::ranges::count_if(mRecords, [&](const auto &record) {
      return record.first == level && record.second.find(needle) != std::string::npos;
    }));
  }
};

class RecordingRecordSink final : public dgate::session::RecordSink
{
  mutable std::mutex mMutex;
  std::vector<std::pair<RecordLevel, std::string>> mRecords;

public:
  void
  Publish(RecordLevel level, std::string_view message) noexcept final
  {
    std::lock_guard lock{ mMutex };
    mRecords.emplace_back(level, std::string{ message });
  }

  size_t
  Count(RecordLevel level, std::string_view needle) const noexcept
  {
    std::lock_guard lock{ mMutex };
    return static_cast<size_t>(std::ranges::count_if(mRecords, [&](const auto &record) {
      return record.first == level && record.second.find(needle) != std::string::npos;
    }));
  }
};

// Blocks the debuggee computation until the session cancels it.
inline void
WaitUntilStopped(std::stop_token stop) noexcept
{
  std::mutex mutex;
  std::condition_variable_any condition;
  std::unique_lock lock{ mutex };
  condition.wait(lock, stop, []() { return false; });
}
