/** LICENSE TEMPLATE */
#pragma once
#include <functional>
#include <string>

namespace dgate {

class Task
{
public:
  Task() noexcept = default;
  virtual ~Task() noexcept = default;
  void Execute() noexcept;

protected:
  virtual void ExecuteTask() noexcept = 0;
};

class NoOp final : public Task
{
public:
  NoOp() noexcept : Task() {}
  ~NoOp() noexcept override = default;

protected:
  void ExecuteTask() noexcept final;
};

/// Runs a callable on a pool worker. Whatever the callable captures is released when the task is deleted, after it
/// has executed.
class FunctionTask final : public Task
{
  std::string mName;
  std::function<void()> mFunction;

public:
  FunctionTask(std::string name, std::function<void()> function) noexcept;
  ~FunctionTask() noexcept override = default;
  const std::string &Name() const noexcept;

protected:
  void ExecuteTask() noexcept final;
};

using JobPtr = Task *;
} // namespace dgate
