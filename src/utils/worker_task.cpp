/** LICENSE TEMPLATE */
#include "worker_task.h"
#include <common.h>
#include <utils/logger.h>

namespace dgate {
void
Task::Execute() noexcept
{
  ExecuteTask();
}

void
NoOp::ExecuteTask() noexcept
{
}

FunctionTask::FunctionTask(std::string name, std::function<void()> function) noexcept
    : Task(), mName(std::move(name)), mFunction(std::move(function))
{
}

const std::string &
FunctionTask::Name() const noexcept
{
  return mName;
}

void
FunctionTask::ExecuteTask() noexcept
{
  CDLOG(true, core, "running task {}", mName);
  mFunction();
}
} // namespace dgate
