/** LICENSE TEMPLATE */
#include "argslist.h"
#include <common.h>

namespace dgate {

PosixArgsList::PosixArgsList(std::vector<std::string> &&args) noexcept : mArgs(std::move(args))
{
  VERIFY(!mArgs.empty(), "A command needs at least a program");
  mCStringArgs.reserve(mArgs.size() + 1);
  for (const auto &str : mArgs) {
    mCStringArgs.push_back(str.c_str());
  }
  mCStringArgs.push_back(nullptr);
}

const char *
PosixArgsList::Program() const noexcept
{
  return mCStringArgs.front();
}

char *const *
PosixArgsList::Argv() const noexcept
{
  return const_cast<char *const *>(mCStringArgs.data());
}

const char *
PosixArgsList::GetArg(std::size_t index) const noexcept
{
  return mCStringArgs[index];
}

std::size_t
PosixArgsList::Count() const noexcept
{
  return mArgs.size();
}
} // namespace dgate
