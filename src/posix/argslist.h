/** LICENSE TEMPLATE */
#pragma once
#include <string>
#include <vector>

namespace dgate {

/**
 * A command line in the shape execv and friends want it: a nullptr terminated array of C strings whose first entry
 * is the program.
 */
class PosixArgsList
{
public:
  explicit PosixArgsList(std::vector<std::string> &&args) noexcept;

  const char *Program() const noexcept;
  char *const *Argv() const noexcept;
  const char *GetArg(std::size_t index) const noexcept;
  std::size_t Count() const noexcept;

private:
  std::vector<std::string> mArgs;
  std::vector<const char *> mCStringArgs;
};
} // namespace dgate
