/** LICENSE TEMPLATE */
#pragma once
#include <common/macros.h>
#include <utility>

namespace dgate {
template <typename DeferFn> class ScopedDefer
{
public:
  NO_COPY(ScopedDefer);
  explicit ScopedDefer(DeferFn &&fn) noexcept : mDeferFn(std::move(fn)) {}
  ~ScopedDefer() noexcept { mDeferFn(); }

private:
  DeferFn mDeferFn;
};
} // namespace dgate
