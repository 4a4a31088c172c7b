/** LICENSE TEMPLATE */
#pragma once
// dgate
#include <common/macros.h>
#include <common/panic.h>
#include <common/typedefs.h>

// stdlib
#include <filesystem>
#include <optional>
#include <source_location>
#include <string_view>

// fmt
#include <fmt/core.h>

namespace fs = std::filesystem;
using Path = fs::path;

template <typename T> using Option = std::optional<T>;

// clang-format off
// Checked in every build type. Failing means we have a bug that we can not recover from.
#define VERIFY(cond, msg, ...) if (!(cond)) [[unlikely]] { std::source_location loc = std::source_location::current(); \
    dgate::panic(fmt::format("{} FAILED {}", #cond, fmt::format(msg __VA_OPT__(, ) __VA_ARGS__)), loc, 1);        \
  }
// clang-format on

#if defined(DGATE_DEBUG) and DGATE_DEBUG == 1
#define DGATE_ASSERT(cond, msg, ...) VERIFY(cond, msg __VA_OPT__(, ) __VA_ARGS__)
#else
#define DGATE_ASSERT(cond, msg, ...)
#endif
