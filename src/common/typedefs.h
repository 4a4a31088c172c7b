/** LICENSE TEMPLATE */
#pragma once

// stdlib
#include <cstddef>
#include <cstdint>
#include <type_traits>

// system
#include <sys/types.h>

using u64 = std::uint64_t;
using u32 = std::uint32_t;
using u16 = std::uint16_t;
using u8 = std::uint8_t;

using i64 = std::int64_t;
using i32 = std::int32_t;
using i16 = std::int16_t;
using i8 = std::int8_t;

using Pid = pid_t;

// "remove_cvref_t" is a mouthful. `ActualType<T>` signals the intent.
template <typename T> using ActualType = std::remove_cvref_t<T>;

template <class... T> constexpr bool always_false = false;
