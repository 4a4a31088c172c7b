/** LICENSE TEMPLATE */
#pragma once
// dgate
#include <common/formatter.h>
#include <common/typedefs.h>

// stdlib
#include <array>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

#if defined(__clang__)
#define DGATE_UNREACHABLE std::unreachable();
#elif defined(__GNUC__) || defined(__GNUG__)
#define DGATE_UNREACHABLE __builtin_unreachable();
#endif

#ifndef NO_COPY
/// Types that use NO_COPY in this codebase tend to be created and used via pointers, both raw and smart alike.
#define NO_COPY(CLASS)                                                                                             \
  CLASS(const CLASS &) = delete;                                                                                   \
  CLASS(CLASS &) = delete;                                                                                         \
  CLASS &operator=(CLASS &) = delete;                                                                              \
  CLASS &operator=(const CLASS &) = delete;
#endif

#ifndef MOVE_ONLY
#define MOVE_ONLY(CLASS)                                                                                           \
  CLASS(const CLASS &) = delete;                                                                                   \
  CLASS(CLASS &) = delete;                                                                                         \
  CLASS &operator=(CLASS &) = delete;                                                                              \
  CLASS &operator=(const CLASS &) = delete;
#endif

#define DEFAULT_ENUM(Value, ...) Value,

#define STRINGIFY_VAL(x, ...) #x,

template <typename T> struct Enum
{
  static constexpr u32 Count() noexcept;
};

#define ENUM_FMT(ENUM_TYPE)                                                                                        \
  template <> struct fmt::formatter<ENUM_TYPE> : public Default<ENUM_TYPE>                                         \
  {                                                                                                                \
    template <typename FormatContext>                                                                              \
    auto                                                                                                           \
    format(const ENUM_TYPE &value, FormatContext &ctx) const                                                       \
    {                                                                                                              \
      return fmt::format_to(ctx.out(), "{}", Enum<ENUM_TYPE>::ToString(value));                                    \
    }                                                                                                              \
  }

// Declares `enum class ENUM_TYPE` from an X-macro list and generates an `Enum<ENUM_TYPE>` specialization with
// count, name lookups and variant enumeration, plus a fmt formatter. Must be used at global scope.
#define ENUM_TYPE_METADATA(ENUM_TYPE, FOR_EACH, UNDERLYING_TYPE)                                                   \
  enum class ENUM_TYPE : UNDERLYING_TYPE                                                                           \
  {                                                                                                                \
    FOR_EACH(DEFAULT_ENUM)                                                                                         \
  };                                                                                                               \
  namespace detail::ENUM_TYPE##Metadata {                                                                          \
  using enum ENUM_TYPE;                                                                                            \
  static constexpr auto Ids = std::to_array<ENUM_TYPE>({ FOR_EACH(DEFAULT_ENUM) });                                \
  static constexpr auto Names = std::to_array<std::string_view>({ FOR_EACH(STRINGIFY_VAL) });                      \
  }                                                                                                                \
  template <> struct Enum<ENUM_TYPE>                                                                               \
  {                                                                                                                \
    static constexpr u32                                                                                           \
    Count() noexcept                                                                                               \
    {                                                                                                              \
      return detail::ENUM_TYPE##Metadata::Ids.size();                                                              \
    }                                                                                                              \
                                                                                                                   \
    static constexpr std::span<const ENUM_TYPE>                                                                    \
    Variants() noexcept                                                                                            \
    {                                                                                                              \
      return std::span{ detail::ENUM_TYPE##Metadata::Ids };                                                        \
    }                                                                                                              \
                                                                                                                   \
    static constexpr std::string_view                                                                              \
    ToString(ENUM_TYPE value) noexcept                                                                             \
    {                                                                                                              \
      return detail::ENUM_TYPE##Metadata::Names[std::to_underlying(value)];                                        \
    }                                                                                                              \
                                                                                                                   \
    static constexpr std::optional<ENUM_TYPE>                                                                      \
    FromString(std::string_view str) noexcept                                                                      \
    {                                                                                                              \
      auto index = 0u;                                                                                             \
      for (const auto &n : detail::ENUM_TYPE##Metadata::Names) {                                                   \
        if (n == str) {                                                                                            \
          return detail::ENUM_TYPE##Metadata::Ids[index];                                                          \
        }                                                                                                          \
        ++index;                                                                                                   \
      }                                                                                                            \
      return {};                                                                                                   \
    }                                                                                                              \
  };                                                                                                               \
  ENUM_FMT(ENUM_TYPE);
