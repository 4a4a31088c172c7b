/** LICENSE TEMPLATE */
#pragma once

#include <fmt/core.h>

// Formatters in this code base take no format spec. `{}` is the only supported replacement field.
#define BASIC_PARSE                                                                                                \
  template <typename ParseContext>                                                                                 \
  constexpr auto parse(ParseContext &ctx)                                                                          \
  {                                                                                                                \
    return ctx.begin();                                                                                            \
  }

template <typename T> struct Default
{
  BASIC_PARSE
};
