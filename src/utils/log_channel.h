/** LICENSE TEMPLATE */
#pragma once

#include <common/macros.h>

#define FOR_EACH_LOG(LOGCHANNEL)                                                                                   \
  LOGCHANNEL(core, "Gateway Core", "Messages that don't have a intuitive log channel can be logged here.")         \
  LOGCHANNEL(dap, "Debug Adapter Protocol", "Log messages involving the DA protocol should be logged here.")       \
  LOGCHANNEL(session, "Debug Session", "Session phase changes, launch handshakes and shutdown detection.")         \
  LOGCHANNEL(debuggee, "Debuggee", "Log records reported by the debuggee and the layer that manages it.")          \
  LOGCHANNEL(warning, "Warnings", "Unexpected behaviors should be logged to this chanel")

ENUM_TYPE_METADATA(Channel, FOR_EACH_LOG, i8)

#define FOR_EACH_LOG_LEVEL(LEVEL)                                                                                  \
  LEVEL(debug)                                                                                                     \
  LEVEL(info)                                                                                                      \
  LEVEL(warn)                                                                                                      \
  LEVEL(error)

ENUM_TYPE_METADATA(LogLevel, FOR_EACH_LOG_LEVEL, u8)
