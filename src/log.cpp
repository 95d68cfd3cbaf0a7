#include "log.hpp"

#include <cstdarg>
#include <cstdio>

#ifdef __EMSCRIPTEN__
  // WASM
  #include <emscripten/emscripten.h>
#endif

// =========================================================
// Logging
// =========================================================

static LogLevel g_logLevel = LogLevel::Warn;

static const char *levelName(LogLevel level) {
  switch (level) {
    case LogLevel::Error:
      return "error";
    case LogLevel::Warn:
      return "warn";
    case LogLevel::Info:
      return "info";
    case LogLevel::Debug:
      return "debug";
  }
  return "?";
}

void setLogLevel(LogLevel level) {
  g_logLevel = level;
}

LogLevel getLogLevel() {
  return g_logLevel;
}

bool logEnabled(LogLevel level) {
  return static_cast<int>(level) <= static_cast<int>(g_logLevel);
}

void logMessage(LogLevel level, const char *fmt, ...) {
  char buf[512];
  va_list args;
  va_start(args, fmt);
  std::vsnprintf(buf, sizeof(buf), fmt, args);
  va_end(args);

#ifdef __EMSCRIPTEN__
  int flags = EM_LOG_CONSOLE;
  if (level == LogLevel::Error) {
    flags |= EM_LOG_ERROR;
  } else if (level == LogLevel::Warn) {
    flags |= EM_LOG_WARN;
  }
  emscripten_log(flags, "[sudocore] %s: %s", levelName(level), buf);
#else
  std::fprintf(stderr, "[sudocore] %s: %s\n", levelName(level), buf);
#endif
}
