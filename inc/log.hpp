#ifndef LOG_H
#define LOG_H

enum class LogLevel : int {
  Error = 0,
  Warn = 1,
  Info = 2,
  Debug = 3
};

void setLogLevel(LogLevel level);

LogLevel getLogLevel();

bool logEnabled(LogLevel level);

// printf-style; goes to the browser console under Emscripten, stderr otherwise
void logMessage(LogLevel level, const char *fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
  __attribute__((format(printf, 2, 3)))
#endif
  ;

#define SUDOCORE_LOG(level, ...)          \
  do {                                    \
    if (logEnabled(level)) {              \
      logMessage((level), __VA_ARGS__);   \
    }                                     \
  } while (0)

#endif // LOG_H
