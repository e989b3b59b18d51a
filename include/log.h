#pragma once

// =========================================================
// LOGGING CONFIG
// =========================================================
#ifndef LOG_LEVEL
  #define LOG_LEVEL 4
#endif

// Implemented once per target: Serial on the board, stderr on the host.
void logWrite(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

#if LOG_LEVEL >= 1
  #define LOG_ERROR(...)  logWrite("[ERROR] " __VA_ARGS__)
#else
  #define LOG_ERROR(...)
#endif

#if LOG_LEVEL >= 2
  #define LOG_WARN(...)   logWrite("[WARN] " __VA_ARGS__)
#else
  #define LOG_WARN(...)
#endif

#if LOG_LEVEL >= 3
  #define LOG_INFO(...)   logWrite("[INFO] " __VA_ARGS__)
#else
  #define LOG_INFO(...)
#endif

#if LOG_LEVEL >= 4
  #define LOG_DEBUG(...)  logWrite("[DEBUG] " __VA_ARGS__)
#else
  #define LOG_DEBUG(...)
#endif
