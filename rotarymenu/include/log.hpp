#pragma once

#ifndef ROTARYMENU_USE_LOG
#define ROTARYMENU_USE_LOG 1
#endif

#if ROTARYMENU_USE_LOG
// appends to the file, creating it if needed.
bool log_file_init(const char* path);
// mirrors every message to stderr.
bool log_stderr_init();
void log_file_exit();
void log_stderr_exit();
bool log_is_init();

void log_write(const char* s, ...) __attribute__ ((format (printf, 1, 2)));
#else
inline bool log_file_init(const char*) { return true; }
inline bool log_stderr_init() { return true; }
inline void log_file_exit() {}
inline void log_stderr_exit() {}
inline bool log_is_init() { return false; }
#define log_write(...)
#endif
