#include "log.hpp"

#if ROTARYMENU_USE_LOG

#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace {

constexpr const char* LOG_HEADER = "[ROTARYMENU] log started\n";

std::mutex mutex{};
std::FILE* file{};
bool stderr_enabled{};

void log_write_arg_internal(const char* s, va_list* v) {
    if (file) {
        va_list copy;
        va_copy(copy, *v);
        std::vfprintf(file, s, copy);
        va_end(copy);
        std::fflush(file);
    }

    if (stderr_enabled) {
        va_list copy;
        va_copy(copy, *v);
        std::vfprintf(stderr, s, copy);
        va_end(copy);
    }
}

} // namespace

bool log_file_init(const char* path) {
    std::scoped_lock lock{mutex};
    if (file) {
        return true;
    }

    file = std::fopen(path, "a");
    if (!file) {
        return false;
    }

    const auto t = std::time(nullptr);
    char buf[64];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", std::localtime(&t))) {
        std::fprintf(file, "%s", buf);
        std::fputc(' ', file);
    }
    std::fputs(LOG_HEADER, file);
    std::fflush(file);
    return true;
}

bool log_stderr_init() {
    std::scoped_lock lock{mutex};
    stderr_enabled = true;
    return true;
}

void log_file_exit() {
    std::scoped_lock lock{mutex};
    if (file) {
        std::fclose(file);
        file = nullptr;
    }
}

void log_stderr_exit() {
    std::scoped_lock lock{mutex};
    stderr_enabled = false;
}

bool log_is_init() {
    std::scoped_lock lock{mutex};
    return file || stderr_enabled;
}

void log_write(const char* s, ...) {
    std::scoped_lock lock{mutex};
    if (!file && !stderr_enabled) {
        return;
    }

    va_list v{};
    va_start(v, s);
    log_write_arg_internal(s, &v);
    va_end(v);
}

#endif
