/**
 * @file dix_logger.cpp
 * @brief Logging implementation
 */

#include "dix/core/dix_logger.h"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace {

struct LoggerState {
    std::mutex mutex;
    dix_log_callback_fn callback = nullptr;
    void* user_data = nullptr;
};

LoggerState& logger_state() {
    static LoggerState state;
    return state;
}

std::atomic<int> g_min_level{DIX_LOG_LEVEL_INFO};

const char* level_name(dix_log_level_t level) {
    switch (level) {
        case DIX_LOG_LEVEL_TRACE: return "TRACE";
        case DIX_LOG_LEVEL_DEBUG: return "DEBUG";
        case DIX_LOG_LEVEL_INFO: return "INFO";
        case DIX_LOG_LEVEL_WARNING: return "WARN";
        case DIX_LOG_LEVEL_ERROR: return "ERROR";
        case DIX_LOG_LEVEL_FATAL: return "FATAL";
    }
    return "?";
}

void write_stderr(dix_log_level_t level, const char* tag, const char* message) {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local_tm{};
    localtime_r(&seconds, &local_tm);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local_tm);
    std::fprintf(stderr, "%s.%03d [%s] %s: %s\n",
                 stamp, static_cast<int>(millis), level_name(level),
                 tag != nullptr ? tag : "-", message);
}

} // namespace

extern "C" {

void dix_logger_set_callback(dix_log_callback_fn callback, void* user_data) {
    auto& state = logger_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.callback = callback;
    state.user_data = user_data;
}

void dix_logger_set_min_level(dix_log_level_t level) {
    g_min_level.store(level, std::memory_order_relaxed);
}

dix_log_level_t dix_logger_get_min_level(void) {
    return static_cast<dix_log_level_t>(g_min_level.load(std::memory_order_relaxed));
}

void dix_log(dix_log_level_t level, const char* tag, const char* format, ...) {
    if (static_cast<int>(level) < g_min_level.load(std::memory_order_relaxed)) {
        return;
    }

    char buffer[1024];
    va_list args;
    va_start(args, format);
    std::vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    auto& state = logger_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.callback != nullptr) {
        state.callback(level, tag, buffer, state.user_data);
        return;
    }
    write_stderr(level, tag, buffer);
}

} // extern "C"
