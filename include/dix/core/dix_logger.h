/**
 * @file dix_logger.h
 * @brief DocIndex - Logging
 *
 * printf-style logging with a tag per component. Messages go to stderr
 * unless the host installs a callback.
 */

#ifndef DIX_LOGGER_H
#define DIX_LOGGER_H

#include "dix/core/dix_types.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef enum dix_log_level {
    DIX_LOG_LEVEL_TRACE = 0,
    DIX_LOG_LEVEL_DEBUG = 1,
    DIX_LOG_LEVEL_INFO = 2,
    DIX_LOG_LEVEL_WARNING = 3,
    DIX_LOG_LEVEL_ERROR = 4,
    DIX_LOG_LEVEL_FATAL = 5
} dix_log_level_t;

/**
 * @brief Log sink installed by the host
 *
 * @param level Message level
 * @param tag Component tag (e.g. "RAG.IndexManager")
 * @param message Formatted message, without trailing newline
 * @param user_data Pointer passed to dix_logger_set_callback
 */
typedef void (*dix_log_callback_fn)(dix_log_level_t level,
                                    const char* tag,
                                    const char* message,
                                    void* user_data);

/**
 * @brief Install a log sink; NULL restores the stderr sink
 */
DIX_API void dix_logger_set_callback(dix_log_callback_fn callback, void* user_data);

/**
 * @brief Drop messages below the given level (default INFO)
 */
DIX_API void dix_logger_set_min_level(dix_log_level_t level);

DIX_API dix_log_level_t dix_logger_get_min_level(void);

DIX_API void dix_log(dix_log_level_t level, const char* tag, const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

#ifdef __cplusplus
}
#endif

#define DIX_LOG_TRACE(tag, ...) dix_log(DIX_LOG_LEVEL_TRACE, tag, __VA_ARGS__)
#define DIX_LOG_DEBUG(tag, ...) dix_log(DIX_LOG_LEVEL_DEBUG, tag, __VA_ARGS__)
#define DIX_LOG_INFO(tag, ...) dix_log(DIX_LOG_LEVEL_INFO, tag, __VA_ARGS__)
#define DIX_LOG_WARNING(tag, ...) dix_log(DIX_LOG_LEVEL_WARNING, tag, __VA_ARGS__)
#define DIX_LOG_WARN(tag, ...) DIX_LOG_WARNING(tag, __VA_ARGS__)
#define DIX_LOG_ERROR(tag, ...) dix_log(DIX_LOG_LEVEL_ERROR, tag, __VA_ARGS__)
#define DIX_LOG_FATAL(tag, ...) dix_log(DIX_LOG_LEVEL_FATAL, tag, __VA_ARGS__)

#endif // DIX_LOGGER_H
