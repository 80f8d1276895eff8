/**
 * @file dix_error.h
 * @brief DocIndex - Result codes
 *
 * Every C API function returns a dix_result_t. Negative values are errors.
 */

#ifndef DIX_ERROR_H
#define DIX_ERROR_H

#include "dix/core/dix_types.h"

#ifdef __cplusplus
extern "C" {
#endif

#define DIX_SUCCESS                        0

// Caller errors
#define DIX_ERROR_NULL_POINTER            -1
#define DIX_ERROR_INVALID_ARGUMENT        -2
#define DIX_ERROR_VALIDATION              -3
#define DIX_ERROR_NOT_FOUND               -4

// Collaborator and build errors (recoverable, retried by the caller)
#define DIX_ERROR_EMBEDDING_UNAVAILABLE  -10
#define DIX_ERROR_INDEX_BUILD_FAILED     -11
#define DIX_ERROR_CANCELLED              -12

// Structural errors (not retried)
#define DIX_ERROR_INTEGRITY              -20
#define DIX_ERROR_HALTED                 -21

// Runtime errors
#define DIX_ERROR_OUT_OF_MEMORY          -30
#define DIX_ERROR_INITIALIZATION_FAILED  -31
#define DIX_ERROR_NOT_SUPPORTED          -32
#define DIX_ERROR_PROCESSING_FAILED      -33
#define DIX_ERROR_STORAGE                -34

/**
 * @brief Static description for a result code
 */
DIX_API const char* dix_error_message(dix_result_t result);

/**
 * @brief Detail text of the last error raised on the calling thread
 *
 * @return Message, or an empty string if none was recorded
 */
DIX_API const char* dix_get_last_error_details(void);

DIX_API void dix_set_last_error_details(const char* details);

#ifdef __cplusplus
}
#endif

#endif // DIX_ERROR_H
