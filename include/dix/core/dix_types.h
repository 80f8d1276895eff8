/**
 * @file dix_types.h
 * @brief DocIndex - Common C types
 */

#ifndef DIX_TYPES_H
#define DIX_TYPES_H

#include <stddef.h>
#include <stdint.h>

#if defined(_WIN32)
#define DIX_API __declspec(dllexport)
#else
#define DIX_API __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

typedef int32_t dix_result_t;

typedef int32_t dix_bool_t;
#define DIX_TRUE 1
#define DIX_FALSE 0

/** Allocate memory that callers release with dix_free() */
DIX_API void* dix_alloc(size_t size);

DIX_API void dix_free(void* ptr);

/** Duplicate a C string with dix_alloc(); returns NULL for NULL input */
DIX_API char* dix_strdup(const char* str);

#ifdef __cplusplus
}
#endif

#endif // DIX_TYPES_H
