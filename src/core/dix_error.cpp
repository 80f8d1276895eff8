/**
 * @file dix_error.cpp
 * @brief Result code descriptions and C allocation helpers
 */

#include "dix/core/dix_error.h"
#include "dix/core/dix_types.h"

#include <cstdlib>
#include <cstring>
#include <string>

namespace {

thread_local std::string g_last_error_details;

} // namespace

extern "C" {

const char* dix_error_message(dix_result_t result) {
    switch (result) {
        case DIX_SUCCESS: return "Success";
        case DIX_ERROR_NULL_POINTER: return "Null pointer";
        case DIX_ERROR_INVALID_ARGUMENT: return "Invalid argument";
        case DIX_ERROR_VALIDATION: return "Validation failed";
        case DIX_ERROR_NOT_FOUND: return "Not found";
        case DIX_ERROR_EMBEDDING_UNAVAILABLE: return "Embedding provider unavailable";
        case DIX_ERROR_INDEX_BUILD_FAILED: return "Index build failed";
        case DIX_ERROR_CANCELLED: return "Operation cancelled";
        case DIX_ERROR_INTEGRITY: return "Integrity violation";
        case DIX_ERROR_HALTED: return "Mutations halted after integrity violation";
        case DIX_ERROR_OUT_OF_MEMORY: return "Out of memory";
        case DIX_ERROR_INITIALIZATION_FAILED: return "Initialization failed";
        case DIX_ERROR_NOT_SUPPORTED: return "Not supported";
        case DIX_ERROR_PROCESSING_FAILED: return "Processing failed";
        case DIX_ERROR_STORAGE: return "Storage error";
        default: return "Unknown error";
    }
}

const char* dix_get_last_error_details(void) {
    return g_last_error_details.c_str();
}

void dix_set_last_error_details(const char* details) {
    g_last_error_details = details != nullptr ? details : "";
}

void* dix_alloc(size_t size) {
    return std::malloc(size);
}

void dix_free(void* ptr) {
    std::free(ptr);
}

char* dix_strdup(const char* str) {
    if (str == nullptr) {
        return nullptr;
    }
    size_t length = std::strlen(str);
    char* copy = static_cast<char*>(std::malloc(length + 1));
    if (copy != nullptr) {
        std::memcpy(copy, str, length + 1);
    }
    return copy;
}

} // extern "C"
