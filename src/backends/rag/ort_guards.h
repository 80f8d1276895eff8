/**
 * @file ort_guards.h
 * @brief RAII ownership of ONNX Runtime C API handles
 */

#ifndef DOCINDEX_ORT_GUARDS_H
#define DOCINDEX_ORT_GUARDS_H

#include <onnxruntime_c_api.h>

namespace docindex {
namespace rag {

template <typename T>
struct OrtReleaser;

template <>
struct OrtReleaser<OrtEnv> {
    static void release(const OrtApi* api, OrtEnv* handle) { api->ReleaseEnv(handle); }
};

template <>
struct OrtReleaser<OrtSession> {
    static void release(const OrtApi* api, OrtSession* handle) { api->ReleaseSession(handle); }
};

template <>
struct OrtReleaser<OrtSessionOptions> {
    static void release(const OrtApi* api, OrtSessionOptions* handle) {
        api->ReleaseSessionOptions(handle);
    }
};

template <>
struct OrtReleaser<OrtMemoryInfo> {
    static void release(const OrtApi* api, OrtMemoryInfo* handle) {
        api->ReleaseMemoryInfo(handle);
    }
};

template <>
struct OrtReleaser<OrtValue> {
    static void release(const OrtApi* api, OrtValue* handle) { api->ReleaseValue(handle); }
};

template <>
struct OrtReleaser<OrtTensorTypeAndShapeInfo> {
    static void release(const OrtApi* api, OrtTensorTypeAndShapeInfo* handle) {
        api->ReleaseTensorTypeAndShapeInfo(handle);
    }
};

/**
 * @brief Owns one ORT handle and releases it on scope exit
 *
 * Pass ptr() as the out-parameter of the ORT call that creates the handle.
 */
template <typename T>
class OrtGuard {
public:
    explicit OrtGuard(const OrtApi* api) : api_(api) {}

    ~OrtGuard() { reset(); }

    OrtGuard(const OrtGuard&) = delete;
    OrtGuard& operator=(const OrtGuard&) = delete;

    OrtGuard(OrtGuard&& other) noexcept : api_(other.api_), handle_(other.handle_) {
        other.handle_ = nullptr;
    }

    OrtGuard& operator=(OrtGuard&& other) noexcept {
        if (this != &other) {
            reset();
            api_ = other.api_;
            handle_ = other.handle_;
            other.handle_ = nullptr;
        }
        return *this;
    }

    T** ptr() {
        reset();
        return &handle_;
    }

    T* get() const { return handle_; }

    explicit operator bool() const { return handle_ != nullptr; }

    void reset() {
        if (handle_ != nullptr && api_ != nullptr) {
            OrtReleaser<T>::release(api_, handle_);
        }
        handle_ = nullptr;
    }

private:
    const OrtApi* api_;
    T* handle_ = nullptr;
};

using OrtEnvGuard = OrtGuard<OrtEnv>;
using OrtSessionGuard = OrtGuard<OrtSession>;
using OrtSessionOptionsGuard = OrtGuard<OrtSessionOptions>;
using OrtMemoryInfoGuard = OrtGuard<OrtMemoryInfo>;
using OrtValueGuard = OrtGuard<OrtValue>;
using OrtTensorInfoGuard = OrtGuard<OrtTensorTypeAndShapeInfo>;

/**
 * @brief Owns the OrtStatus returned by an ORT call
 *
 * Use for sequential calls: status.reset(api->Function(...))
 */
class OrtStatusGuard {
public:
    explicit OrtStatusGuard(const OrtApi* api) : api_(api) {}

    ~OrtStatusGuard() { reset(); }

    OrtStatusGuard(const OrtStatusGuard&) = delete;
    OrtStatusGuard& operator=(const OrtStatusGuard&) = delete;

    bool is_error() const { return status_ != nullptr; }

    const char* error_message() const {
        return (status_ != nullptr && api_ != nullptr) ? api_->GetErrorMessage(status_)
                                                       : "Unknown error";
    }

    void reset(OrtStatus* new_status = nullptr) {
        if (status_ != nullptr && api_ != nullptr) {
            api_->ReleaseStatus(status_);
        }
        status_ = new_status;
    }

private:
    const OrtApi* api_;
    OrtStatus* status_ = nullptr;
};

} // namespace rag
} // namespace docindex

#endif // DOCINDEX_ORT_GUARDS_H
