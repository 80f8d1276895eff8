/**
 * @file cancellation.h
 * @brief Cooperative cancellation flag shared between a caller and a build
 */

#ifndef DOCINDEX_CANCELLATION_H
#define DOCINDEX_CANCELLATION_H

#include <atomic>
#include <memory>
#include <string>

#include "rag_errors.h"

namespace docindex {
namespace rag {

class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true, std::memory_order_release); }

    bool is_cancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

    void throw_if_cancelled(const char* stage) const {
        if (is_cancelled()) {
            throw OperationCancelled(std::string("cancelled during ") + stage);
        }
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace rag
} // namespace docindex

#endif // DOCINDEX_CANCELLATION_H
