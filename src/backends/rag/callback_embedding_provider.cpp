/**
 * @file callback_embedding_provider.cpp
 * @brief Embedding provider backed by a host C function
 */

#include "callback_embedding_provider.h"

#include <cmath>
#include <utility>

#include "rag_errors.h"

namespace docindex {
namespace rag {

CallbackEmbeddingProvider::CallbackEmbeddingProvider(dix_embed_fn fn, void* user_data,
                                                     size_t dimension, std::string model_name)
    : fn_(fn), user_data_(user_data), dimension_(dimension), model_name_(std::move(model_name)) {
    if (fn_ == nullptr) {
        throw ValidationError("embedding callback is required");
    }
    if (dimension_ == 0) {
        throw ValidationError("embedding dimension must be positive");
    }
}

std::vector<float> CallbackEmbeddingProvider::embed(const std::string& text) {
    std::vector<float> vector(dimension_, 0.0f);
    dix_result_t result = fn_(text.c_str(), vector.data(), dimension_, user_data_);
    if (result != DIX_SUCCESS) {
        throw EmbeddingUnavailable("embedding callback failed: " +
                                   std::string(dix_error_message(result)));
    }
    for (float value : vector) {
        if (!std::isfinite(value)) {
            throw EmbeddingUnavailable("embedding callback returned a non-finite value");
        }
    }
    return vector;
}

} // namespace rag
} // namespace docindex
