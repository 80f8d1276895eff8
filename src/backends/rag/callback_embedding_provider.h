/**
 * @file callback_embedding_provider.h
 * @brief Embedding provider backed by a host C function
 */

#ifndef DOCINDEX_CALLBACK_EMBEDDING_PROVIDER_H
#define DOCINDEX_CALLBACK_EMBEDDING_PROVIDER_H

#include <string>

#include "dix/features/rag/dix_rag_index.h"
#include "inference_provider.h"

namespace docindex {
namespace rag {

/**
 * @brief Forwards embed() to a dix_embed_fn
 *
 * Thread-safety is that of the host function.
 */
class CallbackEmbeddingProvider final : public IEmbeddingProvider {
public:
    /**
     * @throws ValidationError if fn is null or dimension is 0
     */
    CallbackEmbeddingProvider(dix_embed_fn fn, void* user_data, size_t dimension,
                              std::string model_name = "callback");

    std::vector<float> embed(const std::string& text) override;
    size_t dimension() const noexcept override { return dimension_; }
    bool is_ready() const noexcept override { return fn_ != nullptr; }
    const char* name() const noexcept override { return model_name_.c_str(); }

private:
    dix_embed_fn fn_;
    void* user_data_;
    size_t dimension_;
    std::string model_name_;
};

} // namespace rag
} // namespace docindex

#endif // DOCINDEX_CALLBACK_EMBEDDING_PROVIDER_H
