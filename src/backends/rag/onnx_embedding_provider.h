/**
 * @file onnx_embedding_provider.h
 * @brief ONNX-based embedding provider implementation
 */

#ifndef DOCINDEX_ONNX_EMBEDDING_PROVIDER_H
#define DOCINDEX_ONNX_EMBEDDING_PROVIDER_H

#include <memory>

#include "inference_provider.h"

namespace docindex {
namespace rag {

/**
 * @brief Sentence-embedding model (all-MiniLM style) run with ONNX Runtime
 *
 * WordPiece tokenization from vocab.txt, mean pooling over the attention
 * mask, L2 normalisation. Thread-safe after construction.
 *
 * Configuration JSON keys: "vocab_path" (default: vocab.txt next to the
 * model), "dimension" (384), "max_seq_length" (256), "intra_op_threads" (4).
 */
class ONNXEmbeddingProvider final : public IEmbeddingProvider {
public:
    /**
     * @throws EmbeddingUnavailable if the runtime, vocabulary or model
     *         cannot be loaded
     */
    explicit ONNXEmbeddingProvider(
        const std::string& model_path,
        const std::string& config_json = ""
    );

    ~ONNXEmbeddingProvider() override;

    ONNXEmbeddingProvider(const ONNXEmbeddingProvider&) = delete;
    ONNXEmbeddingProvider& operator=(const ONNXEmbeddingProvider&) = delete;

    std::vector<float> embed(const std::string& text) override;
    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override;
    size_t dimension() const noexcept override;
    bool is_ready() const noexcept override;
    const char* name() const noexcept override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rag
} // namespace docindex

#endif // DOCINDEX_ONNX_EMBEDDING_PROVIDER_H
