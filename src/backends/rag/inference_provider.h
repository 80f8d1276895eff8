/**
 * @file inference_provider.h
 * @brief Abstract interface for the embedding collaborator
 *
 * Strategy pattern interface for embeddings. Allows the index to work with
 * any implementation (ONNX, a host callback, a test double).
 */

#ifndef DOCINDEX_INFERENCE_PROVIDER_H
#define DOCINDEX_INFERENCE_PROVIDER_H

#include <memory>
#include <string>
#include <vector>

namespace docindex {
namespace rag {

// =============================================================================
// EMBEDDING PROVIDER INTERFACE
// =============================================================================

/**
 * @brief Abstract interface for text embedding generation
 * 
 * Implementations should be thread-safe for concurrent embeddings: queries
 * embed on reader threads while a mutation embeds on the writer thread.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    /**
     * @brief Generate embedding vector for text
     * 
     * @param text Input text to embed
     * @return Embedding vector (caller checks size matches expected dimension)
     * @throws EmbeddingUnavailable on inference failure
     */
    virtual std::vector<float> embed(const std::string& text) = 0;

    /**
     * @brief Embed a batch of texts
     *
     * Default implementation embeds one text at a time.
     *
     * @return One vector per input, in input order
     * @throws EmbeddingUnavailable on inference failure
     */
    virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) {
        std::vector<std::vector<float>> out;
        out.reserve(texts.size());
        for (const auto& text : texts) {
            out.push_back(embed(text));
        }
        return out;
    }

    /**
     * @brief Get embedding dimension
     * 
     * @return Vector dimension (e.g., 384 for all-MiniLM-L6-v2)
     */
    virtual size_t dimension() const noexcept = 0;

    /**
     * @brief Check if provider is ready for inference
     */
    virtual bool is_ready() const noexcept = 0;

    /**
     * @brief Get provider name for logging/debugging
     */
    virtual const char* name() const noexcept = 0;
};

// =============================================================================
// FACTORY FUNCTIONS (implemented by concrete providers)
// =============================================================================

/**
 * @brief Create ONNX embedding provider
 * 
 * @param model_path Path to ONNX model file
 * @param config_json Optional configuration JSON
 * @return Unique pointer to embedding provider
 * @throws std::runtime_error if model loading fails
 */
std::unique_ptr<IEmbeddingProvider> create_onnx_embedding_provider(
    const std::string& model_path,
    const std::string& config_json = ""
);

} // namespace rag
} // namespace docindex

#endif // DOCINDEX_INFERENCE_PROVIDER_H
