/**
 * @file embedding_batcher.h
 * @brief Batched, time-limited calls into the embedding provider
 */

#ifndef DOCINDEX_EMBEDDING_BATCHER_H
#define DOCINDEX_EMBEDDING_BATCHER_H

#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "cancellation.h"
#include "inference_provider.h"

namespace docindex {
namespace rag {

struct EmbedOptions {
    size_t dimension = 384;
    size_t batch_size = 32;
    std::chrono::milliseconds timeout{0};   // per batch; 0 waits indefinitely
};

/**
 * @brief Runs every call into one embedding provider on a single owned thread
 *
 * Provider calls never overlap, even when a caller gave up on a call that
 * timed out: until that call returns, new calls fail with
 * EmbeddingUnavailable instead of reaching the provider. The destructor
 * waits for the call in flight, so the provider is not used after the
 * worker is gone.
 */
class EmbeddingWorker {
public:
    /**
     * @throws ValidationError if provider is null
     */
    explicit EmbeddingWorker(std::shared_ptr<IEmbeddingProvider> provider);
    ~EmbeddingWorker();

    EmbeddingWorker(const EmbeddingWorker&) = delete;
    EmbeddingWorker& operator=(const EmbeddingWorker&) = delete;

    /**
     * @brief Embed texts in batches and normalize every vector
     *
     * @throws EmbeddingUnavailable if the provider is not ready, fails, times
     *         out, is still busy with a timed-out call, returns the wrong
     *         count or dimension, or returns a zero vector
     * @throws OperationCancelled if the token is cancelled between batches
     */
    std::vector<std::vector<float>> embed_texts(const std::vector<std::string>& texts,
                                                const EmbedOptions& options,
                                                const CancellationToken* cancel = nullptr);

    /**
     * @brief Embed a single query text
     */
    std::vector<float> embed_query(const std::string& text, const EmbedOptions& options);

    /**
     * @brief Whether a provider call is running, including one that timed out
     */
    bool busy() const;

private:
    using Batch = std::vector<std::vector<float>>;

    Batch run_batch(std::vector<std::string> texts, std::chrono::milliseconds timeout);
    void loop();

    std::shared_ptr<IEmbeddingProvider> provider_;

    // One caller hands a batch to the thread at a time
    std::mutex call_mutex_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::shared_ptr<std::packaged_task<Batch()>> pending_;
    bool busy_ = false;
    bool stop_ = false;

    std::thread thread_;
};

} // namespace rag
} // namespace docindex

#endif // DOCINDEX_EMBEDDING_BATCHER_H
