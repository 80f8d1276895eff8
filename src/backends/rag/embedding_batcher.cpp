/**
 * @file embedding_batcher.cpp
 */

#include "embedding_batcher.h"

#include <algorithm>

#include "dix/core/dix_logger.h"
#include "rag_errors.h"
#include "vector_math.h"

#define LOG_TAG "RAG.Embedding"
#define LOGI(...) DIX_LOG_INFO(LOG_TAG, __VA_ARGS__)
#define LOGW(...) DIX_LOG_WARNING(LOG_TAG, __VA_ARGS__)
#define LOGE(...) DIX_LOG_ERROR(LOG_TAG, __VA_ARGS__)

namespace docindex {
namespace rag {

namespace {

std::vector<std::vector<float>> run_provider(const std::shared_ptr<IEmbeddingProvider>& provider,
                                             const std::vector<std::string>& texts) {
    try {
        return provider->embed_batch(texts);
    } catch (const EmbeddingUnavailable&) {
        throw;
    } catch (const std::exception& e) {
        throw EmbeddingUnavailable(std::string(provider->name()) + ": " + e.what());
    }
}

} // namespace

EmbeddingWorker::EmbeddingWorker(std::shared_ptr<IEmbeddingProvider> provider)
    : provider_(std::move(provider)) {
    if (!provider_) {
        throw ValidationError("embedding provider is required");
    }
    thread_ = std::thread([this]() { loop(); });
}

EmbeddingWorker::~EmbeddingWorker() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
        if (busy_) {
            LOGW("Waiting for the running embedding call before shutdown");
        }
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void EmbeddingWorker::loop() {
    for (;;) {
        std::shared_ptr<std::packaged_task<Batch()>> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stop_ || pending_ != nullptr; });
            if (!pending_) {
                return;
            }
            task = std::move(pending_);
        }

        // Exceptions land in the caller's future
        (*task)();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
        }
        cv_.notify_all();
    }
}

bool EmbeddingWorker::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return busy_;
}

EmbeddingWorker::Batch EmbeddingWorker::run_batch(std::vector<std::string> texts,
                                                  std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> call_lock(call_mutex_);

    // The task owns its texts and a provider reference: after a timeout it
    // outlives this call
    auto task = std::make_shared<std::packaged_task<Batch()>>(
        [provider = provider_, texts = std::move(texts)]() {
            return run_provider(provider, texts);
        });
    std::future<Batch> result = task->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            throw EmbeddingUnavailable("embedding worker is shutting down");
        }
        if (busy_) {
            throw EmbeddingUnavailable("previous embedding call timed out and is still running");
        }
        pending_ = std::move(task);
        busy_ = true;
    }
    cv_.notify_all();

    if (timeout.count() > 0 && result.wait_for(timeout) != std::future_status::ready) {
        LOGE("Embedding batch timed out after %lld ms", static_cast<long long>(timeout.count()));
        throw EmbeddingUnavailable("embedding timed out after " +
                                   std::to_string(timeout.count()) + " ms");
    }

    // The thread clears busy_ just after completing the task; wait for it so
    // the next caller is not refused
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return !busy_; });
    }
    return result.get();
}

std::vector<std::vector<float>> EmbeddingWorker::embed_texts(
    const std::vector<std::string>& texts,
    const EmbedOptions& options,
    const CancellationToken* cancel
) {
    if (!provider_->is_ready()) {
        throw EmbeddingUnavailable("embedding provider not available");
    }

    const size_t batch_size = options.batch_size > 0 ? options.batch_size : texts.size();
    Batch vectors;
    vectors.reserve(texts.size());

    for (size_t begin = 0; begin < texts.size(); begin += batch_size) {
        if (cancel != nullptr) {
            cancel->throw_if_cancelled("embedding");
        }

        size_t end = std::min(begin + batch_size, texts.size());
        std::vector<std::string> batch(texts.begin() + begin, texts.begin() + end);
        Batch embedded = run_batch(std::move(batch), options.timeout);

        if (embedded.size() != end - begin) {
            throw EmbeddingUnavailable("embedding provider returned " +
                                       std::to_string(embedded.size()) + " vectors for " +
                                       std::to_string(end - begin) + " texts");
        }
        for (auto& vec : embedded) {
            if (vec.size() != options.dimension) {
                throw EmbeddingUnavailable("embedding dimension mismatch: got " +
                                           std::to_string(vec.size()) + ", expected " +
                                           std::to_string(options.dimension));
            }
            if (!normalize_vector(vec)) {
                throw EmbeddingUnavailable("embedding provider returned a zero vector");
            }
            vectors.push_back(std::move(vec));
        }
    }

    return vectors;
}

std::vector<float> EmbeddingWorker::embed_query(const std::string& text,
                                                const EmbedOptions& options) {
    auto vectors = embed_texts({text}, options);
    return std::move(vectors.front());
}

} // namespace rag
} // namespace docindex
