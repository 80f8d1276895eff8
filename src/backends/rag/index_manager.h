/**
 * @file index_manager.h
 * @brief Add/delete/rebuild/reset orchestration and generation swaps
 */

#ifndef DOCINDEX_INDEX_MANAGER_H
#define DOCINDEX_INDEX_MANAGER_H

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "cancellation.h"
#include "dix/core/dix_error.h"
#include "embedding_batcher.h"
#include "index_generation.h"
#include "inference_provider.h"
#include "metadata_store.h"
#include "rag_chunker.h"
#include "rag_config.h"

namespace docindex {
namespace rag {

enum class ManagerState {
    kEmpty,        // no chunks, no generation
    kReady,        // current generation serves queries
    kRebuilding,   // candidate under construction; current generation still serves
};

const char* to_string(ManagerState state) noexcept;

/**
 * @brief A document to ingest
 */
struct DocumentInput {
    std::string id;
    std::string text;
    std::string filename;    // defaults to id
    std::string title;       // defaults to derive_title(filename)
};

/**
 * @brief Outcome of one document in a batch add
 */
struct AddResult {
    std::string document_id;
    DocumentStatus status = DocumentStatus::kFailed;
    size_t chunk_count = 0;
    dix_result_t code = DIX_SUCCESS;
    std::string error;
};

/**
 * @brief Owns the current index generation and keeps it consistent with
 *        the metadata store
 *
 * Mutations are serialized; chunking, embedding and index builds run
 * without blocking queries, which keep searching the previous generation
 * until the new one is swapped in. An IntegrityError halts all further
 * mutations until resume_mutations() is called.
 *
 * Construction recovers from a crash: documents left pending lose their
 * chunks and become failed, and a persisted generation that does not match
 * the stored chunk set is rebuilt before the first query.
 */
class IndexManager {
public:
    /**
     * @param factory Index backend; nullptr selects config.index_backend
     * @throws ValidationError, StorageError, IntegrityError
     */
    IndexManager(const RAGBackendConfig& config,
                 std::shared_ptr<MetadataStore> store,
                 std::shared_ptr<IEmbeddingProvider> embedder,
                 std::shared_ptr<IVectorIndexFactory> factory = nullptr);
    ~IndexManager();

    IndexManager(const IndexManager&) = delete;
    IndexManager& operator=(const IndexManager&) = delete;

    /**
     * @brief Chunk, embed and index one document (all or nothing)
     *
     * Re-adding the id of a failed document replaces it.
     *
     * @throws ValidationError on an empty id or text, or an id already indexed
     * @throws EmbeddingUnavailable, IndexBuildError, OperationCancelled after
     *         recording the document as failed
     */
    AddResult add_document(const DocumentInput& input);

    /**
     * @brief Add documents one at a time; failures are isolated per document
     *
     * @throws MutationsHaltedError / IntegrityError only; every other failure
     *         is reported in the corresponding AddResult
     */
    std::vector<AddResult> add_documents(const std::vector<DocumentInput>& inputs);

    /**
     * @brief Swap in a generation without the document, then delete its metadata
     *
     * @throws NotFoundError, IndexBuildError, OperationCancelled
     */
    void delete_document(const std::string& document_id);

    /**
     * @brief Full rebuild from every stored chunk
     *
     * @throws IndexBuildError, EmbeddingUnavailable (reembed_on_rebuild),
     *         OperationCancelled; the current generation is kept on failure
     */
    void rebuild();

    /**
     * @brief Delete every document and chunk, then drop the generation
     */
    void reset();

    /**
     * @brief Cancel the mutation in flight, if any
     */
    void cancel_active();

    bool mutations_halted() const noexcept { return halted_.load(); }

    /**
     * @brief Clear the halt raised by an IntegrityError
     */
    void resume_mutations();

    /**
     * @brief The generation visible to queries; nullptr when EMPTY
     */
    std::shared_ptr<const IndexGeneration> current_generation() const;

    ManagerState state() const noexcept { return state_.load(); }

    IndexStats stats() const;

    nlohmann::json statistics() const;

    const RAGBackendConfig& config() const noexcept { return config_; }
    const std::shared_ptr<MetadataStore>& store() const noexcept { return store_; }
    EmbedOptions embed_options() const;

    /**
     * @brief Embed a query through the same worker the mutations use
     * @throws EmbeddingUnavailable
     */
    std::vector<float> embed_query(const std::string& text) const;

private:
    template <typename Fn>
    void run_mutation(const char* name, Fn&& fn);

    void recover();
    void do_add(const DocumentInput& input, const CancellationToken& cancel, AddResult& result);
    void do_delete(const std::string& document_id, const CancellationToken& cancel);
    void do_rebuild(const CancellationToken* cancel);
    void do_reset();

    std::shared_ptr<IndexGeneration> build_candidate(const EmbeddingEntries& entries,
                                                     const CancellationToken* cancel);
    void publish(const std::shared_ptr<IndexGeneration>& candidate);
    void fail_document(const std::string& document_id);
    void swap_generation(std::shared_ptr<IndexGeneration> next);
    void persist(const std::shared_ptr<IndexGeneration>& generation);
    void remove_persisted_files();
    std::shared_ptr<IndexGeneration> snapshot() const;
    void restore_state();

    RAGBackendConfig config_;
    std::shared_ptr<MetadataStore> store_;
    std::shared_ptr<IEmbeddingProvider> embedder_;
    IndexBuilder builder_;
    DocumentChunker chunker_;

    // Every provider call goes through this thread; joined on destruction
    std::unique_ptr<EmbeddingWorker> embedding_;

    // Serializes add/delete/rebuild/reset
    std::mutex mutation_mutex_;

    // Guards only the current-generation pointer
    mutable std::mutex generation_mutex_;
    std::shared_ptr<IndexGeneration> current_;

    std::mutex cancel_mutex_;
    std::unique_ptr<CancellationToken> active_cancel_;

    std::atomic<ManagerState> state_{ManagerState::kEmpty};
    std::atomic<bool> halted_{false};
    std::atomic<uint64_t> last_generation_{0};
};

} // namespace rag
} // namespace docindex

#endif // DOCINDEX_INDEX_MANAGER_H
