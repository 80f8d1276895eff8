/**
 * @file index_generation.h
 * @brief One built vector index plus the exact chunk set it contains
 */

#ifndef DOCINDEX_INDEX_GENERATION_H
#define DOCINDEX_INDEX_GENERATION_H

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "cancellation.h"
#include "vector_index.h"

namespace docindex {
namespace rag {

using EmbeddingEntries = std::vector<std::pair<ChunkId, std::vector<float>>>;

/**
 * @brief A generation of the similarity index
 *
 * Readers hold a shared_ptr for the duration of a search, so a superseded
 * generation is freed only after its last reader returns. search() takes
 * a shared lock; append() (incremental backends only) takes an exclusive
 * lock, so a search sees the chunk set either before or after an append.
 */
class IndexGeneration {
public:
    IndexGeneration(uint64_t number, int64_t built_at, std::vector<ChunkId> chunk_ids,
                    std::unique_ptr<IVectorIndex> index);

    IndexGeneration(const IndexGeneration&) = delete;
    IndexGeneration& operator=(const IndexGeneration&) = delete;

    uint64_t number() const;
    int64_t built_at() const;
    size_t dimension() const noexcept { return dimension_; }
    const char* backend_name() const noexcept { return index_->backend_name(); }

    size_t size() const;
    size_t vector_count() const;

    /**
     * @brief Chunk ids in insertion order
     */
    std::vector<ChunkId> chunk_ids() const;

    uint64_t checksum() const;

    bool supports_append() const noexcept { return index_->supports_incremental_insert(); }

    /**
     * @throws ValidationError if the query dimension is wrong
     */
    std::vector<SearchHit> search(const std::vector<float>& query, size_t k) const;

    /**
     * @brief Insert entries in place and renumber the generation
     *
     * Entries added before a failure stay in both the chunk set and the
     * index, so the two never diverge.
     *
     * @throws IndexBuildError, IntegrityError on a dimension mismatch
     */
    void append(const EmbeddingEntries& entries, uint64_t new_number);

    /**
     * @brief Write <path> and <path>.meta.json via temporary files
     * @throws StorageError
     */
    void save(const std::string& path) const;

    /**
     * @brief Load a generation written by save()
     * @throws StorageError if either file is missing, unreadable or inconsistent
     */
    static std::shared_ptr<IndexGeneration> load(const std::string& path,
                                                 const IVectorIndexFactory& factory,
                                                 size_t dimension);

    nlohmann::json statistics() const;

private:
    mutable std::shared_mutex mutex_;
    uint64_t number_;
    int64_t built_at_;
    size_t dimension_;
    std::vector<ChunkId> chunk_ids_;
    std::unique_ptr<IVectorIndex> index_;
};

/**
 * @brief Builds candidate generations from stored embeddings
 */
class IndexBuilder {
public:
    IndexBuilder(std::shared_ptr<IVectorIndexFactory> factory, size_t dimension);

    /**
     * @brief Build a generation holding exactly the given entries, in order
     *
     * @throws OperationCancelled if the token fires; nothing is published
     * @throws IntegrityError if an embedding has the wrong dimension
     * @throws IndexBuildError on a backend failure
     */
    std::shared_ptr<IndexGeneration> build(uint64_t number, const EmbeddingEntries& entries,
                                           const CancellationToken* cancel = nullptr) const;

    const IVectorIndexFactory& factory() const noexcept { return *factory_; }
    size_t dimension() const noexcept { return dimension_; }

private:
    std::shared_ptr<IVectorIndexFactory> factory_;
    size_t dimension_;
};

/**
 * @brief Seconds since the Unix epoch
 */
int64_t unix_time_now();

} // namespace rag
} // namespace docindex

#endif // DOCINDEX_INDEX_GENERATION_H
