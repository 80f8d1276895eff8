/**
 * @file vector_index.h
 * @brief Nearest-neighbour index abstraction over unit-length vectors
 */

#ifndef DOCINDEX_VECTOR_INDEX_H
#define DOCINDEX_VECTOR_INDEX_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "rag_types.h"

namespace docindex {
namespace rag {

struct RAGBackendConfig;

/**
 * @brief One search hit: chunk identifier and cosine similarity
 */
struct SearchHit {
    ChunkId chunk_id = 0;
    float score = 0.0f;
};

/**
 * @brief Ranking order: score descending, then chunk id ascending
 */
bool hit_ranks_before(const SearchHit& a, const SearchHit& b) noexcept;

void sort_hits(std::vector<SearchHit>& hits);

/**
 * @brief Similarity index over D-dimensional vectors
 *
 * Vectors are expected to be L2-normalised, so the inner product is the
 * cosine similarity. Implementations are not internally synchronised;
 * IndexGeneration owns the locking.
 */
class IVectorIndex {
public:
    virtual ~IVectorIndex() = default;

    virtual size_t dimension() const noexcept = 0;
    virtual size_t size() const noexcept = 0;

    /**
     * @brief Whether add() may be called on an index that already serves queries
     */
    virtual bool supports_incremental_insert() const noexcept = 0;

    virtual void reserve(size_t capacity) = 0;

    /**
     * @throws IndexBuildError on a duplicate id or a backend failure
     */
    virtual void add(ChunkId id, const float* vector) = 0;

    /**
     * @brief Up to k hits, sorted with sort_hits()
     */
    virtual std::vector<SearchHit> search(const float* query, size_t k) const = 0;

    /**
     * @throws StorageError
     */
    virtual void save(const std::string& path) const = 0;

    /**
     * @throws StorageError
     */
    virtual void load(const std::string& path) = 0;

    virtual const char* backend_name() const noexcept = 0;

    virtual nlohmann::json statistics() const = 0;
};

/**
 * @brief Creates empty indexes of one backend kind
 */
class IVectorIndexFactory {
public:
    virtual ~IVectorIndexFactory() = default;

    virtual std::unique_ptr<IVectorIndex> create(size_t dimension) const = 0;

    virtual std::string backend_name() const = 0;
};

/**
 * @brief Factory for config.index_backend ("usearch" or "flat")
 * @throws ValidationError for an unknown backend
 */
std::shared_ptr<IVectorIndexFactory> make_vector_index_factory(const RAGBackendConfig& config);

/**
 * @brief FNV-1a 64 over the identifiers in ascending order
 */
uint64_t chunk_set_checksum(std::vector<ChunkId> ids);

} // namespace rag
} // namespace docindex

#endif // DOCINDEX_VECTOR_INDEX_H
