/**
 * @file vector_index_usearch.h
 * @brief Vector index implementation using USearch
 *
 * HNSW-based approximate nearest-neighbour search with incremental insertion.
 */

#ifndef DOCINDEX_VECTOR_INDEX_USEARCH_H
#define DOCINDEX_VECTOR_INDEX_USEARCH_H

#include <memory>
#include <string>
#include <vector>

#include "vector_index.h"

namespace docindex {
namespace rag {

/**
 * @brief USearch index configuration
 */
struct USearchIndexConfig {
    size_t connectivity = 16;            // HNSW connectivity (M)
    size_t expansion_add = 128;          // Construction search depth
    size_t expansion_search = 64;        // Query search depth
    bool exact_search = false;           // Brute-force search over the graph's vectors
};

/**
 * @brief USearch-based index over unit vectors (inner-product metric)
 *
 * Approximate unless exact_search is set: recall depends on
 * expansion_search. Scores are 1 - inner-product distance.
 */
class USearchVectorIndex : public IVectorIndex {
public:
    USearchVectorIndex(size_t dimension, const USearchIndexConfig& config);
    ~USearchVectorIndex() override;

    // Disable copy
    USearchVectorIndex(const USearchVectorIndex&) = delete;
    USearchVectorIndex& operator=(const USearchVectorIndex&) = delete;

    size_t dimension() const noexcept override;
    size_t size() const noexcept override;
    bool supports_incremental_insert() const noexcept override { return true; }

    void reserve(size_t capacity) override;
    void add(ChunkId id, const float* vector) override;
    std::vector<SearchHit> search(const float* query, size_t k) const override;

    void save(const std::string& path) const override;
    void load(const std::string& path) override;

    const char* backend_name() const noexcept override { return "usearch"; }

    /**
     * @brief Index statistics as JSON
     */
    nlohmann::json statistics() const override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

class USearchVectorIndexFactory : public IVectorIndexFactory {
public:
    explicit USearchVectorIndexFactory(const USearchIndexConfig& config) : config_(config) {}

    std::unique_ptr<IVectorIndex> create(size_t dimension) const override;
    std::string backend_name() const override { return "usearch"; }

private:
    USearchIndexConfig config_;
};

} // namespace rag
} // namespace docindex

#endif // DOCINDEX_VECTOR_INDEX_USEARCH_H
