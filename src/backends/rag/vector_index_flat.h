/**
 * @file vector_index_flat.h
 * @brief Exact inner-product index (brute force)
 */

#ifndef DOCINDEX_VECTOR_INDEX_FLAT_H
#define DOCINDEX_VECTOR_INDEX_FLAT_H

#include <unordered_set>
#include <vector>

#include "vector_index.h"

namespace docindex {
namespace rag {

/**
 * @brief Scores every stored vector against the query
 *
 * Exact results; insertion is only supported while building a new
 * generation.
 */
class FlatVectorIndex : public IVectorIndex {
public:
    explicit FlatVectorIndex(size_t dimension);

    size_t dimension() const noexcept override { return dimension_; }
    size_t size() const noexcept override { return ids_.size(); }
    bool supports_incremental_insert() const noexcept override { return false; }

    void reserve(size_t capacity) override;
    void add(ChunkId id, const float* vector) override;
    std::vector<SearchHit> search(const float* query, size_t k) const override;

    void save(const std::string& path) const override;
    void load(const std::string& path) override;

    const char* backend_name() const noexcept override { return "flat"; }
    nlohmann::json statistics() const override;

private:
    size_t dimension_;
    std::vector<ChunkId> ids_;
    std::vector<float> vectors_;     // row-major, ids_.size() x dimension_
    std::unordered_set<ChunkId> id_set_;
};

class FlatVectorIndexFactory : public IVectorIndexFactory {
public:
    std::unique_ptr<IVectorIndex> create(size_t dimension) const override;
    std::string backend_name() const override { return "flat"; }
};

} // namespace rag
} // namespace docindex

#endif // DOCINDEX_VECTOR_INDEX_FLAT_H
